#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace replywatch {

// Accepted range for watcher.poll_interval, in seconds
constexpr uint32_t MIN_POLL_INTERVAL = 1;
constexpr uint32_t MAX_POLL_INTERVAL = 3600;

struct WatcherConfig {
    uint32_t poll_interval = 3;          // seconds between poll cycles
    std::string messages_db = "~/Library/Messages/chat.db";
    long query_timeout = 15;             // seconds per source query
    size_t fingerprint_length = 100;     // dedup prefix length in bytes
};

struct ServiceConfig {
    std::string agent_url = "http://127.0.0.1:5000";
    std::string relay_url = "http://127.0.0.1:5001";
    long generation_timeout = 30;
    long dispatch_timeout = 15;
    long health_timeout = 5;
};

struct StoreConfig {
    std::string backend = "sqlite";
    std::string path;  // empty = backend default under ~/.replywatch
};

struct DecisionConfig {
    double high_match_threshold = 0.75;
    std::string profiles_path;  // empty = ~/.replywatch/profiles.json
    // action name -> level name, per user id; "*" applies to every user
    std::unordered_map<std::string, std::unordered_map<std::string, std::string>> permissions;
};

struct Config {
    std::string user_id = "default_user";

    WatcherConfig watcher;
    ServiceConfig services;
    StoreConfig store;
    DecisionConfig decision;

    // Load from ~/.replywatch/config.json + env vars
    static Config load();

    // Load from an explicit file path + env vars. A missing file is created
    // with defaults; a malformed file is ignored.
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply environment variable overrides
    void apply_env();

    // Resolved store path for the configured backend
    std::string store_path() const;

    // Resolved profile directory path
    std::string profiles_path() const;
};

} // namespace replywatch
