#include "config.hpp"
#include "util.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace replywatch {

nlohmann::json Config::defaults_json() {
    return {
        {"user_id", "default_user"},
        {"watcher", {
            {"poll_interval", 3},
            {"messages_db", "~/Library/Messages/chat.db"},
            {"query_timeout", 15},
            {"fingerprint_length", 100}
        }},
        {"services", {
            {"agent_url", "http://127.0.0.1:5000"},
            {"relay_url", "http://127.0.0.1:5001"},
            {"generation_timeout", 30},
            {"dispatch_timeout", 15},
            {"health_timeout", 5}
        }},
        {"store", {
            {"backend", "sqlite"},
            {"path", ""}
        }},
        {"decision", {
            {"high_match_threshold", 0.75},
            {"profiles_path", ""},
            {"permissions", nlohmann::json::object()}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::load() {
    return load_from(expand_home("~/.replywatch/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    Config cfg;
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    if (j.contains("user_id") && j["user_id"].is_string())
        cfg.user_id = j["user_id"].get<std::string>();

    if (j.contains("watcher") && j["watcher"].is_object()) {
        auto& w = j["watcher"];
        if (w.contains("poll_interval") && w["poll_interval"].is_number_unsigned()) {
            auto interval = w["poll_interval"].get<uint64_t>();
            if (interval >= MIN_POLL_INTERVAL && interval <= MAX_POLL_INTERVAL)
                cfg.watcher.poll_interval = static_cast<uint32_t>(interval);
            else
                std::cerr << "[config] Ignoring out of range watcher.poll_interval="
                          << interval << "\n";
        }
        if (w.contains("messages_db") && w["messages_db"].is_string())
            cfg.watcher.messages_db = w["messages_db"].get<std::string>();
        if (w.contains("query_timeout") && w["query_timeout"].is_number_unsigned())
            cfg.watcher.query_timeout = w["query_timeout"].get<long>();
        if (w.contains("fingerprint_length") && w["fingerprint_length"].is_number_unsigned())
            cfg.watcher.fingerprint_length = w["fingerprint_length"].get<size_t>();
    }

    if (j.contains("services") && j["services"].is_object()) {
        auto& s = j["services"];
        if (s.contains("agent_url") && s["agent_url"].is_string())
            cfg.services.agent_url = s["agent_url"].get<std::string>();
        if (s.contains("relay_url") && s["relay_url"].is_string())
            cfg.services.relay_url = s["relay_url"].get<std::string>();
        if (s.contains("generation_timeout") && s["generation_timeout"].is_number_unsigned())
            cfg.services.generation_timeout = s["generation_timeout"].get<long>();
        if (s.contains("dispatch_timeout") && s["dispatch_timeout"].is_number_unsigned())
            cfg.services.dispatch_timeout = s["dispatch_timeout"].get<long>();
        if (s.contains("health_timeout") && s["health_timeout"].is_number_unsigned())
            cfg.services.health_timeout = s["health_timeout"].get<long>();
    }

    if (j.contains("store") && j["store"].is_object()) {
        auto& st = j["store"];
        if (st.contains("backend") && st["backend"].is_string())
            cfg.store.backend = st["backend"].get<std::string>();
        if (st.contains("path") && st["path"].is_string())
            cfg.store.path = st["path"].get<std::string>();
    }

    if (j.contains("decision") && j["decision"].is_object()) {
        auto& d = j["decision"];
        if (d.contains("high_match_threshold") && d["high_match_threshold"].is_number()) {
            double threshold = d["high_match_threshold"].get<double>();
            if (threshold >= 0.0 && threshold <= 1.0)
                cfg.decision.high_match_threshold = threshold;
            else
                std::cerr << "[config] Ignoring out of range decision.high_match_threshold="
                          << threshold << "\n";
        }
        if (d.contains("profiles_path") && d["profiles_path"].is_string())
            cfg.decision.profiles_path = d["profiles_path"].get<std::string>();
        // Per-user permission tables: {"<user>": {"<action>": "<level>"}}
        if (d.contains("permissions") && d["permissions"].is_object()) {
            for (auto& [user, table] : d["permissions"].items()) {
                if (!table.is_object()) continue;
                for (auto& [action, level] : table.items()) {
                    if (level.is_string())
                        cfg.decision.permissions[user][action] = level.get<std::string>();
                }
            }
        }
    }

    cfg.apply_env();
    return cfg;
}

// Accepts only values inside [min_value, max_value]; integer targets also
// reject fractions. Anything else keeps the current value.
template <typename T>
static void env_number(const char* name, T& target, double min_value, double max_value) {
    const char* v = std::getenv(name);
    if (!v) return;
    try {
        size_t used = 0;
        double parsed = std::stod(v, &used);
        if (used != std::string(v).size()) {
            throw std::invalid_argument(v);
        }
        if (!(parsed >= min_value && parsed <= max_value)) {
            throw std::out_of_range(v);
        }
        if (std::is_integral<T>::value && std::floor(parsed) != parsed) {
            throw std::invalid_argument(v);
        }
        target = static_cast<T>(parsed);
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring invalid " << name << "=" << v
                  << " (expected " << min_value << " to " << max_value << ")\n";
    }
}

void Config::apply_env() {
    if (const char* v = std::getenv("USER_ID"))
        user_id = v;
    env_number("POLL_INTERVAL", watcher.poll_interval, MIN_POLL_INTERVAL, MAX_POLL_INTERVAL);
    if (const char* v = std::getenv("MESSAGES_DB"))
        watcher.messages_db = v;
    if (const char* v = std::getenv("AGENT_API_URL"))
        services.agent_url = v;
    if (const char* v = std::getenv("RELAY_URL"))
        services.relay_url = v;
    if (const char* v = std::getenv("STORE_BACKEND"))
        store.backend = v;
    if (const char* v = std::getenv("STORE_PATH"))
        store.path = v;
    env_number("HIGH_MATCH_THRESHOLD", decision.high_match_threshold, 0.0, 1.0);
    if (const char* v = std::getenv("PROFILES_PATH"))
        decision.profiles_path = v;
}

std::string Config::store_path() const {
    if (!store.path.empty()) return expand_home(store.path);
    if (store.backend == "json") return expand_home("~/.replywatch/conversations.json");
    return expand_home("~/.replywatch/conversations.db");
}

std::string Config::profiles_path() const {
    if (!decision.profiles_path.empty()) return expand_home(decision.profiles_path);
    return expand_home("~/.replywatch/profiles.json");
}

} // namespace replywatch
