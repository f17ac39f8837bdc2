#include "config.hpp"
#include "conversation_store.hpp"
#include "decision_gate.hpp"
#include "dispatcher.hpp"
#include "generation.hpp"
#include "http.hpp"
#include "matching.hpp"
#include "outreach.hpp"
#include "permissions.hpp"
#include "profile.hpp"
#include "sources/chat_db_source.hpp"
#include "util.hpp"
#include "watcher.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: replywatch [options]\n"
              << "\n"
              << "Watches the Messages database for new inbound messages and answers\n"
              << "them through the agent API and the outbound relay.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help             Show this help\n"
              << "  --detect <user_id>     Handle one detection of a nearby person, print the\n"
              << "                         outcome as JSON and exit\n"
              << "  --event <name>         Where the detection happened (with --detect)\n"
              << "\n"
              << "Configuration is read from ~/.replywatch/config.json.\n"
              << "\n"
              << "Environment variables:\n"
              << "  USER_ID                Local user id (default: default_user)\n"
              << "  POLL_INTERVAL          Seconds between polls (default: 3)\n"
              << "  MESSAGES_DB            Path to chat.db\n"
              << "  AGENT_API_URL          Agent API base URL\n"
              << "  RELAY_URL              Outbound relay base URL\n"
              << "  STORE_BACKEND          Conversation store: sqlite or json\n"
              << "  STORE_PATH             Conversation store file\n"
              << "  HIGH_MATCH_THRESHOLD   Match score needed for auto actions (0-1)\n"
              << "  PROFILES_PATH          Profile directory JSON file\n";
}

int main(int argc, char* argv[]) try {
    std::string detect_id;
    std::string event_name;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--detect") == 0 && i + 1 < argc) {
            detect_id = argv[++i];
        } else if (std::strcmp(argv[i], "--event") == 0 && i + 1 < argc) {
            event_name = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }
    if (!event_name.empty() && detect_id.empty()) {
        std::cerr << "--event requires --detect\n";
        return 1;
    }

    replywatch::http_init();
    auto config = replywatch::Config::load();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    replywatch::CurlHttpClient http_client;
    replywatch::WatcherContext context(config.user_id, config.watcher.fingerprint_length);

    replywatch::ChatDbSource source(replywatch::expand_home(config.watcher.messages_db),
                                    config.watcher.query_timeout);
    replywatch::AgentApiClient generator(http_client, config.services.agent_url,
                                         config.user_id,
                                         config.services.generation_timeout);
    replywatch::OutboundDispatcher dispatcher(http_client, config.services.relay_url,
                                              context.dedup,
                                              config.services.dispatch_timeout);

    std::unique_ptr<replywatch::ConversationStore> store;
    try {
        store = replywatch::create_conversation_store(config);
    } catch (const std::exception& e) {
        std::cerr << "Error opening conversation store: " << e.what() << "\n";
        replywatch::http_cleanup();
        return 1;
    }
    std::cerr << "[store] Using " << store->backend_name() << " store at "
              << config.store_path() << "\n";

    replywatch::JsonProfileDirectory profiles(config.profiles_path());
    replywatch::MatchingEngine matching(config.decision.high_match_threshold);
    replywatch::PermissionsManager permissions(config.decision.permissions);
    replywatch::DecisionGate gate(matching, permissions, profiles, config.user_id);

    if (!detect_id.empty()) {
        replywatch::Outreach outreach(gate, generator, dispatcher, *store, context.registry);
        replywatch::DetectionEvent event(detect_id, event_name);
        auto result = outreach.handle_detection(event);
        std::cout << replywatch::outreach_result_to_json(result).dump(2) << "\n";
        replywatch::http_cleanup();
        return result.error ? 1 : 0;
    }

    replywatch::Watcher watcher(config, source, generator, dispatcher, *store, gate, context);

    std::cerr << "[watcher] Messages database: " << source.path() << "\n";
    auto started = watcher.startup();
    if (!started) {
        std::cerr << "Error: " << started.error().message << "\n";
        replywatch::http_cleanup();
        return 1;
    }

    watcher.run(g_shutdown);

    replywatch::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
