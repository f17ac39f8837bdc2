#include "watcher.hpp"
#include "util.hpp"
#include <chrono>
#include <exception>
#include <iostream>
#include <thread>

namespace replywatch {

Watcher::Watcher(const Config& config, MessageSource& source, GenerationService& generator,
                 OutboundDispatcher& dispatcher, ConversationStore& store,
                 const DecisionGate& gate, WatcherContext& context)
    : config_(config), source_(source), generator_(generator), dispatcher_(dispatcher),
      store_(store), gate_(gate), context_(context) {}

Result<bool> Watcher::startup() {
    auto opened = source_.open();
    if (!opened) {
        std::cerr << "[watcher] " << source_.source_name() << " unavailable: "
                  << opened.error().message << "\n";
        return Error{ErrorKind::FatalPrecondition, opened.error().message};
    }

    long timeout = config_.services.health_timeout;
    bool agent_up = generator_.health_check(timeout);
    bool relay_up = dispatcher_.health_check(timeout);
    std::cerr << "[watcher] Agent API (" << config_.services.agent_url << "): "
              << (agent_up ? "UP" : "DOWN") << "\n";
    std::cerr << "[watcher] Relay (" << config_.services.relay_url << "): "
              << (relay_up ? "UP" : "DOWN") << "\n";
    if (!agent_up) {
        return Error{ErrorKind::FatalPrecondition,
                     "agent API is not running at " + config_.services.agent_url};
    }
    if (!relay_up) {
        return Error{ErrorKind::FatalPrecondition,
                     "relay is not running at " + config_.services.relay_url};
    }

    if (seed_watermark()) {
        std::cerr << "[watcher] Starting from message " << context_.watermark.value()
                  << ", only new messages will be answered\n";
    }
    std::cerr << "[watcher] Polling every " << config_.watcher.poll_interval
              << "s as user " << config_.user_id << "\n";
    return true;
}

bool Watcher::seed_watermark() {
    auto max = source_.max_id();
    if (!max) {
        std::cerr << "[watcher] Cannot read latest message id yet: "
                  << max.error().message << "\n";
        return false;
    }
    context_.watermark.advance(max.value());
    seeded_ = true;
    return true;
}

CycleStats Watcher::run_once() {
    CycleStats stats;

    // Messages that arrived before the first successful seed are skipped
    if (!seeded_) {
        if (!seed_watermark()) stats.poll_failed = true;
        return stats;
    }

    auto polled = source_.poll(context_.watermark.value());
    if (!polled) {
        std::cerr << "[watcher] Poll failed, retrying in "
                  << config_.watcher.poll_interval << "s: "
                  << polled.error().message << "\n";
        stats.poll_failed = true;
        return stats;
    }

    stats.polled = static_cast<uint32_t>(polled.value().size());
    for (const auto& msg : polled.value()) {
        if (context_.watermark.covers(msg.id)) continue;
        process_message(msg, stats);
        // Advance regardless of outcome: a failed message is not retried
        context_.watermark.advance(msg.id);
    }
    return stats;
}

bool Watcher::store_message(const std::string& sender, const std::string& text,
                            Direction direction, const std::string& conversation_id,
                            int64_t source_id) {
    try {
        store_.log_message(sender, text, direction, conversation_id, source_id);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[store] Failed to record " << direction_to_string(direction)
                  << " message for " << conversation_id << ": " << e.what() << "\n";
        return false;
    }
}

void Watcher::process_message(const Message& msg, CycleStats& stats) {
    if (context_.dedup.contains(msg.text)) {
        ++stats.echoes_skipped;
        return;
    }
    ++stats.processed;

    std::cerr << "[watcher] New message from " << msg.sender << ": "
              << truncate_for_log(msg.text) << "\n";

    std::string conversation_id = context_.registry.get_or_create(msg.sender);
    if (!store_message(msg.sender, msg.text, Direction::Inbound, conversation_id, msg.id)) {
        ++stats.failures;
    }

    DetectionEvent event(msg.sender, msg.text);
    const Decision& decision = gate_.evaluate_reply(event);
    if (decision.outcome == DetectionState::PendingApproval) {
        std::cerr << "[watcher] Reply to " << msg.sender
                  << " needs approval, leaving conversation unread\n";
        ++stats.deferred;
        return;
    }
    if (decision.outcome == DetectionState::Skipped) {
        std::cerr << "[watcher] Replies to " << msg.sender << " are not permitted\n";
        ++stats.deferred;
        return;
    }

    auto reply = generator_.generate_reply(msg.sender, msg.text, conversation_id);
    if (!reply) {
        std::cerr << "[watcher] No reply generated for " << msg.sender << ": "
                  << reply.error().message << "\n";
        ++stats.failures;
        return;
    }
    if (reply.value().text.empty()) {
        std::cerr << "[watcher] No response from agent for message from "
                  << msg.sender << "\n";
        ++stats.failures;
        return;
    }
    if (reply.value().should_notify_user) {
        std::cerr << "[watcher] Agent suggests user should take over conversation with "
                  << msg.sender << "\n";
    }

    std::cerr << "[watcher] Sending reply: " << truncate_for_log(reply.value().text) << "\n";
    auto sent = dispatcher_.send(msg.sender, reply.value().text);
    if (!sent.success) {
        std::cerr << "[watcher] Failed to send reply to " << msg.sender;
        if (sent.error) std::cerr << ": " << sent.error->message;
        std::cerr << "\n";
        ++stats.failures;
        return;
    }
    ++stats.replies_sent;
    std::cerr << "[watcher] Reply sent successfully to " << msg.sender << "\n";

    if (!store_message(msg.sender, reply.value().text, Direction::Outbound,
                       conversation_id, 0)) {
        ++stats.failures;
    }
}

void Watcher::run(const std::atomic<bool>& shutdown) {
    using namespace std::chrono;
    const auto interval = seconds(config_.watcher.poll_interval);
    const auto slice = milliseconds(100);

    std::cerr << "[watcher] Waiting for incoming messages...\n";
    while (!shutdown.load()) {
        try {
            run_once();
        } catch (const std::exception& e) {
            std::cerr << "[watcher] Unexpected error in poll loop: " << e.what() << "\n";
        }

        auto wake = steady_clock::now() + interval;
        while (!shutdown.load() && steady_clock::now() < wake) {
            std::this_thread::sleep_for(slice);
        }
    }
    std::cerr << "[watcher] Watcher stopped.\n";
}

} // namespace replywatch
