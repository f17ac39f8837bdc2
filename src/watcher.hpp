#pragma once
#include "config.hpp"
#include "conversation_store.hpp"
#include "decision_gate.hpp"
#include "dedup.hpp"
#include "dispatcher.hpp"
#include "generation.hpp"
#include "registry.hpp"
#include "result.hpp"
#include "source.hpp"
#include <atomic>
#include <cstdint>
#include <string>

namespace replywatch {

// Highest source id already handled. Only ever moves forward.
class Watermark {
public:
    explicit Watermark(int64_t initial = 0) : value_(initial) {}

    int64_t value() const { return value_; }

    // Move to id if it is ahead of the current value. Returns false otherwise.
    bool advance(int64_t id) {
        if (id <= value_) return false;
        value_ = id;
        return true;
    }

    // id has already been handled
    bool covers(int64_t id) const { return id <= value_; }

private:
    int64_t value_;
};

// Mutable watcher state shared between the loop and the dispatcher
struct WatcherContext {
    ConversationRegistry registry;
    DedupSet dedup;
    Watermark watermark;

    explicit WatcherContext(const std::string& user_id,
                            size_t fingerprint_length = DedupSet::DEFAULT_PREFIX_LENGTH)
        : registry(user_id), dedup(fingerprint_length) {}
};

struct CycleStats {
    uint32_t polled = 0;          // rows returned by the source
    uint32_t processed = 0;       // rows that were not echoes
    uint32_t echoes_skipped = 0;
    uint32_t replies_sent = 0;
    uint32_t failures = 0;        // generation, dispatch or store failures
    uint32_t deferred = 0;        // pending approval or denied by policy
    bool poll_failed = false;
};

// Poll -> dedup -> registry -> gate -> generate -> dispatch -> store,
// one message at a time in ascending id order.
class Watcher {
public:
    Watcher(const Config& config, MessageSource& source, GenerationService& generator,
            OutboundDispatcher& dispatcher, ConversationStore& store,
            const DecisionGate& gate, WatcherContext& context);

    // Check the source and both services, then seed the watermark with the
    // current maximum id. FatalPrecondition when the source is unusable or a
    // service is down. A locked source only postpones seeding to the first
    // cycle.
    Result<bool> startup();

    // One poll cycle
    CycleStats run_once();

    // Cycle until shutdown is set; the flag is also checked while sleeping
    void run(const std::atomic<bool>& shutdown);

    bool seeded() const { return seeded_; }
    const WatcherContext& context() const { return context_; }

private:
    void process_message(const Message& msg, CycleStats& stats);
    bool seed_watermark();
    bool store_message(const std::string& sender, const std::string& text,
                       Direction direction, const std::string& conversation_id,
                       int64_t source_id);

    const Config& config_;
    MessageSource& source_;
    GenerationService& generator_;
    OutboundDispatcher& dispatcher_;
    ConversationStore& store_;
    const DecisionGate& gate_;
    WatcherContext& context_;
    bool seeded_ = false;
};

} // namespace replywatch
