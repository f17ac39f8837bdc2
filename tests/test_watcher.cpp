#include <catch2/catch.hpp>
#include "watcher.hpp"
#include "store/json_store.hpp"
#include "mock_generation.hpp"
#include "mock_http_client.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <thread>
#include <unistd.h>

using namespace replywatch;

using Tables = std::unordered_map<std::string, std::unordered_map<std::string, std::string>>;

// In-memory message log
class FakeSource : public MessageSource {
public:
    std::vector<Message> log;
    bool open_ok = true;
    bool locked = false;
    bool ignore_watermark = false;
    std::atomic<int> poll_count{0};
    int64_t last_watermark = -1;

    std::string source_name() const override { return "fake"; }

    Result<bool> open() override {
        if (!open_ok) return Error{ErrorKind::FatalPrecondition, "no such file"};
        return true;
    }

    Result<int64_t> max_id() override {
        if (locked) return Error{ErrorKind::TransientExternal, "database is locked"};
        int64_t max = 0;
        for (const auto& m : log) max = std::max(max, m.id);
        return max;
    }

    Result<std::vector<Message>> poll(int64_t watermark) override {
        poll_count++;
        last_watermark = watermark;
        if (locked) return Error{ErrorKind::TransientExternal, "database is locked"};
        std::vector<Message> out;
        for (const auto& m : log) {
            if (ignore_watermark || m.id > watermark) out.push_back(m);
        }
        return out;
    }

    void add(int64_t id, const std::string& sender, const std::string& text) {
        Message m;
        m.id = id;
        m.sender = sender;
        m.text = text;
        m.timestamp = 1700000000;
        log.push_back(m);
    }
};

// Store whose writes can be switched to throw
class FlakyStore : public JsonConversationStore {
public:
    using JsonConversationStore::JsonConversationStore;
    bool fail_writes = false;

    void log_message(const std::string& sender, const std::string& text,
                     Direction direction, const std::string& conversation_id,
                     int64_t source_id = 0) override {
        if (fail_writes) throw std::runtime_error("disk full");
        JsonConversationStore::log_message(sender, text, direction, conversation_id,
                                           source_id);
    }
};

static const char* RELAY_OK = R"({"success": true})";

struct WatcherFixture {
    std::string store_path = "/tmp/replywatch_test_watcher_" + std::to_string(getpid()) +
                             ".json";
    Config config;
    FakeSource source;
    MockGenerationService generator;
    MockHttpClient relay_http;
    WatcherContext context{"alice"};
    OutboundDispatcher dispatcher{relay_http, "http://relay:5001", context.dedup};
    std::unique_ptr<FlakyStore> store;
    JsonProfileDirectory profiles{std::vector<Profile>{}};
    MatchingEngine matching{0.75};
    PermissionsManager permissions;
    std::unique_ptr<DecisionGate> gate;
    std::unique_ptr<Watcher> watcher;

    explicit WatcherFixture(const Tables& tables = {}) : permissions(tables) {
        cleanup();
        config.user_id = "alice";
        config.services.agent_url = "http://agent:5000";
        config.services.relay_url = "http://relay:5001";
        relay_http.next_response = {200, RELAY_OK, {}};
        store = std::make_unique<FlakyStore>(store_path);
        gate = std::make_unique<DecisionGate>(matching, permissions, profiles, "alice");
        watcher = std::make_unique<Watcher>(config, source, generator, dispatcher, *store,
                                            *gate, context);
    }

    ~WatcherFixture() {
        watcher.reset();
        store.reset();
        cleanup();
    }

    void cleanup() {
        std::filesystem::remove(store_path);
        std::filesystem::remove(store_path + ".tmp");
        std::filesystem::remove(store_path + ".lock");
    }

    std::string conversation_for(const std::string& sender) const {
        return ConversationRegistry::conversation_id_for("alice", sender);
    }
};

// ── startup ──────────────────────────────────────────────────────

TEST_CASE("Watcher: startup seeds watermark from latest message", "[watcher]") {
    WatcherFixture f;
    f.source.add(99, "A", "old");
    f.source.add(100, "B", "history");

    auto started = f.watcher->startup();
    REQUIRE(started.ok());
    REQUIRE(f.watcher->seeded());
    REQUIRE(f.context.watermark.value() == 100);

    // History is never answered
    auto stats = f.watcher->run_once();
    REQUIRE(stats.polled == 0);
    REQUIRE(f.generator.reply_count == 0);
}

TEST_CASE("Watcher: startup fails when the source cannot be opened", "[watcher]") {
    WatcherFixture f;
    f.source.open_ok = false;
    auto started = f.watcher->startup();
    REQUIRE_FALSE(started.ok());
    REQUIRE(started.kind() == ErrorKind::FatalPrecondition);
}

TEST_CASE("Watcher: startup fails when the agent API is down", "[watcher]") {
    WatcherFixture f;
    f.generator.healthy = false;
    auto started = f.watcher->startup();
    REQUIRE_FALSE(started.ok());
    REQUIRE(started.kind() == ErrorKind::FatalPrecondition);
    REQUIRE(started.error().message.find("http://agent:5000") != std::string::npos);
}

TEST_CASE("Watcher: startup fails when the relay is down", "[watcher]") {
    WatcherFixture f;
    f.relay_http.get_response = {0, "", "Connection refused"};
    auto started = f.watcher->startup();
    REQUIRE_FALSE(started.ok());
    REQUIRE(started.kind() == ErrorKind::FatalPrecondition);
}

TEST_CASE("Watcher: locked log at startup defers seeding to the first cycle", "[watcher]") {
    WatcherFixture f;
    f.source.add(50, "A", "before start");
    f.source.locked = true;

    REQUIRE(f.watcher->startup().ok());
    REQUIRE_FALSE(f.watcher->seeded());

    auto blocked = f.watcher->run_once();
    REQUIRE(blocked.poll_failed);
    REQUIRE_FALSE(f.watcher->seeded());

    f.source.locked = false;
    auto seeding = f.watcher->run_once();
    REQUIRE_FALSE(seeding.poll_failed);
    REQUIRE(f.watcher->seeded());
    REQUIRE(f.context.watermark.value() == 50);
    REQUIRE(f.generator.reply_count == 0);
}

// ── run_once ─────────────────────────────────────────────────────

TEST_CASE("Watcher: new message is answered and both sides are stored", "[watcher]") {
    WatcherFixture f;
    f.context.watermark.advance(100);
    REQUIRE(f.watcher->startup().ok());
    f.source.add(101, "A", "hello");

    auto stats = f.watcher->run_once();
    REQUIRE(stats.polled == 1);
    REQUIRE(stats.processed == 1);
    REQUIRE(stats.replies_sent == 1);
    REQUIRE(stats.failures == 0);
    REQUIRE(f.context.watermark.value() == 101);

    std::string cid = f.conversation_for("A");
    REQUIRE(f.generator.last_sender == "A");
    REQUIRE(f.generator.last_text == "hello");
    REQUIRE(f.generator.last_conversation_id == cid);
    REQUIRE(f.relay_http.last_url == "http://relay:5001/send");

    auto convo = f.store->get(cid);
    REQUIRE(convo.has_value());
    REQUIRE(convo->messages.size() == 2);
    REQUIRE(convo->messages[0].direction == Direction::Inbound);
    REQUIRE(convo->messages[0].id == 101);
    REQUIRE(convo->messages[1].direction == Direction::Outbound);
    REQUIRE(convo->messages[1].text == "Thanks, talk soon");
    REQUIRE(convo->messages[1].id == 0);

    // The reply is fingerprinted so its echo is ignored
    REQUIRE(f.context.dedup.contains("Thanks, talk soon"));
}

TEST_CASE("Watcher: echo of our own reply is skipped but consumed", "[watcher]") {
    WatcherFixture f;
    REQUIRE(f.watcher->startup().ok());
    f.context.dedup.record("Thanks, talk soon");
    f.source.add(1, "A", "Thanks, talk soon");

    auto stats = f.watcher->run_once();
    REQUIRE(stats.echoes_skipped == 1);
    REQUIRE(stats.processed == 0);
    REQUIRE(f.generator.reply_count == 0);
    REQUIRE(f.context.watermark.value() == 1);
    REQUIRE(f.store->get_all().empty());
}

TEST_CASE("Watcher: each message is processed once across cycles", "[watcher]") {
    WatcherFixture f;
    REQUIRE(f.watcher->startup().ok());
    f.source.add(1, "A", "one");
    f.source.add(2, "B", "two");

    REQUIRE(f.watcher->run_once().processed == 2);
    REQUIRE(f.source.last_watermark == 0);
    REQUIRE(f.watcher->run_once().processed == 0);
    REQUIRE(f.source.last_watermark == 2);
    REQUIRE(f.generator.reply_count == 2);

    f.source.add(3, "A", "three");
    REQUIRE(f.watcher->run_once().processed == 1);
    REQUIRE(f.context.watermark.value() == 3);
    REQUIRE(f.store->get(f.conversation_for("A"))->messages.size() == 4);
}

TEST_CASE("Watcher: generation failure still advances the watermark", "[watcher]") {
    WatcherFixture f;
    REQUIRE(f.watcher->startup().ok());
    f.generator.next_reply = Error{ErrorKind::TransientExternal, "agent API unreachable"};
    f.source.add(1, "A", "first");
    f.source.add(2, "B", "second");

    auto stats = f.watcher->run_once();
    REQUIRE(stats.processed == 2);
    REQUIRE(stats.failures == 2);
    REQUIRE(stats.replies_sent == 0);
    REQUIRE(f.relay_http.call_count == 0);
    REQUIRE(f.context.watermark.value() == 2);

    // Inbound side is still recorded
    auto convo = f.store->get(f.conversation_for("A"));
    REQUIRE(convo->messages.size() == 1);
    REQUIRE_FALSE(convo->read);
}

TEST_CASE("Watcher: empty reply counts as a failure", "[watcher]") {
    WatcherFixture f;
    REQUIRE(f.watcher->startup().ok());
    f.generator.next_reply = GeneratedReply{"", true};
    f.source.add(1, "A", "anyone there?");

    auto stats = f.watcher->run_once();
    REQUIRE(stats.failures == 1);
    REQUIRE(f.relay_http.call_count == 0);
}

TEST_CASE("Watcher: dispatch failure isolates the message", "[watcher]") {
    WatcherFixture f;
    REQUIRE(f.watcher->startup().ok());
    f.relay_http.response_queue = {
        {500, "boom", {}},
        {200, RELAY_OK, {}}
    };
    f.source.add(1, "A", "first");
    f.source.add(2, "B", "second");

    auto stats = f.watcher->run_once();
    REQUIRE(stats.failures == 1);
    REQUIRE(stats.replies_sent == 1);
    REQUIRE(f.context.watermark.value() == 2);
    REQUIRE(f.store->get(f.conversation_for("A"))->messages.size() == 1);
    REQUIRE(f.store->get(f.conversation_for("B"))->messages.size() == 2);
}

TEST_CASE("Watcher: reply needing approval is not generated", "[watcher]") {
    WatcherFixture f(Tables{{"alice", {{"reply_message", "always_ask"}}}});
    REQUIRE(f.watcher->startup().ok());
    f.source.add(1, "A", "can we meet?");

    auto stats = f.watcher->run_once();
    REQUIRE(stats.deferred == 1);
    REQUIRE(stats.replies_sent == 0);
    REQUIRE(f.generator.reply_count == 0);
    REQUIRE(f.context.watermark.value() == 1);
    REQUIRE(f.store->get_unread_count() == 1);
}

TEST_CASE("Watcher: replies denied by policy are deferred", "[watcher]") {
    WatcherFixture f(Tables{{"alice", {{"reply_message", "never"}}}});
    REQUIRE(f.watcher->startup().ok());
    f.source.add(1, "A", "hi");

    auto stats = f.watcher->run_once();
    REQUIRE(stats.deferred == 1);
    REQUIRE(f.generator.reply_count == 0);
}

TEST_CASE("Watcher: poll failure leaves state unchanged", "[watcher]") {
    WatcherFixture f;
    REQUIRE(f.watcher->startup().ok());
    f.source.add(1, "A", "waiting");
    f.source.locked = true;

    auto stats = f.watcher->run_once();
    REQUIRE(stats.poll_failed);
    REQUIRE(stats.processed == 0);
    REQUIRE(f.context.watermark.value() == 0);

    f.source.locked = false;
    REQUIRE(f.watcher->run_once().processed == 1);
}

TEST_CASE("Watcher: store failure does not stop the reply", "[watcher]") {
    WatcherFixture f;
    REQUIRE(f.watcher->startup().ok());
    f.store->fail_writes = true;
    f.source.add(1, "A", "hello");

    auto stats = f.watcher->run_once();
    REQUIRE(stats.replies_sent == 1);
    REQUIRE(stats.failures == 2);
    REQUIRE(f.context.watermark.value() == 1);
}

TEST_CASE("Watcher: rows at or below the watermark are ignored", "[watcher]") {
    WatcherFixture f;
    REQUIRE(f.watcher->startup().ok());
    f.source.add(5, "A", "five");
    f.watcher->run_once();

    // A source that ignores the watermark must not cause reprocessing
    f.source.ignore_watermark = true;
    f.context.watermark.advance(10);
    f.source.add(7, "B", "late arrival");
    auto stats = f.watcher->run_once();
    REQUIRE(stats.polled == 2);
    REQUIRE(stats.processed == 0);
    REQUIRE(f.generator.reply_count == 1);
    REQUIRE(f.context.watermark.value() == 10);
}

// ── run ──────────────────────────────────────────────────────────

TEST_CASE("Watcher: run stops promptly when shutdown is set", "[watcher]") {
    WatcherFixture f;
    f.config.watcher.poll_interval = 5;
    REQUIRE(f.watcher->startup().ok());
    f.source.add(1, "A", "hello");

    std::atomic<bool> shutdown{false};
    std::thread stopper([&] {
        while (f.source.poll_count.load() < 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        shutdown.store(true);
    });

    auto start = std::chrono::steady_clock::now();
    f.watcher->run(shutdown);
    auto elapsed = std::chrono::steady_clock::now() - start;
    stopper.join();

    // Woken out of the 5 s sleep, not after it
    REQUIRE(elapsed < std::chrono::seconds(2));
    REQUIRE(f.source.poll_count.load() >= 1);
    REQUIRE(f.generator.reply_count == 1);
    REQUIRE(f.context.watermark.value() == 1);
}

TEST_CASE("Watcher: run returns at once when shutdown is already set", "[watcher]") {
    WatcherFixture f;
    REQUIRE(f.watcher->startup().ok());
    std::atomic<bool> shutdown{true};
    f.watcher->run(shutdown);
    REQUIRE(f.source.poll_count.load() == 0);
}

// ── Watermark ────────────────────────────────────────────────────

TEST_CASE("Watermark: only moves forward", "[watcher]") {
    Watermark w;
    REQUIRE(w.value() == 0);
    REQUIRE(w.advance(5));
    REQUIRE_FALSE(w.advance(5));
    REQUIRE_FALSE(w.advance(3));
    REQUIRE(w.value() == 5);
    REQUIRE(w.covers(4));
    REQUIRE(w.covers(5));
    REQUIRE_FALSE(w.covers(6));
}
