#include <catch2/catch.hpp>
#include "generation.hpp"
#include "mock_http_client.hpp"
#include <nlohmann/json.hpp>

using namespace replywatch;

struct AgentFixture {
    MockHttpClient http;
    AgentApiClient client{http, "http://agent:5000", "alice"};
};

// ── generate_reply ───────────────────────────────────────────────

TEST_CASE("AgentApiClient: reply request shape", "[generation]") {
    AgentFixture f;
    f.http.next_response = {200, R"({"response": "Sure, 5pm works", "should_notify_user": false})", {}};

    auto reply = f.client.generate_reply("+15550100", "Free at 5?", "imsg_alice_15550100");
    REQUIRE(reply.ok());
    REQUIRE(reply.value().text == "Sure, 5pm works");
    REQUIRE_FALSE(reply.value().should_notify_user);

    REQUIRE(f.http.last_url == "http://agent:5000/users/alice/messages/incoming");
    REQUIRE(f.http.last_timeout == 30);
    auto body = nlohmann::json::parse(f.http.last_body);
    REQUIRE(body["user_id"] == "alice");
    REQUIRE(body["sender_id"] == "+15550100");
    REQUIRE(body["message"] == "Free at 5?");
    REQUIRE(body["conversation_id"] == "imsg_alice_15550100");
}

TEST_CASE("AgentApiClient: notify flag is read", "[generation]") {
    AgentFixture f;
    f.http.next_response = {200, R"({"response": "Want to take over?", "should_notify_user": true})", {}};
    auto reply = f.client.generate_reply("a", "b", "c");
    REQUIRE(reply.value().should_notify_user);
}

TEST_CASE("AgentApiClient: missing response field gives empty text", "[generation]") {
    AgentFixture f;
    f.http.next_response = {200, R"({"status": "queued"})", {}};
    auto reply = f.client.generate_reply("a", "b", "c");
    REQUIRE(reply.ok());
    REQUIRE(reply.value().text.empty());
}

TEST_CASE("AgentApiClient: transport failure is transient", "[generation]") {
    AgentFixture f;
    f.http.next_response = {0, "", "Timeout was reached"};
    auto reply = f.client.generate_reply("a", "b", "c");
    REQUIRE_FALSE(reply.ok());
    REQUIRE(reply.kind() == ErrorKind::TransientExternal);
}

TEST_CASE("AgentApiClient: server error is transient", "[generation]") {
    AgentFixture f;
    f.http.next_response = {503, "busy", {}};
    REQUIRE(f.client.generate_reply("a", "b", "c").kind() == ErrorKind::TransientExternal);
}

TEST_CASE("AgentApiClient: non-JSON body is malformed", "[generation]") {
    AgentFixture f;
    f.http.next_response = {200, "<html>oops</html>", {}};
    REQUIRE(f.client.generate_reply("a", "b", "c").kind() == ErrorKind::MalformedResponse);
}

// ── complete ─────────────────────────────────────────────────────

TEST_CASE("AgentApiClient: task completion", "[generation]") {
    AgentFixture f;
    f.http.next_response = {200, R"({"output": "done"})", {}};

    auto out = f.client.complete("Summarize this");
    REQUIRE(out.ok());
    REQUIRE(out.value() == "done");
    REQUIRE(f.http.last_url == "http://agent:5000/users/alice/task");
    auto body = nlohmann::json::parse(f.http.last_body);
    REQUIRE(body["user_id"] == "alice");
    REQUIRE(body["task"] == "Summarize this");
}

TEST_CASE("AgentApiClient: task without output is malformed", "[generation]") {
    AgentFixture f;
    f.http.next_response = {200, R"({"result": "done"})", {}};
    REQUIRE(f.client.complete("x").kind() == ErrorKind::MalformedResponse);
}

TEST_CASE("AgentApiClient: unknown user route is NotFound", "[generation]") {
    AgentFixture f;
    f.http.next_response = {404, "", {}};
    REQUIRE(f.client.complete("x").kind() == ErrorKind::NotFound);
}

// ── health_check ─────────────────────────────────────────────────

TEST_CASE("AgentApiClient: health check", "[generation]") {
    AgentFixture f;
    REQUIRE(f.client.health_check(5));
    REQUIRE(f.http.last_url == "http://agent:5000/health");
    f.http.get_response = {500, "", {}};
    REQUIRE_FALSE(f.client.health_check(5));
}
