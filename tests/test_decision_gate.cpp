#include <catch2/catch.hpp>
#include "decision_gate.hpp"
#include <string>
#include <unordered_map>

using namespace replywatch;

using Tables = std::unordered_map<std::string, std::unordered_map<std::string, std::string>>;

static Profile person(const std::string& id, std::vector<std::string> interests,
                      std::vector<std::string> skills, const std::string& industry,
                      const std::string& phone = "") {
    Profile p;
    p.user_id = id;
    p.interests = std::move(interests);
    p.skills = std::move(skills);
    p.industry = industry;
    p.phone = phone;
    return p;
}

// Local user "me" plus one strong and one weak match
struct GateFixture {
    JsonProfileDirectory profiles{std::vector<Profile>{
        person("me", {"ai", "music"}, {"python"}, "tech"),
        person("close", {"ai", "music"}, {"python"}, "tech", "+1 555 0001"),
        person("far", {"knitting"}, {}, "farming", "+1 555 0002")
    }};
    MatchingEngine matching{0.65};
    PermissionsManager permissions;
};

// ── evaluate_detection ───────────────────────────────────────────

TEST_CASE("DecisionGate: high match auto-dispatches send_message", "[decision_gate]") {
    GateFixture f;
    DecisionGate gate(f.matching, f.permissions, f.profiles, "me");

    DetectionEvent event("close");
    REQUIRE(event.state() == DetectionState::Detected);
    const auto& d = gate.evaluate_detection(event);
    REQUIRE(d.outcome == DetectionState::AutoDispatch);
    REQUIRE(d.permission == PermissionDecision::AutoExecute);
    REQUIRE(d.high_match);
    REQUIRE(d.score >= 0.65);
    REQUIRE(d.other.has_value());
    REQUIRE_FALSE(d.reason.empty());
    REQUIRE(event.is_terminal());
}

TEST_CASE("DecisionGate: low match needs approval", "[decision_gate]") {
    GateFixture f;
    DecisionGate gate(f.matching, f.permissions, f.profiles, "me");

    DetectionEvent event("far");
    const auto& d = gate.evaluate_detection(event);
    REQUIRE(d.outcome == DetectionState::PendingApproval);
    REQUIRE_FALSE(d.high_match);
    REQUIRE(d.reason == "0% match (no significant overlap)");
}

TEST_CASE("DecisionGate: unknown profile is skipped", "[decision_gate]") {
    GateFixture f;
    DecisionGate gate(f.matching, f.permissions, f.profiles, "me");

    DetectionEvent event("stranger");
    const auto& d = gate.evaluate_detection(event);
    REQUIRE(d.outcome == DetectionState::Skipped);
    REQUIRE(d.reason == "No profile found");
    REQUIRE(event.is_terminal());
}

TEST_CASE("DecisionGate: never policy denies", "[decision_gate]") {
    GateFixture f;
    Tables tables{{"me", {{"send_message", "never"}}}};
    PermissionsManager strict(tables);
    DecisionGate gate(f.matching, strict, f.profiles, "me");

    DetectionEvent event("close");
    REQUIRE(gate.evaluate_detection(event).outcome == DetectionState::Skipped);
    REQUIRE(event.decision().permission == PermissionDecision::Deny);
}

TEST_CASE("DecisionGate: terminal event is not re-evaluated", "[decision_gate]") {
    GateFixture f;
    DecisionGate gate(f.matching, f.permissions, f.profiles, "me");

    DetectionEvent event("far");
    gate.evaluate_detection(event);
    REQUIRE(event.state() == DetectionState::PendingApproval);

    // Even a permissive gate leaves the outcome alone
    Tables tables{{"me", {{"send_message", "always_auto"}}}};
    PermissionsManager lenient(tables);
    DecisionGate other(f.matching, lenient, f.profiles, "me");
    REQUIRE(other.evaluate_detection(event).outcome == DetectionState::PendingApproval);
    REQUIRE(other.evaluate_reply(event).outcome == DetectionState::PendingApproval);
}

// ── evaluate_reply ───────────────────────────────────────────────

TEST_CASE("DecisionGate: reply to unknown sender uses reply policy only", "[decision_gate]") {
    GateFixture f;
    DecisionGate gate(f.matching, f.permissions, f.profiles, "me");

    DetectionEvent event("+1 999 1234", "hello");
    const auto& d = gate.evaluate_reply(event);
    REQUIRE(d.outcome == DetectionState::AutoDispatch);
    REQUIRE(d.score == 0.0);
    REQUIRE_FALSE(d.other.has_value());
    REQUIRE(event.context() == "hello");
}

TEST_CASE("DecisionGate: reply sender resolved by contact", "[decision_gate]") {
    GateFixture f;
    DecisionGate gate(f.matching, f.permissions, f.profiles, "me");

    DetectionEvent event("+15550001");
    const auto& d = gate.evaluate_reply(event);
    REQUIRE(d.other.has_value());
    REQUIRE(d.other->user_id == "close");
    REQUIRE(d.high_match);
}

TEST_CASE("DecisionGate: reply_message always_ask defers", "[decision_gate]") {
    GateFixture f;
    Tables tables{{"me", {{"reply_message", "always_ask"}}}};
    PermissionsManager ask(tables);
    DecisionGate gate(f.matching, ask, f.profiles, "me");

    DetectionEvent event("+15550001");
    REQUIRE(gate.evaluate_reply(event).outcome == DetectionState::PendingApproval);
}

TEST_CASE("DecisionGate: missing own profile scores zero", "[decision_gate]") {
    GateFixture f;
    DecisionGate gate(f.matching, f.permissions, f.profiles, "someone-else");
    REQUIRE(gate.user_profile().user_id == "someone-else");

    DetectionEvent event("close");
    const auto& d = gate.evaluate_detection(event);
    REQUIRE(d.score == 0.0);
    REQUIRE(d.outcome == DetectionState::PendingApproval);
}

TEST_CASE("detection_state_to_string: names", "[decision_gate]") {
    REQUIRE(std::string(detection_state_to_string(DetectionState::PendingApproval)) ==
            "pending_approval");
    REQUIRE(std::string(detection_state_to_string(DetectionState::AutoDispatch)) ==
            "auto_dispatch");
}
