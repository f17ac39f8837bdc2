#pragma once
#include "matching.hpp"
#include "permissions.hpp"
#include "profile.hpp"
#include <optional>
#include <string>

namespace replywatch {

// Detected -> Scored -> {AutoDispatch | PendingApproval | Skipped}
enum class DetectionState { Detected, Scored, AutoDispatch, PendingApproval, Skipped };

const char* detection_state_to_string(DetectionState state);

struct Decision {
    DetectionState outcome = DetectionState::Detected;
    PermissionDecision permission = PermissionDecision::Deny;
    double score = 0.0;
    bool high_match = false;
    std::string reason;
    std::optional<Profile> other;  // profile of the other party, when known
};

// One detection of another person (or one inbound message awaiting a reply).
// Evaluated at most once: a terminal event keeps its outcome.
class DetectionEvent {
public:
    explicit DetectionEvent(std::string other_id, std::string context = {});

    const std::string& other_id() const { return other_id_; }
    const std::string& context() const { return context_; }
    DetectionState state() const { return decision_.outcome; }
    bool is_terminal() const;
    const Decision& decision() const { return decision_; }

private:
    friend class DecisionGate;

    std::string other_id_;
    std::string context_;
    Decision decision_;
};

// Autonomy gate: scores the other party against the local user and resolves
// the user's permission policy for the action.
class DecisionGate {
public:
    DecisionGate(const MatchingEngine& matching,
                 const PermissionsManager& permissions,
                 const ProfileDirectory& profiles,
                 std::string user_id);

    // Proximity detection: other_id is a user id. Unknown profiles are
    // Skipped; otherwise the send_message policy decides.
    const Decision& evaluate_detection(DetectionEvent& event) const;

    // Inbound message: other_id is the sender handle. Unknown senders score
    // 0 and the reply_message policy alone decides.
    const Decision& evaluate_reply(DetectionEvent& event) const;

    const Profile& user_profile() const { return user_profile_; }
    const std::string& user_id() const { return user_id_; }

private:
    void score_and_resolve(DetectionEvent& event, const Profile& other,
                           ActionType action) const;

    const MatchingEngine& matching_;
    const PermissionsManager& permissions_;
    const ProfileDirectory& profiles_;
    std::string user_id_;
    Profile user_profile_;
};

} // namespace replywatch
