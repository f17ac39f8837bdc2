#include "decision_gate.hpp"
#include <iostream>
#include <utility>

namespace replywatch {

const char* detection_state_to_string(DetectionState state) {
    switch (state) {
        case DetectionState::Detected: return "detected";
        case DetectionState::Scored: return "scored";
        case DetectionState::AutoDispatch: return "auto_dispatch";
        case DetectionState::PendingApproval: return "pending_approval";
        case DetectionState::Skipped: return "skipped";
    }
    return "detected";
}

DetectionEvent::DetectionEvent(std::string other_id, std::string context)
    : other_id_(std::move(other_id)), context_(std::move(context)) {}

bool DetectionEvent::is_terminal() const {
    auto s = decision_.outcome;
    return s == DetectionState::AutoDispatch ||
           s == DetectionState::PendingApproval ||
           s == DetectionState::Skipped;
}

DecisionGate::DecisionGate(const MatchingEngine& matching,
                           const PermissionsManager& permissions,
                           const ProfileDirectory& profiles,
                           std::string user_id)
    : matching_(matching), permissions_(permissions), profiles_(profiles),
      user_id_(std::move(user_id)) {
    auto own = profiles_.find(user_id_);
    if (own) {
        user_profile_ = own.value();
    } else {
        user_profile_.user_id = user_id_;
        std::cerr << "[gate] No profile for " << user_id_
                  << ", match scores will be 0\n";
    }
}

void DecisionGate::score_and_resolve(DetectionEvent& event, const Profile& other,
                                     ActionType action) const {
    auto& d = event.decision_;
    d.score = matching_.calculate_match_score(user_profile_, other);
    d.high_match = matching_.is_high_match(d.score);
    d.reason = matching_.get_match_reason(user_profile_, other, d.score);
    d.outcome = DetectionState::Scored;

    d.permission = permissions_.resolve(user_id_, action, d.high_match);
    switch (d.permission) {
        case PermissionDecision::AutoExecute:
            d.outcome = DetectionState::AutoDispatch;
            break;
        case PermissionDecision::RequestApproval:
            d.outcome = DetectionState::PendingApproval;
            break;
        case PermissionDecision::Deny:
            d.outcome = DetectionState::Skipped;
            break;
    }
}

const Decision& DecisionGate::evaluate_detection(DetectionEvent& event) const {
    if (event.is_terminal()) return event.decision_;

    auto other = profiles_.find(event.other_id());
    if (!other) {
        event.decision_.outcome = DetectionState::Skipped;
        event.decision_.reason = "No profile found";
        return event.decision_;
    }
    event.decision_.other = other.value();
    score_and_resolve(event, other.value(), ActionType::SendMessage);
    return event.decision_;
}

const Decision& DecisionGate::evaluate_reply(DetectionEvent& event) const {
    if (event.is_terminal()) return event.decision_;

    Profile other;
    auto found = profiles_.find_by_contact(event.other_id());
    if (found) {
        other = found.value();
        event.decision_.other = other;
    }
    score_and_resolve(event, other, ActionType::ReplyMessage);
    return event.decision_;
}

} // namespace replywatch
