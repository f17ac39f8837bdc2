#include "permissions.hpp"
#include <iostream>
#include <utility>

namespace replywatch {

const char* action_to_string(ActionType action) {
    switch (action) {
        case ActionType::SendMessage: return "send_message";
        case ActionType::ReplyMessage: return "reply_message";
        case ActionType::ScheduleMeeting: return "schedule_meeting";
        case ActionType::SendEmail: return "send_email";
        case ActionType::ShareProfile: return "share_profile";
        case ActionType::RequestConnection: return "request_connection";
    }
    return "send_message";
}

std::optional<ActionType> action_from_string(const std::string& s) {
    if (s == "send_message") return ActionType::SendMessage;
    if (s == "reply_message") return ActionType::ReplyMessage;
    if (s == "schedule_meeting") return ActionType::ScheduleMeeting;
    if (s == "send_email") return ActionType::SendEmail;
    if (s == "share_profile") return ActionType::ShareProfile;
    if (s == "request_connection") return ActionType::RequestConnection;
    return std::nullopt;
}

const char* level_to_string(PermissionLevel level) {
    switch (level) {
        case PermissionLevel::AlwaysAuto: return "always_auto";
        case PermissionLevel::AutoHighMatch: return "auto_high_match";
        case PermissionLevel::AlwaysAsk: return "always_ask";
        case PermissionLevel::Never: return "never";
    }
    return "always_ask";
}

std::optional<PermissionLevel> level_from_string(const std::string& s) {
    if (s == "always_auto") return PermissionLevel::AlwaysAuto;
    if (s == "auto_high_match") return PermissionLevel::AutoHighMatch;
    if (s == "always_ask") return PermissionLevel::AlwaysAsk;
    if (s == "never") return PermissionLevel::Never;
    return std::nullopt;
}

const char* decision_to_string(PermissionDecision decision) {
    switch (decision) {
        case PermissionDecision::AutoExecute: return "auto_execute";
        case PermissionDecision::RequestApproval: return "request_approval";
        case PermissionDecision::Deny: return "deny";
    }
    return "deny";
}

// ── PermissionPolicy ─────────────────────────────────────────────

static PermissionLevel default_level(ActionType action) {
    switch (action) {
        case ActionType::SendMessage: return PermissionLevel::AutoHighMatch;
        case ActionType::ReplyMessage: return PermissionLevel::AlwaysAuto;
        case ActionType::ScheduleMeeting: return PermissionLevel::AlwaysAsk;
        case ActionType::SendEmail: return PermissionLevel::AutoHighMatch;
        case ActionType::ShareProfile: return PermissionLevel::AlwaysAuto;
        case ActionType::RequestConnection: return PermissionLevel::AutoHighMatch;
    }
    return PermissionLevel::AlwaysAsk;
}

PermissionPolicy PermissionPolicy::defaults() {
    return PermissionPolicy{};
}

void PermissionPolicy::set(ActionType action, PermissionLevel level) {
    levels_[static_cast<int>(action)] = level;
}

PermissionLevel PermissionPolicy::level_for(ActionType action) const {
    auto it = levels_.find(static_cast<int>(action));
    if (it != levels_.end()) return it->second;
    return default_level(action);
}

PermissionDecision PermissionPolicy::resolve(ActionType action, bool is_high_match) const {
    switch (level_for(action)) {
        case PermissionLevel::AlwaysAuto:
            return PermissionDecision::AutoExecute;
        case PermissionLevel::AutoHighMatch:
            return is_high_match ? PermissionDecision::AutoExecute
                                 : PermissionDecision::RequestApproval;
        case PermissionLevel::AlwaysAsk:
            return PermissionDecision::RequestApproval;
        case PermissionLevel::Never:
            return PermissionDecision::Deny;
    }
    return PermissionDecision::Deny;
}

// ── PermissionsManager ───────────────────────────────────────────

static PermissionPolicy policy_from_table(const PermissionPolicy& base,
                                          const std::string& user,
                                          const std::unordered_map<std::string, std::string>& table) {
    PermissionPolicy policy = base;
    for (const auto& [action_name, level_name] : table) {
        auto action = action_from_string(action_name);
        auto level = level_from_string(level_name);
        if (!action || !level) {
            std::cerr << "[permissions] Skipping " << user << "." << action_name
                      << " = " << level_name << " (unknown action or level)\n";
            continue;
        }
        policy.set(*action, *level);
    }
    return policy;
}

PermissionsManager::PermissionsManager(
    const std::unordered_map<std::string,
                             std::unordered_map<std::string, std::string>>& tables) {
    auto wildcard = tables.find("*");
    if (wildcard != tables.end()) {
        fallback_ = policy_from_table(fallback_, "*", wildcard->second);
    }
    for (const auto& [user, table] : tables) {
        if (user == "*") continue;
        policies_[user] = policy_from_table(fallback_, user, table);
    }
}

void PermissionsManager::set_policy(const std::string& user_id, PermissionPolicy policy) {
    policies_[user_id] = std::move(policy);
}

const PermissionPolicy& PermissionsManager::policy_for(const std::string& user_id) const {
    auto it = policies_.find(user_id);
    if (it != policies_.end()) return it->second;
    return fallback_;
}

PermissionDecision PermissionsManager::resolve(const std::string& user_id, ActionType action,
                                               bool is_high_match) const {
    return policy_for(user_id).resolve(action, is_high_match);
}

bool PermissionsManager::can_auto_execute(const std::string& user_id, ActionType action,
                                          bool is_high_match) const {
    return resolve(user_id, action, is_high_match) == PermissionDecision::AutoExecute;
}

} // namespace replywatch
