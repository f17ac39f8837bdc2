#pragma once
#include <optional>
#include <string>
#include <unordered_map>

namespace replywatch {

enum class ActionType {
    SendMessage,
    ReplyMessage,
    ScheduleMeeting,
    SendEmail,
    ShareProfile,
    RequestConnection
};

enum class PermissionLevel { AlwaysAuto, AutoHighMatch, AlwaysAsk, Never };

enum class PermissionDecision { AutoExecute, RequestApproval, Deny };

const char* action_to_string(ActionType action);
std::optional<ActionType> action_from_string(const std::string& s);

const char* level_to_string(PermissionLevel level);
std::optional<PermissionLevel> level_from_string(const std::string& s);

const char* decision_to_string(PermissionDecision decision);

// One user's action -> level table. Actions without an entry fall back to
// the built-in defaults.
class PermissionPolicy {
public:
    static PermissionPolicy defaults();

    void set(ActionType action, PermissionLevel level);
    PermissionLevel level_for(ActionType action) const;

    // Resolve a decision for the action at the given match tier
    PermissionDecision resolve(ActionType action, bool is_high_match) const;

private:
    std::unordered_map<int, PermissionLevel> levels_;
};

// Per-user policy tables.
class PermissionsManager {
public:
    PermissionsManager() = default;

    // Build from config: {user: {action: level}}. "*" overrides the defaults
    // for every user. Unknown action or level names are skipped with a warning.
    explicit PermissionsManager(
        const std::unordered_map<std::string,
                                 std::unordered_map<std::string, std::string>>& tables);

    void set_policy(const std::string& user_id, PermissionPolicy policy);
    const PermissionPolicy& policy_for(const std::string& user_id) const;

    PermissionDecision resolve(const std::string& user_id, ActionType action,
                               bool is_high_match) const;

    bool can_auto_execute(const std::string& user_id, ActionType action,
                          bool is_high_match) const;

private:
    PermissionPolicy fallback_ = PermissionPolicy::defaults();
    std::unordered_map<std::string, PermissionPolicy> policies_;
};

} // namespace replywatch
