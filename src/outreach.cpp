#include "outreach.hpp"
#include "util.hpp"
#include <cmath>
#include <exception>
#include <iostream>

namespace replywatch {

const char* outreach_action_to_string(OutreachAction action) {
    switch (action) {
        case OutreachAction::Skip: return "skip";
        case OutreachAction::RequestPermission: return "request_permission";
        case OutreachAction::SentMessage: return "sent_imessage";
        case OutreachAction::NoContactMethod: return "no_contact_method";
    }
    return "skip";
}

nlohmann::json outreach_result_to_json(const OutreachResult& result) {
    nlohmann::json j = {
        {"action", outreach_action_to_string(result.action)},
        {"recipient", result.recipient},
        {"match_score", result.score},
        {"reason", result.reason},
        {"context", result.context}
    };
    if (result.action == OutreachAction::SentMessage) {
        j["message"] = result.message;
        j["success"] = result.success;
    }
    if (result.other) j["other_user"] = profile_to_json(*result.other);
    if (result.error) j["error"] = result.error->message;
    return j;
}

static std::string display_name(const Profile& p) {
    return p.name.empty() ? p.user_id : p.name;
}

Outreach::Outreach(const DecisionGate& gate, GenerationService& generator,
                   OutboundDispatcher& dispatcher, ConversationStore& store,
                   ConversationRegistry& registry)
    : gate_(gate), generator_(generator), dispatcher_(dispatcher), store_(store),
      registry_(registry) {}

std::string Outreach::build_intro_task(const Profile& user, const Profile& other,
                                       const Decision& decision,
                                       const std::string& context) {
    long percent = std::lround(decision.score * 100.0);
    std::string where = context.empty() ? std::string("the same event") : context;

    std::string task;
    task += "You're reaching out to " + display_name(other) + " on behalf of " +
            display_name(user) + ".\n\n";
    task += "Context:\n";
    task += "- You're both at: " + where + "\n";
    task += "- Match reason: " + decision.reason + "\n";
    task += "- Match score: " + std::to_string(percent) + "%\n\n";
    task += display_name(other) + "'s profile:\n";
    task += profile_to_json(other).dump(2) + "\n\n";
    task += "Craft a brief, friendly iMessage introduction (2-3 sentences max). "
            "Be authentic and mention the specific connection point.";
    return task;
}

OutreachResult Outreach::handle_detection(DetectionEvent& event) {
    const Decision& decision = gate_.evaluate_detection(event);

    OutreachResult result;
    result.score = decision.score;
    result.reason = decision.reason;
    result.context = event.context();
    result.other = decision.other;
    result.recipient = decision.other ? display_name(*decision.other) : event.other_id();

    if (decision.outcome == DetectionState::Skipped) {
        result.action = OutreachAction::Skip;
        return result;
    }
    if (decision.outcome != DetectionState::AutoDispatch) {
        result.action = OutreachAction::RequestPermission;
        return result;
    }

    const Profile& other = *decision.other;
    if (trim(other.phone).empty()) {
        std::cerr << "[outreach] No phone for " << result.recipient
                  << ", cannot send introduction\n";
        result.action = OutreachAction::NoContactMethod;
        return result;
    }

    result.action = OutreachAction::SentMessage;
    auto drafted = generator_.complete(
        build_intro_task(gate_.user_profile(), other, decision, event.context()));
    if (!drafted) {
        std::cerr << "[outreach] Could not draft introduction for " << result.recipient
                  << ": " << drafted.error().message << "\n";
        result.error = drafted.error();
        return result;
    }
    result.message = trim(drafted.value());
    if (result.message.empty()) {
        result.error = Error{ErrorKind::MalformedResponse, "empty introduction"};
        return result;
    }

    auto sent = dispatcher_.send(other.phone, result.message);
    result.success = sent.success;
    if (!sent.success) {
        result.error = sent.error;
        return result;
    }

    std::cerr << "[outreach] Introduction sent to " << result.recipient << " ("
              << std::lround(result.score * 100.0) << "% match)\n";
    record_intro(other, result.message);
    return result;
}

void Outreach::record_intro(const Profile& other, const std::string& text) {
    std::string conversation_id = registry_.get_or_create(other.phone);
    try {
        store_.log_message(other.phone, text, Direction::Outbound, conversation_id, 0);
    } catch (const std::exception& e) {
        std::cerr << "[store] Failed to record introduction for " << conversation_id
                  << ": " << e.what() << "\n";
    }
}

} // namespace replywatch
