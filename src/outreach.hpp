#pragma once
#include "conversation_store.hpp"
#include "decision_gate.hpp"
#include "dispatcher.hpp"
#include "generation.hpp"
#include "registry.hpp"
#include "result.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace replywatch {

enum class OutreachAction { Skip, RequestPermission, SentMessage, NoContactMethod };

const char* outreach_action_to_string(OutreachAction action);

struct OutreachResult {
    OutreachAction action = OutreachAction::Skip;
    std::string recipient;         // display name of the other party
    std::string message;           // drafted introduction, when one was written
    bool success = false;          // relay accepted the introduction
    double score = 0.0;
    std::string reason;
    std::string context;
    std::optional<Profile> other;
    std::optional<Error> error;
};

nlohmann::json outreach_result_to_json(const OutreachResult& result);

// Acts on a detected person: evaluates the send_message policy and, when it
// allows, drafts an introduction through the generation service and sends it
// to the other profile's phone. Anything short of AutoDispatch comes back as
// a permission request (or a skip) for the user to handle.
class Outreach {
public:
    Outreach(const DecisionGate& gate, GenerationService& generator,
             OutboundDispatcher& dispatcher, ConversationStore& store,
             ConversationRegistry& registry);

    OutreachResult handle_detection(DetectionEvent& event);

    // Task text sent to the generation service for the introduction
    static std::string build_intro_task(const Profile& user, const Profile& other,
                                        const Decision& decision,
                                        const std::string& context);

private:
    void record_intro(const Profile& other, const std::string& text);

    const DecisionGate& gate_;
    GenerationService& generator_;
    OutboundDispatcher& dispatcher_;
    ConversationStore& store_;
    ConversationRegistry& registry_;
};

} // namespace replywatch
