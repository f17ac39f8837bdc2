#pragma once
#include "../conversation_store.hpp"
#include <nlohmann/json.hpp>

namespace replywatch {

// Shared JSON <-> Conversation conversion used by both stores: the json
// backend persists whole documents, the sqlite backend stores summaries.

inline Message stored_message_from_json(const nlohmann::json& item) {
    Message msg;
    msg.id = item.value("id", int64_t{0});
    msg.sender = item.value("from", "");
    msg.text = item.value("text", "");
    msg.timestamp = item.value("timestamp", uint64_t{0});
    if (item.contains("direction") && item["direction"].is_string()) {
        msg.direction = direction_from_string(item["direction"].get<std::string>());
    } else if (msg.sender == AGENT_SENDER) {
        msg.direction = Direction::Outbound;
    }
    return msg;
}

inline nlohmann::json stored_message_to_json(const Message& msg) {
    return {
        {"id", msg.id},
        {"from", msg.sender},
        {"text", msg.text},
        {"direction", direction_to_string(msg.direction)},
        {"timestamp", msg.timestamp}
    };
}

inline Conversation conversation_from_json(const std::string& id,
                                           const nlohmann::json& item) {
    Conversation convo;
    convo.conversation_id = item.value("conversation_id", id);
    convo.sender = item.value("sender", "");
    convo.started_at = item.value("started_at", uint64_t{0});
    convo.last_activity = item.value("last_activity", uint64_t{0});
    convo.read = item.value("read", false);
    if (item.contains("messages") && item["messages"].is_array()) {
        for (const auto& m : item["messages"]) {
            if (m.is_object()) convo.messages.push_back(stored_message_from_json(m));
        }
    }
    if (item.contains("summary") && item["summary"].is_object()) {
        convo.summary = summary_from_json(item["summary"]);
    }
    return convo;
}

inline nlohmann::json conversation_to_json(const Conversation& convo) {
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& msg : convo.messages) {
        messages.push_back(stored_message_to_json(msg));
    }
    nlohmann::json item = {
        {"conversation_id", convo.conversation_id},
        {"sender", convo.sender},
        {"started_at", convo.started_at},
        {"last_activity", convo.last_activity},
        {"messages", messages},
        {"read", convo.read},
        {"summary", nullptr}
    };
    if (convo.summary) {
        item["summary"] = summary_to_json(*convo.summary);
    }
    return item;
}

} // namespace replywatch
