#include "registry.hpp"
#include <utility>

namespace replywatch {

ConversationRegistry::ConversationRegistry(std::string user_id)
    : user_id_(std::move(user_id)) {}

std::string ConversationRegistry::normalize_sender(const std::string& sender) {
    std::string clean;
    clean.reserve(sender.size());
    for (char c : sender) {
        if (c == '+' || c == ' ' || c == '-') continue;
        clean += c;
    }
    return clean;
}

std::string ConversationRegistry::conversation_id_for(const std::string& user_id,
                                                      const std::string& sender) {
    return "imsg_" + user_id + "_" + normalize_sender(sender);
}

std::string ConversationRegistry::get_or_create(const std::string& sender) {
    auto it = conversations_.find(sender);
    if (it != conversations_.end()) return it->second;

    auto id = conversation_id_for(user_id_, sender);
    conversations_.emplace(sender, id);
    return id;
}

bool ConversationRegistry::contains(const std::string& sender) const {
    return conversations_.count(sender) > 0;
}

} // namespace replywatch
