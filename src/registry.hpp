#pragma once
#include <string>
#include <unordered_map>

namespace replywatch {

// Maps a sender handle to its conversation id. The id is derived from the
// handle alone, so the map can be rebuilt from scratch on every start.
class ConversationRegistry {
public:
    explicit ConversationRegistry(std::string user_id);

    std::string get_or_create(const std::string& sender);

    bool contains(const std::string& sender) const;
    size_t size() const { return conversations_.size(); }
    const std::string& user_id() const { return user_id_; }

    // Strip formatting characters ('+', ' ', '-') from a handle
    static std::string normalize_sender(const std::string& sender);

    // imsg_<user>_<normalized sender>
    static std::string conversation_id_for(const std::string& user_id,
                                           const std::string& sender);

private:
    std::string user_id_;
    std::unordered_map<std::string, std::string> conversations_;
};

} // namespace replywatch
