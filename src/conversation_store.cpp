#include "conversation_store.hpp"
#include "config.hpp"
#include "store/json_store.hpp"
#include "store/sqlite_store.hpp"
#include <algorithm>
#include <stdexcept>

namespace replywatch {

void sort_conversations(std::vector<Conversation>& conversations) {
    std::sort(conversations.begin(), conversations.end(),
              [](const Conversation& a, const Conversation& b) {
                  if (a.last_activity != b.last_activity)
                      return a.last_activity > b.last_activity;
                  return a.conversation_id < b.conversation_id;
              });
}

std::unique_ptr<ConversationStore> create_conversation_store(const Config& config) {
    const auto& backend = config.store.backend;
    if (backend == "json") {
        return std::make_unique<JsonConversationStore>(config.store_path());
    }
    if (backend == "sqlite") {
        return std::make_unique<SqliteConversationStore>(config.store_path());
    }
    throw std::invalid_argument("Unknown store backend: " + backend);
}

} // namespace replywatch
