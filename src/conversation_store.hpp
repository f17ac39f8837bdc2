#pragma once
#include "message.hpp"
#include "summary.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace replywatch {

struct Config; // forward declaration

// A thread of messages with one sender. Message::sender is "agent" for
// replies we sent.
struct Conversation {
    std::string conversation_id;
    std::string sender;
    uint64_t started_at = 0;     // Unix epoch seconds
    uint64_t last_activity = 0;
    std::vector<Message> messages;
    bool read = false;
    std::optional<ConversationSummary> summary;
};

// Sender label stored for outbound messages
constexpr const char* AGENT_SENDER = "agent";

// Abstract conversation store. Every call is one serialized critical section;
// implementations are safe to share between threads and processes.
class ConversationStore {
public:
    virtual ~ConversationStore() = default;

    virtual std::string backend_name() const = 0;

    // Append a message, creating the conversation on first use.
    // An inbound append resets read to false; outbound leaves it alone.
    virtual void log_message(const std::string& sender, const std::string& text,
                             Direction direction, const std::string& conversation_id,
                             int64_t source_id = 0) = 0;

    // Overwrite the cached summary. False (no-op) when the id is absent.
    virtual bool update_summary(const std::string& conversation_id,
                                const ConversationSummary& summary) = 0;

    // Set read = true. False (no-op) when the id is absent.
    virtual bool mark_read(const std::string& conversation_id) = 0;

    virtual void mark_all_read() = 0;

    // Ordered by last_activity descending, ties by conversation id
    virtual std::vector<Conversation> get_all() = 0;
    virtual std::vector<Conversation> get_unread() = 0;
    virtual uint32_t get_unread_count() = 0;

    virtual std::optional<Conversation> get(const std::string& conversation_id) = 0;

    // Remove every conversation
    virtual void clear() = 0;
};

// Listing order shared by the backends
void sort_conversations(std::vector<Conversation>& conversations);

// Build the backend named by config.store.backend ("json" or "sqlite").
// Throws std::invalid_argument for an unknown backend and std::runtime_error
// when the backend cannot open its storage.
std::unique_ptr<ConversationStore> create_conversation_store(const Config& config);

} // namespace replywatch
