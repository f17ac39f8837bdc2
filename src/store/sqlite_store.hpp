#pragma once
#include "../conversation_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace replywatch {

// Per-row store in SQLite (WAL). Each mutation runs in its own
// BEGIN IMMEDIATE transaction with a busy timeout, which serializes writers
// across processes.
class SqliteConversationStore : public ConversationStore {
public:
    explicit SqliteConversationStore(const std::string& path, int busy_timeout_ms = 5000);
    ~SqliteConversationStore() override;

    // Non-copyable
    SqliteConversationStore(const SqliteConversationStore&) = delete;
    SqliteConversationStore& operator=(const SqliteConversationStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    void log_message(const std::string& sender, const std::string& text,
                     Direction direction, const std::string& conversation_id,
                     int64_t source_id = 0) override;

    bool update_summary(const std::string& conversation_id,
                        const ConversationSummary& summary) override;

    bool mark_read(const std::string& conversation_id) override;
    void mark_all_read() override;

    std::vector<Conversation> get_all() override;
    std::vector<Conversation> get_unread() override;
    uint32_t get_unread_count() override;

    std::optional<Conversation> get(const std::string& conversation_id) override;

    void clear() override;

private:
    void init_schema();
    void exec(const char* sql);
    // Loads conversations matching the WHERE clause, with their messages
    std::vector<Conversation> query_conversations(const std::string& where,
                                                  const std::string& param);

    sqlite3* db_ = nullptr;
    std::string path_;
    std::mutex mutex_;
};

} // namespace replywatch
