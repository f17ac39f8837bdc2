#include "sqlite_store.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>
#include <unordered_map>

namespace replywatch {

namespace {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() ran
class WriteTransaction {
public:
    explicit WriteTransaction(sqlite3* db) : db_(db) {
        char* err = nullptr;
        if (sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            throw std::runtime_error("SqliteConversationStore: begin failed: " + msg);
        }
    }
    ~WriteTransaction() {
        if (!done_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
    WriteTransaction(const WriteTransaction&) = delete;
    WriteTransaction& operator=(const WriteTransaction&) = delete;

    void commit() {
        char* err = nullptr;
        if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            throw std::runtime_error("SqliteConversationStore: commit failed: " + msg);
        }
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_ = false;
};

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* v = sqlite3_column_text(stmt, col);
    return v ? reinterpret_cast<const char*>(v) : "";
}

void prepare(sqlite3* db, const char* sql, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteConversationStore: prepare failed: ") +
                                 sqlite3_errmsg(db));
    }
}

void step_done(sqlite3* db, StmtGuard& g) {
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("SqliteConversationStore: write failed: ") +
                                 sqlite3_errmsg(db));
    }
}

} // namespace

SqliteConversationStore::SqliteConversationStore(const std::string& path, int busy_timeout_ms)
    : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteConversationStore: failed to open database: " + err);
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);

    try {
        init_schema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteConversationStore::~SqliteConversationStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteConversationStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SqliteConversationStore: " + msg);
    }
}

void SqliteConversationStore::init_schema() {
    exec("CREATE TABLE IF NOT EXISTS conversations ("
         "  conversation_id TEXT PRIMARY KEY,"
         "  sender          TEXT NOT NULL,"
         "  started_at      INTEGER NOT NULL,"
         "  last_activity   INTEGER NOT NULL,"
         "  read            INTEGER NOT NULL DEFAULT 0,"
         "  summary         TEXT"
         ");");

    // seq keeps append order within a conversation
    exec("CREATE TABLE IF NOT EXISTS messages ("
         "  seq             INTEGER PRIMARY KEY AUTOINCREMENT,"
         "  conversation_id TEXT NOT NULL REFERENCES conversations(conversation_id)"
         "                  ON DELETE CASCADE,"
         "  source_id       INTEGER NOT NULL DEFAULT 0,"
         "  sender          TEXT NOT NULL,"
         "  text            TEXT NOT NULL,"
         "  direction       TEXT NOT NULL,"
         "  timestamp       INTEGER NOT NULL"
         ");");

    exec("CREATE INDEX IF NOT EXISTS idx_messages_conversation "
         "ON messages(conversation_id, seq);");
}

void SqliteConversationStore::log_message(const std::string& sender, const std::string& text,
                                          Direction direction,
                                          const std::string& conversation_id,
                                          int64_t source_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    WriteTransaction txn(db_);
    auto now = static_cast<sqlite3_int64>(epoch_seconds());

    {
        StmtGuard g;
        prepare(db_,
                "INSERT INTO conversations (conversation_id, sender, started_at, last_activity, read) "
                "VALUES (?, ?, ?, ?, 0) "
                "ON CONFLICT(conversation_id) DO UPDATE SET "
                "last_activity = excluded.last_activity, "
                "read = CASE WHEN ? = 'inbound' THEN 0 ELSE read END;", g);
        sqlite3_bind_text(g.stmt, 1, conversation_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 2, sender.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(g.stmt, 3, now);
        sqlite3_bind_int64(g.stmt, 4, now);
        sqlite3_bind_text(g.stmt, 5, direction_to_string(direction), -1, SQLITE_STATIC);
        step_done(db_, g);
    }

    {
        std::string from = direction == Direction::Outbound ? std::string(AGENT_SENDER) : sender;
        StmtGuard g;
        prepare(db_,
                "INSERT INTO messages (conversation_id, source_id, sender, text, direction, timestamp) "
                "VALUES (?, ?, ?, ?, ?, ?);", g);
        sqlite3_bind_text(g.stmt, 1, conversation_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(g.stmt, 2, source_id);
        sqlite3_bind_text(g.stmt, 3, from.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 4, text.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 5, direction_to_string(direction), -1, SQLITE_STATIC);
        sqlite3_bind_int64(g.stmt, 6, now);
        step_done(db_, g);
    }

    txn.commit();
}

bool SqliteConversationStore::update_summary(const std::string& conversation_id,
                                             const ConversationSummary& summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    WriteTransaction txn(db_);

    std::string encoded = summary_to_json(summary).dump();
    StmtGuard g;
    prepare(db_, "UPDATE conversations SET summary = ? WHERE conversation_id = ?;", g);
    sqlite3_bind_text(g.stmt, 1, encoded.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, conversation_id.c_str(), -1, SQLITE_TRANSIENT);
    step_done(db_, g);
    bool changed = sqlite3_changes(db_) > 0;

    txn.commit();
    return changed;
}

bool SqliteConversationStore::mark_read(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    WriteTransaction txn(db_);

    StmtGuard g;
    prepare(db_, "UPDATE conversations SET read = 1 WHERE conversation_id = ?;", g);
    sqlite3_bind_text(g.stmt, 1, conversation_id.c_str(), -1, SQLITE_TRANSIENT);
    step_done(db_, g);
    bool changed = sqlite3_changes(db_) > 0;

    txn.commit();
    return changed;
}

void SqliteConversationStore::mark_all_read() {
    std::lock_guard<std::mutex> lock(mutex_);
    WriteTransaction txn(db_);
    exec("UPDATE conversations SET read = 1;");
    txn.commit();
}

std::vector<Conversation> SqliteConversationStore::query_conversations(
    const std::string& where, const std::string& param) {
    std::vector<Conversation> result;
    std::unordered_map<std::string, size_t> index;

    {
        std::string sql = "SELECT conversation_id, sender, started_at, last_activity, read, summary "
                          "FROM conversations " + where +
                          " ORDER BY last_activity DESC, conversation_id ASC;";
        StmtGuard g;
        prepare(db_, sql.c_str(), g);
        if (!param.empty()) {
            sqlite3_bind_text(g.stmt, 1, param.c_str(), -1, SQLITE_TRANSIENT);
        }
        while (sqlite3_step(g.stmt) == SQLITE_ROW) {
            Conversation convo;
            convo.conversation_id = column_text(g.stmt, 0);
            convo.sender = column_text(g.stmt, 1);
            convo.started_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 2));
            convo.last_activity = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 3));
            convo.read = sqlite3_column_int(g.stmt, 4) != 0;
            if (sqlite3_column_type(g.stmt, 5) != SQLITE_NULL) {
                auto j = nlohmann::json::parse(column_text(g.stmt, 5), nullptr, false);
                if (j.is_object()) convo.summary = summary_from_json(j);
            }
            index[convo.conversation_id] = result.size();
            result.push_back(std::move(convo));
        }
    }
    if (result.empty()) return result;

    std::string sql = "SELECT conversation_id, source_id, sender, text, direction, timestamp "
                      "FROM messages";
    if (!param.empty()) sql += " WHERE conversation_id = ?";
    sql += " ORDER BY seq ASC;";

    StmtGuard g;
    prepare(db_, sql.c_str(), g);
    if (!param.empty()) {
        sqlite3_bind_text(g.stmt, 1, param.c_str(), -1, SQLITE_TRANSIENT);
    }
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        auto it = index.find(column_text(g.stmt, 0));
        if (it == index.end()) continue;

        Message msg;
        msg.id = sqlite3_column_int64(g.stmt, 1);
        msg.sender = column_text(g.stmt, 2);
        msg.text = column_text(g.stmt, 3);
        msg.direction = direction_from_string(column_text(g.stmt, 4));
        msg.timestamp = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 5));
        result[it->second].messages.push_back(std::move(msg));
    }
    return result;
}

std::vector<Conversation> SqliteConversationStore::get_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_conversations("", "");
}

std::vector<Conversation> SqliteConversationStore::get_unread() {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_conversations("WHERE read = 0", "");
}

uint32_t SqliteConversationStore::get_unread_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, "SELECT COUNT(*) FROM conversations WHERE read = 0;", g);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
}

std::optional<Conversation> SqliteConversationStore::get(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conversation_id.empty()) return std::nullopt;
    auto found = query_conversations("WHERE conversation_id = ?", conversation_id);
    if (found.empty()) return std::nullopt;
    return std::move(found.front());
}

void SqliteConversationStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    WriteTransaction txn(db_);
    exec("DELETE FROM messages;");
    exec("DELETE FROM conversations;");
    txn.commit();
}

} // namespace replywatch
