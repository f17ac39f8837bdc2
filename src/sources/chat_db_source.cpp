#include "chat_db_source.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <chrono>
#include <filesystem>
#include <unistd.h>

namespace replywatch {

namespace {

using Clock = std::chrono::steady_clock;

// Dates above this are nanoseconds; newer chat.db versions switched units.
constexpr int64_t NANOSECOND_DATE_THRESHOLD = 100000000000LL;

// Read-only connection with a query deadline enforced by the progress handler.
struct ReadOnlyDb {
    sqlite3* db = nullptr;
    Clock::time_point deadline;

    ReadOnlyDb() = default;
    ~ReadOnlyDb() { if (db) sqlite3_close(db); }
    ReadOnlyDb(const ReadOnlyDb&) = delete;
    ReadOnlyDb& operator=(const ReadOnlyDb&) = delete;
};

struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

int deadline_handler(void* ctx) {
    auto* conn = static_cast<ReadOnlyDb*>(ctx);
    return Clock::now() > conn->deadline ? 1 : 0;
}

Error classify(sqlite3* db, int rc, const std::string& what) {
    int primary = rc & 0xff;
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
        return {ErrorKind::TransientExternal, "database is locked"};
    }
    if (primary == SQLITE_INTERRUPT) {
        return {ErrorKind::TransientExternal, what + ": query timed out"};
    }
    std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    return {ErrorKind::TransientExternal, what + ": " + msg};
}

int connect(ReadOnlyDb& conn, const std::string& path, long timeout_seconds) {
    int rc = sqlite3_open_v2(path.c_str(), &conn.db, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) return rc;
    conn.deadline = Clock::now() + std::chrono::seconds(timeout_seconds);
    sqlite3_progress_handler(conn.db, 1000, deadline_handler, &conn);
    return SQLITE_OK;
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) {
        return reinterpret_cast<const char*>(v);
    }
    return {};
}

} // namespace

ChatDbSource::ChatDbSource(const std::string& path, long query_timeout_seconds)
    : path_(path), query_timeout_(query_timeout_seconds) {}

uint64_t ChatDbSource::normalize_timestamp(int64_t raw) {
    int64_t seconds = raw > NANOSECOND_DATE_THRESHOLD ? raw / 1000000000LL : raw;
    int64_t unix_time = seconds + APPLE_EPOCH_OFFSET;
    return unix_time > 0 ? static_cast<uint64_t>(unix_time) : 0;
}

Result<bool> ChatDbSource::open() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return Error{ErrorKind::FatalPrecondition,
                     "messages database not found at " + path_};
    }
    if (::access(path_.c_str(), R_OK) != 0) {
        return Error{ErrorKind::FatalPrecondition,
                     "cannot read messages database " + path_ + " (check file access)"};
    }

    ReadOnlyDb conn;
    int rc = connect(conn, path_, query_timeout_);
    if (rc != SQLITE_OK) {
        return Error{ErrorKind::FatalPrecondition,
                     "cannot open " + path_ + ": " + sqlite3_errstr(rc)};
    }

    StmtGuard g;
    rc = sqlite3_prepare_v2(conn.db, "SELECT ROWID FROM message LIMIT 1;", -1, &g.stmt, nullptr);
    if (rc != SQLITE_OK) {
        Error err = classify(conn.db, rc, "schema check");
        // A locked log is still usable; anything else means it is not a message log
        int primary = rc & 0xff;
        if (primary != SQLITE_BUSY && primary != SQLITE_LOCKED) {
            err.kind = ErrorKind::FatalPrecondition;
        }
        return err;
    }
    return true;
}

Result<int64_t> ChatDbSource::max_id() {
    ReadOnlyDb conn;
    int rc = connect(conn, path_, query_timeout_);
    if (rc != SQLITE_OK) return classify(conn.db, rc, "open");

    StmtGuard g;
    rc = sqlite3_prepare_v2(conn.db, "SELECT MAX(ROWID) FROM message;", -1, &g.stmt, nullptr);
    if (rc != SQLITE_OK) return classify(conn.db, rc, "max id");

    rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_ROW) return classify(conn.db, rc, "max id");
    if (sqlite3_column_type(g.stmt, 0) == SQLITE_NULL) return int64_t{0};
    return static_cast<int64_t>(sqlite3_column_int64(g.stmt, 0));
}

Result<std::vector<Message>> ChatDbSource::poll(int64_t watermark) {
    ReadOnlyDb conn;
    int rc = connect(conn, path_, query_timeout_);
    if (rc != SQLITE_OK) return classify(conn.db, rc, "open");

    const char* sql =
        "SELECT message.ROWID, message.text, message.date,"
        "       handle.id, chat.chat_identifier"
        " FROM message"
        " LEFT JOIN handle ON message.handle_id = handle.ROWID"
        " LEFT JOIN chat_message_join ON message.ROWID = chat_message_join.message_id"
        " LEFT JOIN chat ON chat_message_join.chat_id = chat.ROWID"
        " WHERE message.ROWID > ?"
        "   AND message.is_from_me = 0"
        "   AND message.text IS NOT NULL"
        "   AND message.text != ''"
        " ORDER BY message.ROWID ASC;";

    StmtGuard g;
    rc = sqlite3_prepare_v2(conn.db, sql, -1, &g.stmt, nullptr);
    if (rc != SQLITE_OK) return classify(conn.db, rc, "poll");
    sqlite3_bind_int64(g.stmt, 1, watermark);

    std::vector<Message> messages;
    int64_t last_id = watermark;
    while ((rc = sqlite3_step(g.stmt)) == SQLITE_ROW) {
        Message msg;
        msg.id = sqlite3_column_int64(g.stmt, 0);
        // A message in several chats joins once per chat; keep the first row
        if (msg.id == last_id) continue;
        last_id = msg.id;

        msg.text = column_string(g.stmt, 1);
        msg.timestamp = normalize_timestamp(sqlite3_column_int64(g.stmt, 2));
        msg.chat_id = column_string(g.stmt, 4);
        msg.sender = trim(column_string(g.stmt, 3));
        if (msg.sender.empty()) msg.sender = trim(msg.chat_id);
        if (msg.sender.empty()) msg.sender = "unknown";
        msg.direction = Direction::Inbound;
        messages.push_back(std::move(msg));
    }
    if (rc != SQLITE_DONE) return classify(conn.db, rc, "poll");

    return messages;
}

} // namespace replywatch
