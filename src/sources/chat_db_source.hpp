#pragma once
#include "../source.hpp"
#include <string>

namespace replywatch {

// Polls a Messages-style chat.db (SQLite) for inbound rows.
// The database is opened read-only per call and closed again, so no lock is
// held on the external log between polls.
class ChatDbSource : public MessageSource {
public:
    // Seconds between the Unix epoch and 2001-01-01T00:00:00Z
    static constexpr int64_t APPLE_EPOCH_OFFSET = 978307200;

    explicit ChatDbSource(const std::string& path, long query_timeout_seconds = 15);

    std::string source_name() const override { return "chat.db"; }

    Result<bool> open() override;
    Result<int64_t> max_id() override;
    Result<std::vector<Message>> poll(int64_t watermark) override;

    // Convert a chat.db date (seconds or nanoseconds since 2001) to Unix seconds
    static uint64_t normalize_timestamp(int64_t raw);

    const std::string& path() const { return path_; }

private:
    std::string path_;
    long query_timeout_;
};

} // namespace replywatch
