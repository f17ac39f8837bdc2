#pragma once
#include "../conversation_store.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>

namespace replywatch {

// Whole-document store: {"conversations": {id: {...}}} in one JSON file.
// Every call runs load -> mutate -> atomic write while holding the
// in-process mutex and an fcntl write lock on <path>.lock, so concurrent
// writers in other processes are serialized as well.
class JsonConversationStore : public ConversationStore {
public:
    explicit JsonConversationStore(const std::string& path);
    ~JsonConversationStore() override;

    // Non-copyable
    JsonConversationStore(const JsonConversationStore&) = delete;
    JsonConversationStore& operator=(const JsonConversationStore&) = delete;

    std::string backend_name() const override { return "json"; }

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

    const std::string& path() const { return path_; }

private:
    // Holds the cross-process lock for the lifetime of one call
    class FileLock {
    public:
        explicit FileLock(int fd);
        ~FileLock();
        FileLock(const FileLock&) = delete;
        FileLock& operator=(const FileLock&) = delete;
    private:
        int fd_;
    };

    nlohmann::json load() const;
    void save(const nlohmann::json& doc) const;

    std::string path_;
    int lock_fd_ = -1;
    std::mutex mutex_;
};

} // namespace replywatch
