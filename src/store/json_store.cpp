#include "json_store.hpp"
#include "conversation_json.hpp"
#include "../util.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

using json = nlohmann::json;

namespace replywatch {

JsonConversationStore::FileLock::FileLock(int fd) : fd_(fd) {
    struct flock fl{};
    fl.l_type = F_WRLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;
    while (fcntl(fd_, F_SETLKW, &fl) == -1) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("JsonConversationStore: lock failed: ") +
                                     std::strerror(errno));
        }
    }
}

JsonConversationStore::FileLock::~FileLock() {
    struct flock fl{};
    fl.l_type = F_UNLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;
    (void)fcntl(fd_, F_SETLK, &fl);
}

JsonConversationStore::JsonConversationStore(const std::string& path) : path_(path) {
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    std::string lock_path = path_ + ".lock";
    lock_fd_ = ::open(lock_path.c_str(), O_CREAT | O_RDWR, 0644);
    if (lock_fd_ < 0) {
        throw std::runtime_error("JsonConversationStore: cannot open lock file " +
                                 lock_path + ": " + std::strerror(errno));
    }
}

JsonConversationStore::~JsonConversationStore() {
    if (lock_fd_ >= 0) {
        ::close(lock_fd_);
        lock_fd_ = -1;
    }
}

json JsonConversationStore::load() const {
    json empty = {{"conversations", json::object()}};

    // Only a missing file is empty; anything else unreadable must not be
    // overwritten by the next save
    int fd = ::open(path_.c_str(), O_RDONLY);
    if (fd < 0) {
        if (errno == ENOENT) return empty;
        throw std::runtime_error("JsonConversationStore: cannot open " + path_ + ": " +
                                 std::strerror(errno));
    }

    std::string content;
    char buf[8192];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            throw std::runtime_error("JsonConversationStore: cannot read " + path_ + ": " +
                                     std::strerror(err));
        }
        content.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);

    json doc = json::parse(content, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() ||
        !doc.contains("conversations") || !doc["conversations"].is_object()) {
        std::cerr << "[store] Ignoring corrupt conversation file " << path_ << "\n";
        return empty;
    }
    return doc;
}

void JsonConversationStore::save(const json& doc) const {
    if (!atomic_write_file(path_, doc.dump(2))) {
        throw std::runtime_error("JsonConversationStore: failed to write " + path_);
    }
}

void JsonConversationStore::log_message(const std::string& sender, const std::string& text,
                                        Direction direction,
                                        const std::string& conversation_id,
                                        int64_t source_id) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);

    auto doc = load();
    auto& convos = doc["conversations"];
    uint64_t now = epoch_seconds();

    if (!convos.contains(conversation_id) || !convos[conversation_id].is_object()) {
        Conversation fresh;
        fresh.conversation_id = conversation_id;
        fresh.sender = sender;
        fresh.started_at = now;
        fresh.last_activity = now;
        convos[conversation_id] = conversation_to_json(fresh);
    }

    Message msg;
    msg.id = source_id;
    msg.sender = direction == Direction::Outbound ? std::string(AGENT_SENDER) : sender;
    msg.text = text;
    msg.direction = direction;
    msg.timestamp = now;

    auto& convo = convos[conversation_id];
    if (!convo.contains("messages") || !convo["messages"].is_array()) {
        convo["messages"] = json::array();
    }
    convo["messages"].push_back(stored_message_to_json(msg));
    convo["last_activity"] = now;
    if (direction == Direction::Inbound) convo["read"] = false;

    save(doc);
}

bool JsonConversationStore::update_summary(const std::string& conversation_id,
                                           const ConversationSummary& summary) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);

    auto doc = load();
    auto& convos = doc["conversations"];
    if (!convos.contains(conversation_id)) return false;

    convos[conversation_id]["summary"] = summary_to_json(summary);
    save(doc);
    return true;
}

bool JsonConversationStore::mark_read(const std::string& conversation_id) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);

    auto doc = load();
    auto& convos = doc["conversations"];
    if (!convos.contains(conversation_id)) return false;

    convos[conversation_id]["read"] = true;
    save(doc);
    return true;
}

void JsonConversationStore::mark_all_read() {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);

    auto doc = load();
    for (auto& [id, convo] : doc["conversations"].items()) {
        if (convo.is_object()) convo["read"] = true;
    }
    save(doc);
}

std::vector<Conversation> JsonConversationStore::get_all() {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);

    auto doc = load();
    std::vector<Conversation> result;
    for (const auto& [id, item] : doc["conversations"].items()) {
        if (item.is_object()) result.push_back(conversation_from_json(id, item));
    }
    sort_conversations(result);
    return result;
}

std::vector<Conversation> JsonConversationStore::get_unread() {
    auto all = get_all();
    std::vector<Conversation> result;
    for (auto& convo : all) {
        if (!convo.read) result.push_back(std::move(convo));
    }
    return result;
}

uint32_t JsonConversationStore::get_unread_count() {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);

    auto doc = load();
    uint32_t count = 0;
    for (const auto& [id, item] : doc["conversations"].items()) {
        if (item.is_object() && !item.value("read", false)) ++count;
    }
    return count;
}

std::optional<Conversation> JsonConversationStore::get(const std::string& conversation_id) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);

    auto doc = load();
    const auto& convos = doc["conversations"];
    auto it = convos.find(conversation_id);
    if (it == convos.end() || !it->is_object()) return std::nullopt;
    return conversation_from_json(conversation_id, *it);
}

void JsonConversationStore::clear() {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);

    save({{"conversations", json::object()}});
}

} // namespace replywatch
