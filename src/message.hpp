#pragma once
#include <string>
#include <cstdint>

namespace replywatch {

enum class Direction { Inbound, Outbound };

inline const char* direction_to_string(Direction d) {
    return d == Direction::Outbound ? "outbound" : "inbound";
}

inline Direction direction_from_string(const std::string& s) {
    return s == "outbound" ? Direction::Outbound : Direction::Inbound;
}

struct Message {
    int64_t id = 0;          // source sequence number (0 for replies we generated)
    std::string text;
    std::string sender;      // normalized sender handle
    Direction direction = Direction::Inbound;
    uint64_t timestamp = 0;  // Unix epoch seconds
    std::string chat_id;     // source chat identifier, may be empty
};

} // namespace replywatch
