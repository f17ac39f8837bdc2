#pragma once
#include "message.hpp"
#include "result.hpp"
#include <vector>
#include <cstdint>

namespace replywatch {

// Read-only view of an append-only inbound message log.
class MessageSource {
public:
    virtual ~MessageSource() = default;

    virtual std::string source_name() const = 0;

    // Verify the log exists and is readable. FatalPrecondition on failure.
    virtual Result<bool> open() = 0;

    // Highest sequence number currently in the log (0 when empty).
    virtual Result<int64_t> max_id() = 0;

    // Inbound, non-empty messages with id > watermark, ascending by id.
    // TransientExternal when the log is locked or the query times out;
    // nothing is returned in that case.
    virtual Result<std::vector<Message>> poll(int64_t watermark) = 0;
};

} // namespace replywatch
