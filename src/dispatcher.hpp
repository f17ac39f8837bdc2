#pragma once
#include "http.hpp"
#include "dedup.hpp"
#include "result.hpp"
#include <optional>
#include <string>

namespace replywatch {

struct DispatchResult {
    bool success = false;
    std::optional<Error> error;
};

// Sends replies through the outbound relay (POST <relay>/send) and records
// the fingerprint of every successfully sent text in the dedup set.
class OutboundDispatcher {
public:
    OutboundDispatcher(HttpClient& http, std::string relay_url, DedupSet& sent,
                       long timeout_seconds = 15);

    // Never throws: connection failures and non-success replies come back
    // as success == false with a TransientExternal error.
    DispatchResult send(const std::string& recipient, const std::string& text);

    // GET <relay>/health answers 200
    bool health_check(long timeout_seconds) const;

    const std::string& relay_url() const { return relay_url_; }

private:
    HttpClient& http_;
    std::string relay_url_;
    DedupSet& sent_;
    long timeout_;
};

} // namespace replywatch
