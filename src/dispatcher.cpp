#include "dispatcher.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <utility>

namespace replywatch {

OutboundDispatcher::OutboundDispatcher(HttpClient& http, std::string relay_url,
                                       DedupSet& sent, long timeout_seconds)
    : http_(http), relay_url_(std::move(relay_url)), sent_(sent),
      timeout_(timeout_seconds) {}

DispatchResult OutboundDispatcher::send(const std::string& recipient,
                                        const std::string& text) {
    nlohmann::json body = {
        {"recipient", recipient},
        {"message", text}
    };

    auto response = http_.post(relay_url_ + "/send", body.dump(),
                               {{"Content-Type", "application/json"}},
                               timeout_);

    DispatchResult result;
    if (response.status_code == 0) {
        std::cerr << "[dispatcher] Cannot connect to relay at " << relay_url_
                  << ": " << response.error << "\n";
        result.error = Error{ErrorKind::TransientExternal,
                             "relay unreachable: " + response.error};
        return result;
    }

    if (response.status_code == 200) {
        auto j = nlohmann::json::parse(response.body, nullptr, false);
        if (j.is_object() && j.contains("success") &&
            j["success"].is_boolean() && j["success"].get<bool>()) {
            sent_.record(text);
            result.success = true;
            return result;
        }
    }

    std::cerr << "[dispatcher] Relay returned " << response.status_code
              << ": " << response.body << "\n";
    result.error = Error{ErrorKind::TransientExternal,
                         "relay rejected message (HTTP " +
                         std::to_string(response.status_code) + ")"};
    return result;
}

bool OutboundDispatcher::health_check(long timeout_seconds) const {
    auto response = http_.get(relay_url_ + "/health", {}, timeout_seconds);
    return response.status_code == 200;
}

} // namespace replywatch
