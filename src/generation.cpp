#include "generation.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <utility>

using json = nlohmann::json;

namespace replywatch {

AgentApiClient::AgentApiClient(HttpClient& http, std::string base_url,
                               std::string user_id, long timeout_seconds)
    : http_(http), base_url_(std::move(base_url)), user_id_(std::move(user_id)),
      timeout_(timeout_seconds) {}

Result<std::string> AgentApiClient::post_json(const std::string& path,
                                              const std::string& body) {
    auto response = http_.post(base_url_ + path, body,
                               {{"Content-Type", "application/json"}},
                               timeout_);

    if (response.status_code == 0) {
        std::cerr << "[agent] Cannot reach agent API at " << base_url_
                  << ": " << response.error << "\n";
        return Error{ErrorKind::TransientExternal, "agent API unreachable: " + response.error};
    }
    if (response.status_code == 404) {
        return Error{ErrorKind::NotFound, "agent API: " + path + " not found"};
    }
    if (response.status_code != 200) {
        std::cerr << "[agent] Agent API returned " << response.status_code
                  << ": " << response.body << "\n";
        return Error{ErrorKind::TransientExternal,
                     "agent API error (HTTP " + std::to_string(response.status_code) + ")"};
    }
    return std::move(response.body);
}

Result<GeneratedReply> AgentApiClient::generate_reply(const std::string& sender,
                                                      const std::string& text,
                                                      const std::string& conversation_id) {
    json request = {
        {"user_id", user_id_},
        {"sender_id", sender},
        {"message", text},
        {"conversation_id", conversation_id}
    };

    auto body = post_json("/users/" + user_id_ + "/messages/incoming", request.dump());
    if (!body) return body.error();

    auto resp = json::parse(body.value(), nullptr, false);
    if (resp.is_discarded() || !resp.is_object()) {
        return Error{ErrorKind::MalformedResponse, "agent reply is not a JSON object"};
    }

    GeneratedReply reply;
    if (resp.contains("response") && resp["response"].is_string())
        reply.text = resp["response"].get<std::string>();
    if (resp.contains("should_notify_user") && resp["should_notify_user"].is_boolean())
        reply.should_notify_user = resp["should_notify_user"].get<bool>();
    return reply;
}

Result<std::string> AgentApiClient::complete(const std::string& task) {
    json request = {
        {"user_id", user_id_},
        {"task", task}
    };

    auto body = post_json("/users/" + user_id_ + "/task", request.dump());
    if (!body) return body.error();

    auto resp = json::parse(body.value(), nullptr, false);
    if (resp.is_discarded() || !resp.is_object() ||
        !resp.contains("output") || !resp["output"].is_string()) {
        return Error{ErrorKind::MalformedResponse, "task response has no output text"};
    }
    return resp["output"].get<std::string>();
}

bool AgentApiClient::health_check(long timeout_seconds) {
    auto response = http_.get(base_url_ + "/health", {}, timeout_seconds);
    return response.status_code == 200;
}

} // namespace replywatch
