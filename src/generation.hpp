#pragma once
#include "http.hpp"
#include "result.hpp"
#include <string>

namespace replywatch {

struct GeneratedReply {
    std::string text;                 // may be empty: nothing to send
    bool should_notify_user = false;  // the reply suggests the user take over
};

// Remote text-generation capability. Prompt content is the service's concern.
class GenerationService {
public:
    virtual ~GenerationService() = default;

    virtual std::string service_name() const = 0;

    // Reply to an inbound message in the given conversation
    virtual Result<GeneratedReply> generate_reply(const std::string& sender,
                                                  const std::string& text,
                                                  const std::string& conversation_id) = 0;

    // Free-form completion of a task description
    virtual Result<std::string> complete(const std::string& task) = 0;

    virtual bool health_check(long timeout_seconds) = 0;
};

// HTTP client for the agent API:
//   POST /users/<user>/messages/incoming  -> {response, should_notify_user}
//   POST /users/<user>/task               -> {output}
//   GET  /health
class AgentApiClient : public GenerationService {
public:
    AgentApiClient(HttpClient& http, std::string base_url, std::string user_id,
                   long timeout_seconds = 30);

    std::string service_name() const override { return "agent-api"; }

    Result<GeneratedReply> generate_reply(const std::string& sender,
                                          const std::string& text,
                                          const std::string& conversation_id) override;

    Result<std::string> complete(const std::string& task) override;

    bool health_check(long timeout_seconds) override;

private:
    // POST body to path; classifies transport and status failures
    Result<std::string> post_json(const std::string& path, const std::string& body);

    HttpClient& http_;
    std::string base_url_;
    std::string user_id_;
    long timeout_;
};

} // namespace replywatch
