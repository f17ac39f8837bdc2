#pragma once
#include "http.hpp"

namespace replywatch {

class MockHttpClient : public HttpClient {
public:
    HttpResponse next_response;
    std::vector<HttpResponse> response_queue;
    HttpResponse get_response{200, "{\"status\":\"ok\"}", {}};
    std::string last_url;
    std::string last_body;
    std::vector<Header> last_headers;
    long last_timeout = 0;
    std::vector<std::string> urls;
    int call_count = 0;
    int get_count = 0;

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds) override {
        call_count++;
        last_url = url;
        last_body = body;
        last_headers = headers;
        last_timeout = timeout_seconds;
        urls.push_back(url);
        if (!response_queue.empty()) {
            auto resp = response_queue.front();
            response_queue.erase(response_queue.begin());
            return resp;
        }
        return next_response;
    }

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& /*headers*/,
                     long timeout_seconds) override {
        get_count++;
        last_url = url;
        last_timeout = timeout_seconds;
        urls.push_back(url);
        return get_response;
    }
};

} // namespace replywatch
