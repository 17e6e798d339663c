#pragma once

#include "spotycli_http_client.hpp"
#include "session_manager.hpp"
#include <memory>
#include <string>

namespace spotycli {

// Sends API requests with the session's bearer token. A 401 answer triggers one
// session refresh and exactly one retry; the retried response is returned as is.
class AuthenticatedHttpClient {
public:
    AuthenticatedHttpClient(std::shared_ptr<SessionManager> session, HttpParams http_params = HttpParams());

    // Throws NotAuthenticatedError when no session is installed
    std::unique_ptr<HttpResponse> SendRequest(HttpRequest& request);

    std::unique_ptr<HttpResponse> Get(const std::string& url);
    std::unique_ptr<HttpResponse> Post(const std::string& url, const std::string& json_body = "");
    std::unique_ptr<HttpResponse> Put(const std::string& url, const std::string& json_body = "");
    std::unique_ptr<HttpResponse> Delete(const std::string& url);
    std::unique_ptr<HttpResponse> Patch(const std::string& url, const std::string& json_body = "");

    // Response body, or "{}" for the empty bodies playback endpoints return
    static std::string JsonContent(const HttpResponse& response);

private:
    std::unique_ptr<HttpResponse> Send(HttpMethod method, const std::string& url, const std::string& json_body);
    std::unique_ptr<HttpResponse> Execute(HttpRequest& request, const std::string& access_token);

    std::shared_ptr<SessionManager> session_;
    std::unique_ptr<HttpClient> http_client_;
};

} // namespace spotycli
