#include "authenticated_http_client.hpp"
#include "auth_errors.hpp"
#include "spotycli_tracing.hpp"
#include <stdexcept>

namespace spotycli {

AuthenticatedHttpClient::AuthenticatedHttpClient(std::shared_ptr<SessionManager> session, HttpParams http_params)
    : session_(std::move(session))
    , http_client_(std::make_unique<HttpClient>(http_params))
{
    if (!session_) {
        throw std::invalid_argument("Authenticated HTTP client requires a session manager");
    }
}

std::unique_ptr<HttpResponse> AuthenticatedHttpClient::SendRequest(HttpRequest& request) {
    auto access_token = session_->CurrentAccessToken();
    if (!access_token) {
        throw NotAuthenticatedError();
    }

    auto response = Execute(request, *access_token);
    if (response->Code() != 401) {
        return response;
    }

    // No proactive refresh; an expired token only shows up as a 401
    SPOTYCLI_TRACE_INFO("AUTH_HTTP", "Received 401 from " + request.url.ToString() + ", refreshing access token");
    auto refreshed = session_->Refresh();

    return Execute(request, refreshed.access_token);
}

std::unique_ptr<HttpResponse> AuthenticatedHttpClient::Execute(HttpRequest& request, const std::string& access_token) {
    request.AuthHeadersFromParams(HttpAuthParams::Bearer(access_token));
    return http_client_->SendRequest(request);
}

std::unique_ptr<HttpResponse> AuthenticatedHttpClient::Get(const std::string& url) {
    return Send(HttpMethod::GET, url, "");
}

std::unique_ptr<HttpResponse> AuthenticatedHttpClient::Post(const std::string& url, const std::string& json_body) {
    return Send(HttpMethod::POST, url, json_body);
}

std::unique_ptr<HttpResponse> AuthenticatedHttpClient::Put(const std::string& url, const std::string& json_body) {
    return Send(HttpMethod::PUT, url, json_body);
}

std::unique_ptr<HttpResponse> AuthenticatedHttpClient::Delete(const std::string& url) {
    return Send(HttpMethod::_DELETE, url, "");
}

std::unique_ptr<HttpResponse> AuthenticatedHttpClient::Patch(const std::string& url, const std::string& json_body) {
    return Send(HttpMethod::PATCH, url, json_body);
}

std::unique_ptr<HttpResponse> AuthenticatedHttpClient::Send(HttpMethod method, const std::string& url, const std::string& json_body) {
    if (json_body.empty()) {
        HttpRequest request(method, url);
        return SendRequest(request);
    }

    HttpRequest request(method, url, "application/json", json_body);
    return SendRequest(request);
}

std::string AuthenticatedHttpClient::JsonContent(const HttpResponse& response) {
    auto content = response.Content();
    return content.empty() ? "{}" : content;
}

} // namespace spotycli
