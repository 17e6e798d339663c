#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <sstream>
#include <thread>

#include <openssl/evp.h>

#include "spotycli_http_client.hpp"
#include "spotycli_tracing.hpp"

namespace spotycli
{

HttpUrl::HttpUrl(const std::string& url) {
    ParseUrl(url);
}

void HttpUrl::ParseUrl(const std::string& url) {
    const static std::regex re(R"(^(?:(https?):)?(?://(?:[^@/?#]*@)?([^:/?#]+)(?::(\d+))?)?([^?#]*)(\?[^#]*)?(#.*)?)",
                               std::regex::icase);
    std::smatch m;
    if (!std::regex_match(url, m, re)) {
        throw std::invalid_argument("Invalid URL, cannot be parsed: " + url);
    }

    scheme = m[1].str();
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    host = m[2].str();
    port = m[3].str();
    path = m[4].str();
    query = m[5].str();
    fragment = m[6].str();
}

std::string HttpUrl::ToSchemeHostAndPort() const {
    std::ostringstream ss;
    ss << scheme << "://" << host;
    if (!port.empty()) {
        ss << ":" << port;
    }
    return ss.str();
}

std::string HttpUrl::ToPathQuery() const {
    return (path.empty() ? "/" : path) + query;
}

std::string HttpUrl::ToString() const {
    return ToSchemeHostAndPort() + ToPathQuery() + fragment;
}

int HttpUrl::PortNumber() const {
    if (!port.empty()) {
        return std::stoi(port);
    }
    return scheme == "https" ? 443 : 80;
}

// ----------------------------------------------------------------------

HttpParams::HttpParams()
    : timeout(DEFAULT_TIMEOUT),
      retries(DEFAULT_RETRIES),
      retry_wait_ms(DEFAULT_RETRY_WAIT_MS),
      retry_backoff(DEFAULT_RETRY_BACKOFF),
      max_retry_after_ms(DEFAULT_MAX_RETRY_AFTER_MS),
      keep_alive(DEFAULT_KEEP_ALIVE),
      verify_tls(DEFAULT_VERIFY_TLS)
{
}

HttpParams HttpParams::NoRetry(uint64_t timeout_ms)
{
    HttpParams params;
    params.timeout = timeout_ms;
    params.retries = 1;
    return params;
}

// ----------------------------------------------------------------------

HttpAuthParams HttpAuthParams::Basic(const std::string& client_id, const std::string& client_secret)
{
    HttpAuthParams ret;
    ret.basic_credentials = std::make_tuple(client_id, client_secret);
    return ret;
}

HttpAuthParams HttpAuthParams::Bearer(const std::string& access_token)
{
    HttpAuthParams ret;
    ret.bearer_token = access_token;
    return ret;
}

HttpAuthType HttpAuthParams::AuthType() const
{
    if (basic_credentials.has_value()) {
        return HttpAuthType::BASIC;
    }
    if (bearer_token.has_value()) {
        return HttpAuthType::BEARER;
    }
    return HttpAuthType::NONE;
}

std::optional<std::string> HttpAuthParams::BasicCredentialsBase64() const
{
    if (!basic_credentials.has_value()) {
        return std::nullopt;
    }

    const auto& [client_id, client_secret] = basic_credentials.value();
    return Base64Encode(client_id + ":" + client_secret);
}

std::string HttpAuthParams::Base64Encode(const std::string &input)
{
    if (input.empty()) {
        return std::string();
    }

    std::string encoded(4 * ((input.size() + 2) / 3), '\0');
    auto written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&encoded.front()),
                                   reinterpret_cast<const unsigned char *>(input.data()),
                                   static_cast<int>(input.size()));
    encoded.resize(static_cast<size_t>(written));
    return encoded;
}

// ----------------------------------------------------------------------

std::string HttpMethod::ToString() const
{
    switch (variant)
    {
    case GET:
        return "GET";
    case POST:
        return "POST";
    case PUT:
        return "PUT";
    case _DELETE:
        return "DELETE";
    case PATCH:
        return "PATCH";
    default:
        return "UNDEFINED";
    }
}

// ----------------------------------------------------------------------

HttpRequest::HttpRequest(HttpMethod method, const std::string &url, std::string content_type, std::string content)
    : method(method), url(HttpUrl(url)), content_type(std::move(content_type)), content(std::move(content))
{ }

HttpRequest::HttpRequest(HttpMethod method, const std::string &url)
    : HttpRequest(method, url, std::string("application/json"), std::string())
{ }

void HttpRequest::AuthHeadersFromParams(const HttpAuthParams &auth_params)
{
    switch (auth_params.AuthType()) {
        case HttpAuthType::BASIC:
            SetHeader("Authorization", "Basic " + auth_params.BasicCredentialsBase64().value());
            break;
        case HttpAuthType::BEARER:
            SetHeader("Authorization", "Bearer " + auth_params.bearer_token.value());
            break;
        case HttpAuthType::NONE:
            headers.erase("Authorization");
            break;
    }
}

void HttpRequest::SetHeader(const std::string &name, const std::string &value)
{
    headers.erase(name);
    headers.emplace(name, value);
}

httplib::Result HttpRequest::Execute(httplib::Client &client)
{
    const auto path_query = url.ToPathQuery();

    SPOTYCLI_TRACE_INFO("HTTP_REQUEST", method.ToString() + " " + url.ToSchemeHostAndPort() + path_query);
    for (const auto& header : headers) {
        // Authorization values are credentials and never traced in clear
        auto value = header.first == "Authorization" ? TruncateSecret(header.second, 10) : header.second;
        SPOTYCLI_TRACE_DEBUG("HTTP_REQUEST", "  " + header.first + ": " + value);
    }
    if (!content.empty()) {
        SPOTYCLI_TRACE_DEBUG("HTTP_REQUEST", "Request content (" + std::to_string(content.length()) + " bytes), Content-Type: " + content_type);
    }

    httplib::Result result;
    switch (method.Variant()) {
        case HttpMethod::GET:
            result = client.Get(path_query, headers);
            break;
        case HttpMethod::POST:
            result = client.Post(path_query, headers, content, content_type.c_str());
            break;
        case HttpMethod::PUT:
            result = client.Put(path_query, headers, content, content_type.c_str());
            break;
        case HttpMethod::PATCH:
            result = client.Patch(path_query, headers, content, content_type.c_str());
            break;
        case HttpMethod::_DELETE:
            result = client.Delete(path_query, headers, content, content_type.c_str());
            break;
        default:
            throw std::invalid_argument("Request has no HTTP method: " + url.ToString());
    }

    if (result) {
        SPOTYCLI_TRACE_INFO("HTTP_RESPONSE", "Status " + std::to_string(result->status) +
                            " (" + std::to_string(result->body.length()) + " bytes)");
    } else {
        SPOTYCLI_TRACE_ERROR("HTTP_RESPONSE", "Request failed: " + httplib::to_string(result.error()));
    }

    return result;
}

// ----------------------------------------------------------------------

HttpResponse::HttpResponse(HttpMethod method, HttpUrl url, int code, std::string content_type, std::string content)
    : method(method), url(std::move(url)), code(code), content_type(std::move(content_type)), content(std::move(content))
{ }

std::unique_ptr<HttpResponse> HttpResponse::FromHttpLibResponse(const HttpMethod &method,
                                                                const HttpUrl &url,
                                                                const httplib::Response &response)
{
    auto ret = std::make_unique<HttpResponse>(method, url, response.status,
                                              response.get_header_value("Content-Type"), response.body);
    ret->headers = response.headers;
    return ret;
}

std::string HttpResponse::Header(const std::string &name) const
{
    // httplib::Headers compares names case-insensitively
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

std::optional<uint64_t> HttpResponse::RetryAfterSeconds() const
{
    auto value = Header("Retry-After");
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

// ----------------------------------------------------------------------

HttpClient::HttpClient(const HttpParams &http_params)
    : http_params(http_params)
{ }

bool HttpClient::IsRetryableStatus(int status)
{
    switch (status) {
        case 408: // Request Timeout
        case 429: // Rate limited
        case 503: // Service Unavailable
        case 504: // Gateway Timeout
            return true;
        default:
            return false;
    }
}

std::unique_ptr<HttpResponse> HttpClient::SendRequest(HttpRequest &request)
{
    const uint64_t max_tries = std::max<uint64_t>(http_params.retries, 1);
    uint64_t n_tries = 0;

    while (true)
    {
        auto client = CreateHttplibClient(request.url.ToSchemeHostAndPort());
        auto res = request.Execute(*client);
        n_tries += 1;

        std::unique_ptr<HttpResponse> response;
        if (res) {
            response = HttpResponse::FromHttpLibResponse(request.method, request.url, res.value());
            if (!IsRetryableStatus(response->Code()) || n_tries >= max_tries) {
                return response;
            }
            SPOTYCLI_TRACE_WARN("HTTP_CLIENT", "Status " + std::to_string(response->Code()) + " from " +
                                request.url.ToString() + ", attempt " + std::to_string(n_tries) +
                                " of " + std::to_string(max_tries));
        } else if (n_tries >= max_tries) {
            throw HttpTransportError(httplib::to_string(res.error()) + " error for HTTP " +
                                     request.method.ToString() + " to '" + request.url.ToString() + "'");
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(CalculateSleepTime(n_tries, response.get())));
    }
}

uint64_t HttpClient::CalculateSleepTime(uint64_t n_tries, const HttpResponse *last_response) const
{
    if (last_response) {
        if (auto retry_after = last_response->RetryAfterSeconds()) {
            return std::min<uint64_t>(*retry_after * 1000, http_params.max_retry_after_ms);
        }
    }
    return static_cast<uint64_t>(static_cast<float>(http_params.retry_wait_ms) *
                                 std::pow(http_params.retry_backoff, static_cast<float>(n_tries - 1)));
}

std::unique_ptr<HttpResponse> HttpClient::Get(const std::string &url)
{
    auto request = HttpRequest(HttpMethod::GET, url);
    return SendRequest(request);
}

std::unique_ptr<httplib::Client> HttpClient::CreateHttplibClient(const std::string &scheme_host_and_port) const
{
    auto timeout = std::chrono::milliseconds(http_params.timeout);

    auto c = std::make_unique<httplib::Client>(scheme_host_and_port);
    c->set_follow_location(true);
	c->set_keep_alive(http_params.keep_alive);
	c->enable_server_certificate_verification(http_params.verify_tls);
	c->set_write_timeout(timeout);
	c->set_read_timeout(timeout);
	c->set_connection_timeout(timeout);
	c->set_decompress(true);
	return c;
}

} // namespace spotycli
