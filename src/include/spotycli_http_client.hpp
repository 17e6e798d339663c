#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

namespace spotycli
{

using HeaderMap = httplib::Headers;

// ----------------------------------------------------------------------

// Absolute http(s) URL split into the parts httplib needs: the client is created
// for scheme://host:port and the request is sent for path?query.
class HttpUrl {
public:
    HttpUrl(const std::string& url);

    std::string ToSchemeHostAndPort() const;
    std::string ToPathQuery() const;
    std::string ToString() const;

    std::string Scheme() const { return scheme; }
    std::string Host() const { return host; }
    std::string Port() const { return port; }
    std::string Path() const { return path; }
    std::string Query() const { return query; }

    // Used to rewrite a redirect URI once an ephemeral listener port is known
    void Port(const std::string& value) { port = value; }

    // Explicit port, or the scheme default (80/443)
    int PortNumber() const;

private:
    void ParseUrl(const std::string& url);

    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
};

// ----------------------------------------------------------------------

struct HttpParams {

	static constexpr uint64_t DEFAULT_TIMEOUT = 30000; // 30 sec
	static constexpr uint64_t DEFAULT_RETRIES = 3;
	static constexpr uint64_t DEFAULT_RETRY_WAIT_MS = 100;
	static constexpr float DEFAULT_RETRY_BACKOFF = 4;
	static constexpr uint64_t DEFAULT_MAX_RETRY_AFTER_MS = 30000;
	static constexpr bool DEFAULT_KEEP_ALIVE = true;
	static constexpr bool DEFAULT_VERIFY_TLS = true;

    HttpParams();

    // Single attempt, no retry on any status. Used for the token endpoint.
    static HttpParams NoRetry(uint64_t timeout_ms = DEFAULT_TIMEOUT);

	uint64_t timeout;
	uint64_t retries;                 // attempts in total, including the first
	uint64_t retry_wait_ms;
	float retry_backoff;
	uint64_t max_retry_after_ms;      // cap for a server-provided Retry-After
	bool keep_alive;
	bool verify_tls;
};

// ----------------------------------------------------------------------

enum class HttpAuthType {
    NONE,
    BASIC,
    BEARER
};

// Client authentication for the token endpoint (Basic) or user authentication
// for the Web API (Bearer).
class HttpAuthParams
{
public:
    HttpAuthParams() = default;

    static HttpAuthParams Basic(const std::string& client_id, const std::string& client_secret);
    static HttpAuthParams Bearer(const std::string& access_token);

    std::optional<std::tuple<std::string, std::string>> basic_credentials = std::nullopt;
    std::optional<std::string> bearer_token = std::nullopt;

    HttpAuthType AuthType() const;
    std::optional<std::string> BasicCredentialsBase64() const;

    // Standard base64 with padding
    static std::string Base64Encode(const std::string &input);
};

// ----------------------------------------------------------------------

class HttpMethod
{
public:
    enum Variants : uint8_t
    {
        UNDEFINED,
        GET,
        POST,
        PUT,
        _DELETE,
        PATCH
    };

    HttpMethod() = default;
    constexpr HttpMethod(Variants ret_type) : variant(ret_type) { }
    constexpr bool operator==(HttpMethod a) const { return variant == a.variant; }
    constexpr bool operator!=(HttpMethod a) const { return variant != a.variant; }

    constexpr Variants Variant() const { return variant; }

    std::string ToString() const;

private:
    Variants variant = UNDEFINED;
};

// ----------------------------------------------------------------------

// No HTTP response at all after the last attempt (connection refused, timeout, TLS)
class HttpTransportError : public std::runtime_error {
public:
    explicit HttpTransportError(const std::string& message) : std::runtime_error(message) {}
};

// ----------------------------------------------------------------------

class HttpRequest
{
friend class HttpClient;

public:
    HttpRequest(HttpMethod method, const std::string &url, std::string content_type, std::string content);
    HttpRequest(HttpMethod method, const std::string &url);

    // Replaces any Authorization header set before, so a retried request carries the new token only
    void AuthHeadersFromParams(const HttpAuthParams &auth_params);
    void SetHeader(const std::string &name, const std::string &value);

public:
    HttpMethod method;
    HttpUrl url;

    HeaderMap headers;
    std::string content_type;
    std::string content;

private:
    httplib::Result Execute(httplib::Client &client);
};

// ----------------------------------------------------------------------

class HttpResponse
{
friend class HttpClient;

public:
    HttpResponse(HttpMethod method, HttpUrl url, int code, std::string content_type, std::string content);

    int Code() const { return code; }
    bool IsSuccess() const { return code >= 200 && code < 300; }
    std::string ContentType() const { return content_type; }
    std::string Content() const { return content; }

    // Empty when the header is absent
    std::string Header(const std::string &name) const;

    // Retry-After in seconds (the Web API's rate limit hint); absent or unparsable yields nullopt
    std::optional<uint64_t> RetryAfterSeconds() const;

public:
    HttpMethod method;
    HttpUrl url;

    int code;
    HeaderMap headers;
    std::string content_type;
    std::string content;

private:
    static std::unique_ptr<HttpResponse> FromHttpLibResponse(const HttpMethod &method,
                                                             const HttpUrl &url,
                                                             const httplib::Response &response);
};

// ----------------------------------------------------------------------

// Sends requests with bounded retries: 408, 429, 503 and 504 answers and transport
// failures are retried with exponential backoff, or after Retry-After when the
// server names a delay. Every other status is returned to the caller unchanged.
class HttpClient
{
public:
    explicit HttpClient(const HttpParams &http_params);

public:
    std::unique_ptr<HttpResponse> Get(const std::string &url);

    std::unique_ptr<HttpResponse> SendRequest(HttpRequest &request);

    const HttpParams &Params() const { return http_params; }

    static bool IsRetryableStatus(int status);

private:
    HttpParams http_params;

private:
    std::unique_ptr<httplib::Client> CreateHttplibClient(const std::string &scheme_host_and_port) const;

    // Delay before attempt n_tries + 1
    uint64_t CalculateSleepTime(uint64_t n_tries, const HttpResponse *last_response) const;
};

} // namespace spotycli
