#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace spotycli {

// OAuth2 grant types
enum class GrantType {
    authorization_code,
    client_credentials,
    refresh_token
};

std::string GrantTypeToString(GrantType grant_type);

// OAuth2 client configuration for the streaming service's accounts endpoints
struct OAuth2Config {
    static constexpr const char* DEFAULT_AUTHORIZATION_URL = "https://accounts.spotify.com/authorize";
    static constexpr const char* DEFAULT_TOKEN_URL = "https://accounts.spotify.com/api/token";
    static constexpr const char* DEFAULT_REDIRECT_URI = "http://127.0.0.1:8888/callback";
    static constexpr const char* DEFAULT_SCOPE =
        "user-read-playback-state user-modify-playback-state user-read-currently-playing "
        "streaming user-library-read playlist-read-private playlist-read-collaborative";

    std::string client_id;
    std::string client_secret;
    std::string scope;
    std::string redirect_uri;
    std::string authorization_url;
    std::string token_url;

    OAuth2Config() :
        client_id(""),
        client_secret(""),
        scope(DEFAULT_SCOPE),
        redirect_uri(DEFAULT_REDIRECT_URI),
        authorization_url(DEFAULT_AUTHORIZATION_URL),
        token_url(DEFAULT_TOKEN_URL) {}

    std::string GetAuthorizationUrl() const;
    std::string GetTokenUrl() const;

    // Loopback endpoint the callback listener binds to, derived from redirect_uri
    std::string GetCallbackHost() const;
    int GetCallbackPort() const;
    std::string GetCallbackPath() const;

    // Throws std::invalid_argument when client credentials or URLs are missing
    void Validate() const;
};

// Token set returned by the token endpoint and persisted between runs.
// expires_in is kept exactly as issued; no absolute deadline is derived from it.
struct OAuth2Tokens {
    std::string access_token;
    std::string refresh_token;
    int64_t expires_in;
    std::string scope;

    OAuth2Tokens() : expires_in(0) {}

    bool operator==(const OAuth2Tokens& other) const {
        return access_token == other.access_token &&
               refresh_token == other.refresh_token &&
               expires_in == other.expires_in &&
               scope == other.scope;
    }
    bool operator!=(const OAuth2Tokens& other) const { return !(*this == other); }
};

// One set per authentication attempt, never reused
struct PkceParameters {
    std::string verifier;
    std::string challenge;
    std::string state;
};

// Outcome of the single redirect the callback listener accepts.
// Exactly one of code or error is set.
struct CallbackResult {
    std::optional<std::string> code;
    std::optional<std::string> returned_state;
    std::optional<std::string> error;

    static CallbackResult Success(const std::string& code, const std::string& state);
    static CallbackResult Failure(const std::string& error);

    bool IsError() const { return error.has_value(); }
};

// Utility functions for OAuth2 operations
namespace OAuth2Utils {
    constexpr size_t CODE_VERIFIER_LENGTH = 128;
    constexpr size_t STATE_LENGTH = 32;

    // PKCE code verifier: RFC 7636 unreserved characters from a CSPRNG
    std::string GenerateCodeVerifier();

    // base64url_nopad(sha256(code_verifier))
    std::string GenerateCodeChallenge(const std::string& code_verifier);

    // Random anti-CSRF state parameter
    std::string GenerateState();

    PkceParameters GeneratePkce();

    bool ValidateState(const std::string& received_state, const std::string& expected_state);

    std::string Sha256(const std::string& input);
    std::string Base64UrlEncodeNoPadding(const std::string& input);

    // Percent-encodes a query or form value
    std::string UrlEncode(const std::string& value);
}

} // namespace spotycli
