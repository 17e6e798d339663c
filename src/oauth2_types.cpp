#include "oauth2_types.hpp"
#include "spotycli_http_client.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <algorithm>
#include <stdexcept>

namespace spotycli {

std::string GrantTypeToString(GrantType grant_type) {
    switch (grant_type) {
        case GrantType::authorization_code: return "authorization_code";
        case GrantType::client_credentials: return "client_credentials";
        case GrantType::refresh_token: return "refresh_token";
        default: return "unknown";
    }
}

std::string OAuth2Config::GetAuthorizationUrl() const {
    return authorization_url;
}

std::string OAuth2Config::GetTokenUrl() const {
    return token_url;
}

std::string OAuth2Config::GetCallbackHost() const {
    return HttpUrl(redirect_uri).Host();
}

int OAuth2Config::GetCallbackPort() const {
    return HttpUrl(redirect_uri).PortNumber();
}

std::string OAuth2Config::GetCallbackPath() const {
    auto path = HttpUrl(redirect_uri).Path();
    return path.empty() ? "/" : path;
}

void OAuth2Config::Validate() const {
    if (client_id.empty()) {
        throw std::invalid_argument("SPOTIFY_CLIENT_ID must be set");
    }
    if (client_secret.empty()) {
        throw std::invalid_argument("SPOTIFY_CLIENT_SECRET must be set");
    }
    if (token_url.empty() || authorization_url.empty()) {
        throw std::invalid_argument("OAuth2 authorization and token URLs must not be empty");
    }

    HttpUrl redirect(redirect_uri);
    if (redirect.Scheme() != "http" || redirect.Host().empty()) {
        throw std::invalid_argument("Redirect URI must be a loopback http:// URL, got: " + redirect_uri);
    }
}

CallbackResult CallbackResult::Success(const std::string& code, const std::string& state) {
    CallbackResult result;
    result.code = code;
    result.returned_state = state;
    return result;
}

CallbackResult CallbackResult::Failure(const std::string& error) {
    CallbackResult result;
    result.error = error;
    return result;
}

namespace OAuth2Utils {

namespace {

// Uniform characters from charset drawn from the OpenSSL CSPRNG.
// Bytes at or above the largest multiple of the charset size are rejected to avoid modulo bias.
std::string RandomString(const std::string& charset, size_t length) {
    const size_t limit = 256 - (256 % charset.length());

    std::string result;
    result.reserve(length);

    unsigned char buffer[64];
    while (result.length() < length) {
        if (RAND_bytes(buffer, sizeof(buffer)) != 1) {
            throw std::runtime_error("Secure random source failed while generating OAuth2 parameters");
        }
        for (size_t i = 0; i < sizeof(buffer) && result.length() < length; ++i) {
            if (buffer[i] < limit) {
                result += charset[buffer[i] % charset.length()];
            }
        }
    }

    return result;
}

} // namespace

std::string GenerateCodeVerifier() {
    static const std::string charset = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-._~";
    return RandomString(charset, CODE_VERIFIER_LENGTH);
}

std::string GenerateCodeChallenge(const std::string& code_verifier) {
    return Base64UrlEncodeNoPadding(Sha256(code_verifier));
}

std::string GenerateState() {
    static const std::string charset = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    return RandomString(charset, STATE_LENGTH);
}

PkceParameters GeneratePkce() {
    PkceParameters pkce;
    pkce.verifier = GenerateCodeVerifier();
    pkce.challenge = GenerateCodeChallenge(pkce.verifier);
    pkce.state = GenerateState();
    return pkce;
}

bool ValidateState(const std::string& received_state, const std::string& expected_state) {
    if (expected_state.empty() || received_state.length() != expected_state.length()) {
        return false;
    }
    // Constant time over the common length
    unsigned char diff = 0;
    for (size_t i = 0; i < expected_state.length(); ++i) {
        diff |= static_cast<unsigned char>(received_state[i] ^ expected_state[i]);
    }
    return diff == 0;
}

std::string Sha256(const std::string& input) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int digest_length = 0;

    if (EVP_Digest(input.data(), input.size(), digest, &digest_length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    return std::string(reinterpret_cast<const char*>(digest), digest_length);
}

std::string Base64UrlEncodeNoPadding(const std::string& input) {
    auto encoded = HttpAuthParams::Base64Encode(input);

    std::replace(encoded.begin(), encoded.end(), '+', '-');
    std::replace(encoded.begin(), encoded.end(), '/', '_');
    encoded.erase(std::find(encoded.begin(), encoded.end(), '='), encoded.end());

    return encoded;
}

std::string UrlEncode(const std::string& value) {
    return httplib::detail::encode_query_param(value);
}

} // namespace OAuth2Utils

} // namespace spotycli
