#pragma once

#include "oauth2_types.hpp"
#include "spotycli_http_client.hpp"
#include <map>
#include <memory>
#include <string>

namespace spotycli {

// Talks to the provider's token endpoint. Every call is a single POST with
// HTTP Basic client authentication and a form-encoded body; nothing is retried.
class OAuth2TokenClient {
public:
    explicit OAuth2TokenClient(OAuth2Config config, HttpParams http_params = HttpParams::NoRetry());

    // authorization_code grant with the PKCE verifier of the same attempt
    OAuth2Tokens Exchange(const std::string& authorization_code, const std::string& code_verifier);
    // Same, for an attempt whose listener bound a different port than the configured redirect URI names
    OAuth2Tokens Exchange(const std::string& authorization_code, const std::string& code_verifier,
                          const std::string& redirect_uri);

    // refresh_token grant; keeps the passed refresh token when the response carries none
    OAuth2Tokens Refresh(const std::string& refresh_token);

    // client_credentials grant, for catalog calls that need no user
    OAuth2Tokens RequestClientCredentials();

    const OAuth2Config& Config() const { return config_; }

    // Parses a success body. Throws TokenResponseError when access_token is missing or the JSON is invalid.
    static OAuth2Tokens ParseTokenResponse(const std::string& response_content);

    static std::string BuildFormBody(const std::map<std::string, std::string>& params);

private:
    OAuth2Tokens PostTokenRequest(const std::string& operation, const std::map<std::string, std::string>& params);

    OAuth2Config config_;
    std::unique_ptr<HttpClient> http_client_;
};

} // namespace spotycli
