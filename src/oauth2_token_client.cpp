#include "oauth2_token_client.hpp"
#include "auth_errors.hpp"
#include "spotycli_tracing.hpp"
#include <yyjson.h>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace spotycli {

OAuth2TokenClient::OAuth2TokenClient(OAuth2Config config, HttpParams http_params)
    : config_(std::move(config))
    , http_client_(std::make_unique<HttpClient>(http_params))
{
    SPOTYCLI_TRACE_DEBUG("OAUTH2_TOKEN", "Token client created for " + config_.GetTokenUrl());
}

OAuth2Tokens OAuth2TokenClient::Exchange(const std::string& authorization_code, const std::string& code_verifier) {
    return Exchange(authorization_code, code_verifier, config_.redirect_uri);
}

OAuth2Tokens OAuth2TokenClient::Exchange(const std::string& authorization_code, const std::string& code_verifier,
                                         const std::string& redirect_uri) {
    SPOTYCLI_TRACE_INFO("OAUTH2_TOKEN", "Exchanging authorization code for tokens");

    if (authorization_code.empty()) {
        throw std::invalid_argument("Authorization code cannot be empty");
    }

    if (code_verifier.empty()) {
        throw std::invalid_argument("Code verifier cannot be empty");
    }

    return PostTokenRequest("Token exchange", {
        {"grant_type", GrantTypeToString(GrantType::authorization_code)},
        {"code", authorization_code},
        {"redirect_uri", redirect_uri},
        {"client_id", config_.client_id},
        {"code_verifier", code_verifier}
    });
}

OAuth2Tokens OAuth2TokenClient::Refresh(const std::string& refresh_token) {
    SPOTYCLI_TRACE_INFO("OAUTH2_TOKEN", "Refreshing access token");

    if (refresh_token.empty()) {
        throw std::invalid_argument("Refresh token cannot be empty");
    }

    auto tokens = PostTokenRequest("Token refresh", {
        {"grant_type", GrantTypeToString(GrantType::refresh_token)},
        {"refresh_token", refresh_token}
    });

    // Refresh tokens are not guaranteed to rotate
    if (tokens.refresh_token.empty()) {
        SPOTYCLI_TRACE_DEBUG("OAUTH2_TOKEN", "No refresh token in response, keeping the previous one");
        tokens.refresh_token = refresh_token;
    }

    return tokens;
}

OAuth2Tokens OAuth2TokenClient::RequestClientCredentials() {
    SPOTYCLI_TRACE_INFO("OAUTH2_TOKEN", "Requesting client credentials token");

    return PostTokenRequest("Client credentials request", {
        {"grant_type", GrantTypeToString(GrantType::client_credentials)}
    });
}

std::string OAuth2TokenClient::BuildFormBody(const std::map<std::string, std::string>& params) {
    std::ostringstream post_data;

    bool first = true;
    for (const auto& param : params) {
        if (!first) {
            post_data << "&";
        }
        post_data << OAuth2Utils::UrlEncode(param.first) << "=" << OAuth2Utils::UrlEncode(param.second);
        first = false;
    }

    return post_data.str();
}

OAuth2Tokens OAuth2TokenClient::PostTokenRequest(const std::string& operation,
                                                 const std::map<std::string, std::string>& params) {
    std::string token_url = config_.GetTokenUrl();
    SPOTYCLI_TRACE_DEBUG("OAUTH2_TOKEN", operation + " URL: " + token_url);

    HttpRequest request(HttpMethod::POST, token_url, "application/x-www-form-urlencoded", BuildFormBody(params));
    request.AuthHeadersFromParams(HttpAuthParams::Basic(config_.client_id, config_.client_secret));

    try {
        auto response = http_client_->SendRequest(request);

        if (!response) {
            throw TokenResponseError("No response received from token endpoint");
        }

        SPOTYCLI_TRACE_DEBUG("OAUTH2_TOKEN", operation + " response status: " + std::to_string(response->Code()));

        if (!response->IsSuccess()) {
            // The provider's error body is shown to the user unchanged
            throw TokenEndpointError(operation, response->Code(), response->Content());
        }

        auto tokens = ParseTokenResponse(response->Content());
        SPOTYCLI_TRACE_INFO("OAUTH2_TOKEN", operation + " succeeded");
        return tokens;

    } catch (const std::exception& e) {
        SPOTYCLI_TRACE_ERROR("OAUTH2_TOKEN", operation + " failed: " + std::string(e.what()));
        throw;
    }
}

OAuth2Tokens OAuth2TokenClient::ParseTokenResponse(const std::string& response_content) {
    if (response_content.empty()) {
        throw TokenResponseError("Token response content is empty");
    }

    auto doc = std::shared_ptr<yyjson_doc>(yyjson_read(response_content.c_str(), response_content.size(), 0), yyjson_doc_free);
    if (!doc) {
        throw TokenResponseError("Failed to parse token response JSON");
    }

    auto root = yyjson_doc_get_root(doc.get());
    if (!root || !yyjson_is_obj(root)) {
        throw TokenResponseError("Token response root is not a JSON object");
    }

    OAuth2Tokens tokens;

    auto access_token_val = yyjson_obj_get(root, "access_token");
    if (access_token_val && yyjson_is_str(access_token_val) && yyjson_get_len(access_token_val) > 0) {
        tokens.access_token = yyjson_get_str(access_token_val);
        SPOTYCLI_TRACE_DEBUG("OAUTH2_TOKEN", "Extracted access token: " + TruncateSecret(tokens.access_token, 10));
    } else {
        throw TokenResponseError("Missing or invalid access_token in token response");
    }

    // Absent on most refresh responses
    auto refresh_token_val = yyjson_obj_get(root, "refresh_token");
    if (refresh_token_val && yyjson_is_str(refresh_token_val)) {
        tokens.refresh_token = yyjson_get_str(refresh_token_val);
    }

    auto scope_val = yyjson_obj_get(root, "scope");
    if (scope_val && yyjson_is_str(scope_val)) {
        tokens.scope = yyjson_get_str(scope_val);
        SPOTYCLI_TRACE_DEBUG("OAUTH2_TOKEN", "Extracted scope: " + tokens.scope);
    }

    auto expires_in_val = yyjson_obj_get(root, "expires_in");
    if (expires_in_val && yyjson_is_int(expires_in_val)) {
        if (yyjson_is_uint(expires_in_val) &&
            yyjson_get_uint(expires_in_val) > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw TokenResponseError("expires_in out of range in token response");
        }
        tokens.expires_in = yyjson_get_sint(expires_in_val);
        SPOTYCLI_TRACE_DEBUG("OAUTH2_TOKEN", "Extracted expires_in: " + std::to_string(tokens.expires_in));
    }

    return tokens;
}

} // namespace spotycli
