#pragma once

#include "oauth2_types.hpp"
#include "oauth2_token_client.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace spotycli {

enum class AuthorizationState {
    Idle,
    AwaitingCallback,
    Succeeded,
    Failed
};

std::string AuthorizationStateToString(AuthorizationState state);

// Waits for the one callback result of an attempt and decides whether its code may be exchanged.
// A published error or a foreign state never reaches the token endpoint.
class AuthorizationWaiter {
public:
    AuthorizationWaiter() = default;

    // Returns the authorization code once the result is published and the state matches.
    // Throws AuthorizationDeniedError, StateMismatchError or AuthorizationTimeoutError.
    std::string Await(std::future<CallbackResult> result,
                      const std::string& expected_state,
                      std::optional<std::chrono::seconds> timeout = std::nullopt);

    AuthorizationState State() const { return state_.load(); }

private:
    std::atomic<AuthorizationState> state_{AuthorizationState::Idle};
};

// Runs one Authorization Code + PKCE attempt: listener, browser, waiter, exchange.
class OAuth2Flow {
public:
    using UrlOpener = std::function<void(const std::string&)>;

    explicit OAuth2Flow(std::shared_ptr<OAuth2TokenClient> token_client);
    ~OAuth2Flow();

    OAuth2Tokens Authenticate();

    // Defaults to the platform browser. A throwing opener falls back to printing the URL.
    void SetUrlOpener(UrlOpener opener);
    void SetCallbackTimeout(std::optional<std::chrono::seconds> timeout);

    bool InProgress() const { return in_progress_.load(); }
    AuthorizationState LastState() const { return last_state_.load(); }

    static std::string BuildAuthorizationUrl(const OAuth2Config& config,
                                             const std::string& redirect_uri,
                                             const std::string& code_challenge,
                                             const std::string& state);

private:
    void OpenBrowser(const std::string& url);
    void DisplayAuthorizationInstructions(const std::string& auth_url);

    std::shared_ptr<OAuth2TokenClient> token_client_;
    UrlOpener url_opener_;
    std::optional<std::chrono::seconds> callback_timeout_;
    std::atomic<bool> in_progress_{false};
    std::atomic<AuthorizationState> last_state_{AuthorizationState::Idle};
};

} // namespace spotycli
