#include "oauth2_flow.hpp"
#include "oauth2_browser.hpp"
#include "oauth2_server.hpp"
#include "auth_errors.hpp"
#include "spotycli_http_client.hpp"
#include "spotycli_tracing.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace spotycli {

std::string AuthorizationStateToString(AuthorizationState state) {
    switch (state) {
        case AuthorizationState::Idle: return "Idle";
        case AuthorizationState::AwaitingCallback: return "AwaitingCallback";
        case AuthorizationState::Succeeded: return "Succeeded";
        case AuthorizationState::Failed: return "Failed";
        default: return "Unknown";
    }
}

std::string AuthorizationWaiter::Await(std::future<CallbackResult> result,
                                       const std::string& expected_state,
                                       std::optional<std::chrono::seconds> timeout) {
    state_.store(AuthorizationState::AwaitingCallback);
    SPOTYCLI_TRACE_INFO("OAUTH2_WAITER", "Waiting for authorization callback");

    if (timeout.has_value()) {
        if (result.wait_for(*timeout) != std::future_status::ready) {
            state_.store(AuthorizationState::Failed);
            SPOTYCLI_TRACE_ERROR("OAUTH2_WAITER", "No callback within " + std::to_string(timeout->count()) + "s");
            throw AuthorizationTimeoutError(timeout->count());
        }
    }

    CallbackResult callback = result.get();

    if (callback.IsError()) {
        state_.store(AuthorizationState::Failed);
        SPOTYCLI_TRACE_ERROR("OAUTH2_WAITER", "Authorization failed: " + *callback.error);
        throw AuthorizationDeniedError(*callback.error);
    }

    if (!callback.code.has_value() ||
        !OAuth2Utils::ValidateState(callback.returned_state.value_or(""), expected_state)) {
        state_.store(AuthorizationState::Failed);
        SPOTYCLI_TRACE_ERROR("OAUTH2_WAITER", "Callback state does not match this attempt");
        throw StateMismatchError();
    }

    state_.store(AuthorizationState::Succeeded);
    SPOTYCLI_TRACE_INFO("OAUTH2_WAITER", "Received authorization code: " + TruncateSecret(*callback.code, 10));
    return *callback.code;
}

namespace {

// Clears the busy flag however the attempt ends
class InProgressGuard {
public:
    explicit InProgressGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InProgressGuard() { flag_.store(false); }

    InProgressGuard(const InProgressGuard&) = delete;
    InProgressGuard& operator=(const InProgressGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

OAuth2Flow::OAuth2Flow(std::shared_ptr<OAuth2TokenClient> token_client)
    : token_client_(std::move(token_client))
    , url_opener_([](const std::string& url) { OAuth2Browser::OpenUrl(url); })
{
    if (!token_client_) {
        throw std::invalid_argument("OAuth2 flow requires a token client");
    }
    SPOTYCLI_TRACE_DEBUG("OAUTH2_FLOW", "Created authorization code flow");
}

OAuth2Flow::~OAuth2Flow() = default;

void OAuth2Flow::SetUrlOpener(UrlOpener opener) {
    url_opener_ = std::move(opener);
}

void OAuth2Flow::SetCallbackTimeout(std::optional<std::chrono::seconds> timeout) {
    callback_timeout_ = timeout;
}

OAuth2Tokens OAuth2Flow::Authenticate() {
    bool expected = false;
    if (!in_progress_.compare_exchange_strong(expected, true)) {
        SPOTYCLI_TRACE_WARN("OAUTH2_FLOW", "Rejected concurrent authentication attempt");
        throw AuthFlowBusyError();
    }
    InProgressGuard guard(in_progress_);

    const auto& config = token_client_->Config();
    config.Validate();

    SPOTYCLI_TRACE_INFO("OAUTH2_FLOW", "Starting authorization code flow");
    last_state_.store(AuthorizationState::Idle);

    try {
        auto pkce = OAuth2Utils::GeneratePkce();
        SPOTYCLI_TRACE_DEBUG("OAUTH2_FLOW", "Generated code verifier: " + TruncateSecret(pkce.verifier, 10));

        // Bind before the browser is involved so a busy port fails fast
        OAuth2Server server(config.GetCallbackHost(), config.GetCallbackPort(), config.GetCallbackPath());
        auto result = server.GetResultFuture();
        server.Start();

        std::string redirect_uri = config.redirect_uri;
        if (config.GetCallbackPort() == 0) {
            HttpUrl bound(redirect_uri);
            bound.Port(std::to_string(server.GetPort()));
            redirect_uri = bound.ToString();
            SPOTYCLI_TRACE_DEBUG("OAUTH2_FLOW", "Using ephemeral redirect URI: " + redirect_uri);
        }

        auto auth_url = BuildAuthorizationUrl(config, redirect_uri, pkce.challenge, pkce.state);

        AuthorizationWaiter waiter;
        last_state_.store(AuthorizationState::AwaitingCallback);
        OpenBrowser(auth_url);

        std::string code;
        try {
            code = waiter.Await(std::move(result), pkce.state, callback_timeout_);
        } catch (const AuthError&) {
            last_state_.store(waiter.State());
            throw;
        }
        last_state_.store(waiter.State());

        server.Stop();

        auto tokens = token_client_->Exchange(code, pkce.verifier, redirect_uri);
        SPOTYCLI_TRACE_INFO("OAUTH2_FLOW", "Flow completed successfully");
        return tokens;

    } catch (const std::exception& e) {
        SPOTYCLI_TRACE_ERROR("OAUTH2_FLOW", "Flow failed in state " + AuthorizationStateToString(last_state_.load()) +
                             ": " + std::string(e.what()));
        throw;
    }
}

std::string OAuth2Flow::BuildAuthorizationUrl(const OAuth2Config& config,
                                              const std::string& redirect_uri,
                                              const std::string& code_challenge,
                                              const std::string& state) {
    std::ostringstream auth_url;
    auth_url << config.GetAuthorizationUrl()
             << "?client_id=" << OAuth2Utils::UrlEncode(config.client_id)
             << "&response_type=code"
             << "&redirect_uri=" << OAuth2Utils::UrlEncode(redirect_uri)
             << "&code_challenge_method=S256"
             << "&code_challenge=" << OAuth2Utils::UrlEncode(code_challenge)
             << "&state=" << OAuth2Utils::UrlEncode(state)
             << "&scope=" << OAuth2Utils::UrlEncode(config.scope);

    return auth_url.str();
}

void OAuth2Flow::OpenBrowser(const std::string& url) {
    SPOTYCLI_TRACE_INFO("OAUTH2_FLOW", "Opening browser for authorization");

    if (!url_opener_) {
        DisplayAuthorizationInstructions(url);
        return;
    }

    try {
        url_opener_(url);
        SPOTYCLI_TRACE_INFO("OAUTH2_FLOW", "Browser opened successfully");
    } catch (const std::exception& e) {
        SPOTYCLI_TRACE_WARN("OAUTH2_FLOW", "Failed to open browser automatically: " + std::string(e.what()));
        DisplayAuthorizationInstructions(url);
    }
}

void OAuth2Flow::DisplayAuthorizationInstructions(const std::string& auth_url) {
    std::cout << "Open this URL in your browser to authorize spotycli:" << std::endl
              << auth_url << std::endl;
}

} // namespace spotycli
