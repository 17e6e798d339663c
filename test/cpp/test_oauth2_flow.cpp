#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include "oauth2_flow.hpp"
#include "oauth2_browser.hpp"
#include "session_manager.hpp"
#include "auth_errors.hpp"

#include <cstdlib>
#include <future>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <cerrno>
#include <sys/wait.h>
#include <unistd.h>
#endif

using namespace spotycli;
using namespace spotycli::testing;

namespace {

httplib::Params QueryOf(const std::string& url) {
    httplib::Params params;
    auto pos = url.find('?');
    if (pos != std::string::npos) {
        httplib::detail::parse_query_text(url.substr(pos + 1), params);
    }
    return params;
}

std::string Param(const httplib::Params& params, const std::string& key) {
    auto it = params.find(key);
    return it == params.end() ? std::string() : it->second;
}

// Plays the browser: follows the authorization URL straight back to the callback
void Redirect(const std::string& auth_url, const std::string& query) {
    HttpUrl redirect(Param(QueryOf(auth_url), "redirect_uri"));
    httplib::Client client(redirect.Host(), redirect.PortNumber());
    client.set_read_timeout(std::chrono::seconds(5));
    auto res = client.Get(redirect.Path() + "?" + query);
    if (!res) {
        throw std::runtime_error("callback request failed");
    }
}

} // namespace

TEST_CASE("Authorization URL", "[oauth2][flow]") {
    OAuth2Config config;
    config.client_id = "my client";
    config.scope = "user-read-playback-state streaming";

    auto url = OAuth2Flow::BuildAuthorizationUrl(config, "http://127.0.0.1:8888/callback", "CHALLENGE", "STATE");

    REQUIRE(url ==
        "https://accounts.spotify.com/authorize"
        "?client_id=my%20client"
        "&response_type=code"
        "&redirect_uri=http%3A%2F%2F127.0.0.1%3A8888%2Fcallback"
        "&code_challenge_method=S256"
        "&code_challenge=CHALLENGE"
        "&state=STATE"
        "&scope=user-read-playback-state%20streaming");
}

TEST_CASE("Authorization state names", "[oauth2][flow]") {
    REQUIRE(AuthorizationStateToString(AuthorizationState::Idle) == "Idle");
    REQUIRE(AuthorizationStateToString(AuthorizationState::AwaitingCallback) == "AwaitingCallback");
    REQUIRE(AuthorizationStateToString(AuthorizationState::Succeeded) == "Succeeded");
    REQUIRE(AuthorizationStateToString(AuthorizationState::Failed) == "Failed");
}

TEST_CASE("AuthorizationWaiter", "[oauth2][flow]") {
    AuthorizationWaiter waiter;
    std::promise<CallbackResult> promise;
    REQUIRE(waiter.State() == AuthorizationState::Idle);

    SECTION("Matching state yields the code") {
        promise.set_value(CallbackResult::Success("CODE", "S1"));
        REQUIRE(waiter.Await(promise.get_future(), "S1") == "CODE");
        REQUIRE(waiter.State() == AuthorizationState::Succeeded);
    }

    SECTION("Foreign state fails") {
        promise.set_value(CallbackResult::Success("CODE", "S2"));
        REQUIRE_THROWS_AS(waiter.Await(promise.get_future(), "S1"), StateMismatchError);
        REQUIRE(waiter.State() == AuthorizationState::Failed);
    }

    SECTION("Provider error fails with its message") {
        promise.set_value(CallbackResult::Failure("access_denied"));
        REQUIRE_THROWS_WITH(waiter.Await(promise.get_future(), "S1"), "Authentication failed: access_denied");
        REQUIRE(waiter.State() == AuthorizationState::Failed);
    }

    SECTION("Result published from another thread") {
        std::thread publisher([&promise]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            promise.set_value(CallbackResult::Success("LATE", "S1"));
        });
        auto code = waiter.Await(promise.get_future(), "S1");
        publisher.join();
        REQUIRE(code == "LATE");
    }

    SECTION("Optional timeout") {
        REQUIRE_THROWS_AS(waiter.Await(promise.get_future(), "S1", std::chrono::seconds(1)), AuthorizationTimeoutError);
        REQUIRE(waiter.State() == AuthorizationState::Failed);
    }
}

TEST_CASE("Authorization code flow end to end", "[oauth2][flow]") {
    MockTokenServer token_server;
    auto token_client = std::make_shared<OAuth2TokenClient>(TestConfig(token_server.TokenUrl()));
    TempPath session_file("flow_session");
    SessionManager session(token_client, session_file.str());
    OAuth2Flow flow(token_client);
    flow.SetCallbackTimeout(std::chrono::seconds(10));

    SECTION("Valid code and state end in an authenticated session") {
        std::string seen_url;
        flow.SetUrlOpener([&seen_url](const std::string& url) {
            seen_url = url;
            auto query = QueryOf(url);
            Redirect(url, "code=AQB-code&state=" + Param(query, "state"));
        });

        session.Login(flow);

        REQUIRE(session.CurrentAccessToken().value() == "A");
        REQUIRE(flow.LastState() == AuthorizationState::Succeeded);
        REQUIRE_FALSE(flow.InProgress());

        auto query = QueryOf(seen_url);
        REQUIRE(Param(query, "client_id") == "test_client");
        REQUIRE(Param(query, "response_type") == "code");
        REQUIRE(Param(query, "code_challenge_method") == "S256");

        // The exchange proves possession of the verifier behind the published challenge
        REQUIRE(token_server.CallCount() == 1);
        REQUIRE(token_server.LastCode() == "AQB-code");
        REQUIRE(OAuth2Utils::GenerateCodeChallenge(token_server.LastCodeVerifier()) == Param(query, "code_challenge"));
        REQUIRE(token_server.LastRedirectUri() == Param(query, "redirect_uri"));

        SessionManager restored(token_client, session_file.str());
        REQUIRE(restored.Load());
        REQUIRE(restored.CurrentTokens().value() == session.CurrentTokens().value());
    }

    SECTION("State mismatch never reaches the token endpoint") {
        flow.SetUrlOpener([](const std::string& url) {
            Redirect(url, "code=AQB-code&state=forged");
        });

        REQUIRE_THROWS_AS(session.Login(flow), StateMismatchError);
        REQUIRE(token_server.CallCount() == 0);
        REQUIRE(flow.LastState() == AuthorizationState::Failed);
        REQUIRE_FALSE(session.IsAuthenticated());
    }

    SECTION("Denied authorization reports the provider error") {
        flow.SetUrlOpener([](const std::string& url) {
            Redirect(url, "error=access_denied&state=" + Param(QueryOf(url), "state"));
        });

        try {
            flow.Authenticate();
            FAIL("Expected AuthorizationDeniedError");
        } catch (const AuthorizationDeniedError& e) {
            REQUIRE(e.ProviderError() == "access_denied");
            REQUIRE(std::string(e.what()) == "Authentication failed: access_denied");
        }
        REQUIRE(token_server.CallCount() == 0);
        REQUIRE(flow.LastState() == AuthorizationState::Failed);
    }

    SECTION("Token endpoint failure propagates") {
        token_server.Respond(400, R"({"error":"invalid_grant"})");
        flow.SetUrlOpener([](const std::string& url) {
            Redirect(url, "code=expired&state=" + Param(QueryOf(url), "state"));
        });

        REQUIRE_THROWS_AS(session.Login(flow), TokenEndpointError);
        REQUIRE_FALSE(session.IsAuthenticated());
        REQUIRE_FALSE(flow.InProgress());
    }

    SECTION("Browser failure falls back to printing the URL") {
        flow.SetCallbackTimeout(std::chrono::seconds(1));
        flow.SetUrlOpener([](const std::string&) {
            throw std::runtime_error("no browser");
        });

        std::stringstream buffer;
        std::streambuf* old_cout = std::cout.rdbuf(buffer.rdbuf());
        REQUIRE_THROWS_AS(flow.Authenticate(), AuthorizationTimeoutError);
        std::cout.rdbuf(old_cout);

        REQUIRE(buffer.str().find("https://accounts.example.com/authorize?client_id=test_client") != std::string::npos);
        REQUIRE(token_server.CallCount() == 0);
    }

    SECTION("A second attempt during the first is rejected") {
        bool rejected = false;
        flow.SetUrlOpener([&flow, &rejected](const std::string& url) {
            REQUIRE(flow.InProgress());
            try {
                flow.Authenticate();
            } catch (const AuthFlowBusyError&) {
                rejected = true;
            }
            Redirect(url, "code=AQB-code&state=" + Param(QueryOf(url), "state"));
        });

        auto tokens = flow.Authenticate();
        REQUIRE(rejected);
        REQUIRE(tokens.access_token == "A");
        REQUIRE(token_server.CallCount() == 1);
    }

    SECTION("Each attempt uses fresh PKCE parameters") {
        std::vector<std::string> states;
        std::vector<std::string> challenges;
        flow.SetUrlOpener([&states, &challenges](const std::string& url) {
            auto query = QueryOf(url);
            states.push_back(Param(query, "state"));
            challenges.push_back(Param(query, "code_challenge"));
            Redirect(url, "code=c&state=" + Param(query, "state"));
        });

        flow.Authenticate();
        flow.Authenticate();

        REQUIRE(states.size() == 2);
        REQUIRE(states[0] != states[1]);
        REQUIRE(challenges[0] != challenges[1]);
    }
}

#if !defined(_WIN32) && !defined(__APPLE__)
namespace {

// Removes the variables that announce a graphical session, restoring them afterwards
class HeadlessEnvironment {
public:
    HeadlessEnvironment() {
        for (const char* name : {"BROWSER", "DISPLAY", "WAYLAND_DISPLAY"}) {
            if (const char* value = std::getenv(name)) {
                saved_.emplace_back(name, value);
            }
            unsetenv(name);
        }
    }
    ~HeadlessEnvironment() {
        for (const auto& entry : saved_) {
            setenv(entry.first.c_str(), entry.second.c_str(), 1);
        }
    }

private:
    std::vector<std::pair<std::string, std::string>> saved_;
};

} // namespace

TEST_CASE("Browser launcher without a graphical session", "[oauth2][browser]") {
    HeadlessEnvironment headless;

    REQUIRE_FALSE(OAuth2Browser::HasGraphicalSession());
    REQUIRE(OAuth2Browser::LauncherCommand() == "xdg-open");
    REQUIRE_THROWS_AS(OAuth2Browser::OpenUrl("https://accounts.example.com/authorize"), std::runtime_error);

    SECTION("$BROWSER names the launcher") {
        setenv("BROWSER", "spotycli-test-no-such-browser", 1);
        REQUIRE(OAuth2Browser::HasGraphicalSession());
        REQUIRE(OAuth2Browser::LauncherCommand() == "spotycli-test-no-such-browser");
        REQUIRE_THROWS_WITH(OAuth2Browser::OpenUrl("https://accounts.example.com/authorize"),
                            Catch::Contains("not found"));
        unsetenv("BROWSER");
    }

    SECTION("A running launcher is detached from this process") {
        // sleep stands in for a browser that keeps running; its argument is the "URL"
        setenv("BROWSER", "sleep", 1);
        REQUIRE_NOTHROW(OAuth2Browser::OpenUrl("1"));
        unsetenv("BROWSER");

        // As PID 1 the orphaned launcher is reparented to this process itself
        if (getpid() == 1) {
            return;
        }
        int status = 0;
        errno = 0;
        pid_t reaped = waitpid(-1, &status, WNOHANG);
        int wait_errno = errno;
        REQUIRE(reaped == -1);
        REQUIRE(wait_errno == ECHILD);
    }

    SECTION("Default opener falls back to printing the URL") {
        MockTokenServer token_server;
        OAuth2Flow flow(std::make_shared<OAuth2TokenClient>(TestConfig(token_server.TokenUrl())));
        flow.SetCallbackTimeout(std::chrono::seconds(1));

        std::stringstream buffer;
        std::streambuf* old_cout = std::cout.rdbuf(buffer.rdbuf());
        REQUIRE_THROWS_AS(flow.Authenticate(), AuthorizationTimeoutError);
        std::cout.rdbuf(old_cout);

        REQUIRE(buffer.str().find("Open this URL in your browser") != std::string::npos);
        REQUIRE(buffer.str().find("code_challenge_method=S256") != std::string::npos);
    }
}
#endif
