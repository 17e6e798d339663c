#include "auth_errors.hpp"
#include "oauth2_flow.hpp"
#include "oauth2_token_client.hpp"
#include "session_manager.hpp"
#include "spotycli_config.hpp"
#include "spotycli_tracing.hpp"
#include <iostream>
#include <memory>
#include <string>

using namespace spotycli;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

void PrintUsage(std::ostream& out) {
    out << "Usage: spotycli-auth <command>" << std::endl
        << std::endl
        << "Commands:" << std::endl
        << "  login      Authorize spotycli in the browser and save the session" << std::endl
        << "  status     Show the saved session" << std::endl
        << "  refresh    Refresh the saved access token" << std::endl
        << "  logout     Delete the saved session" << std::endl
        << "  app-token  Request an application token (no user session)" << std::endl;
}

int RunLogin(const SpotycliConfig& config) {
    config.oauth2.Validate();

    auto token_client = std::make_shared<OAuth2TokenClient>(config.oauth2, config.TokenHttpParams());
    SessionManager session(token_client, config.session_file);
    OAuth2Flow flow(token_client);
    flow.SetCallbackTimeout(config.callback_timeout);

    std::cout << "Waiting for authorization on " << config.oauth2.redirect_uri << " ..." << std::endl;
    auto tokens = session.Login(flow);

    std::cout << "Authentication successful! Session saved to " << session.SessionFile() << std::endl;
    std::cout << "Access token expires in " << tokens.expires_in << " seconds" << std::endl;
    return EXIT_OK;
}

int RunStatus(const SpotycliConfig& config) {
    SessionManager session(nullptr, config.session_file);
    if (!session.Load()) {
        std::cout << "Not logged in (no session in " << config.session_file << ")" << std::endl;
        return EXIT_FAILED;
    }

    auto tokens = session.CurrentTokens();
    std::cout << "Logged in (session file " << config.session_file << ")" << std::endl;
    std::cout << "  scope:      " << (tokens->scope.empty() ? "(none)" : tokens->scope) << std::endl;
    std::cout << "  expires_in: " << tokens->expires_in << std::endl;
    std::cout << "  refresh:    " << (tokens->refresh_token.empty() ? "no" : "yes") << std::endl;
    return EXIT_OK;
}

int RunRefresh(const SpotycliConfig& config) {
    config.oauth2.Validate();

    auto token_client = std::make_shared<OAuth2TokenClient>(config.oauth2, config.TokenHttpParams());
    SessionManager session(token_client, config.session_file);
    if (!session.Load()) {
        throw NotAuthenticatedError();
    }

    auto tokens = session.Refresh();
    std::cout << "Access token refreshed, expires in " << tokens.expires_in << " seconds" << std::endl;
    return EXIT_OK;
}

int RunLogout(const SpotycliConfig& config) {
    SessionManager session(nullptr, config.session_file);
    session.Clear();
    std::cout << "Logged out" << std::endl;
    return EXIT_OK;
}

int RunAppToken(const SpotycliConfig& config) {
    config.oauth2.Validate();

    OAuth2TokenClient token_client(config.oauth2, config.TokenHttpParams());
    auto tokens = token_client.RequestClientCredentials();
    std::cout << "Application token issued, expires in " << tokens.expires_in << " seconds" << std::endl;
    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 2) {
        PrintUsage(std::cerr);
        return EXIT_USAGE;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        PrintUsage(std::cout);
        return EXIT_OK;
    }

    try {
        SpotycliConfig::LoadDotEnv();
        auto config = SpotycliConfig::FromEnvironment();
        config.ApplyTracing();

        if (command == "login") {
            return RunLogin(config);
        } else if (command == "status") {
            return RunStatus(config);
        } else if (command == "refresh") {
            return RunRefresh(config);
        } else if (command == "logout") {
            return RunLogout(config);
        } else if (command == "app-token") {
            return RunAppToken(config);
        }

        std::cerr << "Unknown command: " << command << std::endl;
        PrintUsage(std::cerr);
        return EXIT_USAGE;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return EXIT_FAILED;
    } catch (const std::exception& e) {
        SPOTYCLI_TRACE_ERROR("CLI", std::string(command) + " failed: " + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILED;
    }
}
