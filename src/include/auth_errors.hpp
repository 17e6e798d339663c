#pragma once

#include <stdexcept>
#include <string>

namespace spotycli {

// Base class for every failure reported by the authentication broker and
// the session manager. Callers that only need to show a message can catch this.
class AuthError : public std::runtime_error {
public:
    explicit AuthError(const std::string& message) : std::runtime_error(message) {}
};

// The callback listener could not bind its loopback port. The attempt never started.
class ListenerBindError : public AuthError {
public:
    ListenerBindError(const std::string& host, int port)
        : AuthError("Failed to bind OAuth2 callback listener on " + host + ":" + std::to_string(port) +
                    " (is the port already in use?)"),
          host_(host), port_(port) {}

    const std::string& Host() const { return host_; }
    int Port() const { return port_; }

private:
    std::string host_;
    int port_;
};

// The provider redirected back with an error parameter (for example access_denied)
class AuthorizationDeniedError : public AuthError {
public:
    explicit AuthorizationDeniedError(const std::string& provider_error)
        : AuthError("Authentication failed: " + provider_error), provider_error_(provider_error) {}

    const std::string& ProviderError() const { return provider_error_; }

private:
    std::string provider_error_;
};

class StateMismatchError : public AuthError {
public:
    StateMismatchError() : AuthError("State mismatch in OAuth callback") {}
};

class AuthorizationTimeoutError : public AuthError {
public:
    explicit AuthorizationTimeoutError(long long seconds)
        : AuthError("Timed out after " + std::to_string(seconds) + "s waiting for the OAuth2 callback") {}
};

class AuthFlowBusyError : public AuthError {
public:
    AuthFlowBusyError() : AuthError("An authentication attempt is already in progress") {}
};

// The token endpoint answered with a non-success status. The body is kept verbatim.
class TokenEndpointError : public AuthError {
public:
    TokenEndpointError(const std::string& operation, int status, const std::string& body)
        : AuthError(operation + " failed: " + body), status_(status), body_(body) {}

    int Status() const { return status_; }
    const std::string& Body() const { return body_; }

private:
    int status_;
    std::string body_;
};

// The token endpoint answered with success but the payload is unusable
class TokenResponseError : public AuthError {
public:
    explicit TokenResponseError(const std::string& message) : AuthError(message) {}
};

class NotAuthenticatedError : public AuthError {
public:
    NotAuthenticatedError() : AuthError("User not authenticated") {}
};

class SessionStoreError : public AuthError {
public:
    SessionStoreError(const std::string& path, const std::string& reason)
        : AuthError("Failed to write session file " + path + ": " + reason) {}
};

} // namespace spotycli
