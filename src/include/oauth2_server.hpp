#pragma once

#include "oauth2_types.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <thread>

// Forward declaration
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace spotycli {

// Forward declaration
class OAuth2CallbackHandler;

// Loopback HTTP listener that accepts the single OAuth2 redirect.
// Start() binds synchronously so a busy port is reported before the browser opens.
class OAuth2Server {
public:
    OAuth2Server(std::string host, int port, std::string callback_path = "/callback");
    ~OAuth2Server();

    // Non-copyable, non-movable
    OAuth2Server(const OAuth2Server&) = delete;
    OAuth2Server& operator=(const OAuth2Server&) = delete;
    OAuth2Server(OAuth2Server&&) = delete;
    OAuth2Server& operator=(OAuth2Server&&) = delete;

    // Throws ListenerBindError when the host/port cannot be bound.
    // Port 0 binds an ephemeral port, available afterwards through GetPort().
    void Start();

    // Stops the listener and joins its thread. Safe to call repeatedly.
    void Stop();

    // Ready once the first meaningful callback arrived. Call once per server.
    std::future<CallbackResult> GetResultFuture();

    bool IsRunning() const { return running_.load(); }
    int GetPort() const { return port_; }
    const std::string& GetHost() const { return host_; }
    const std::string& GetCallbackPath() const { return callback_path_; }

private:
    void HandleCallbackRequest(const httplib::Request& req, httplib::Response& res);

    std::string host_;
    int port_;
    std::string callback_path_;
    std::atomic<bool> running_{false};
    std::atomic<bool> accept_loop_done_{false};
    std::unique_ptr<OAuth2CallbackHandler> callback_handler_;
    std::unique_ptr<httplib::Server> server_instance_;
    std::thread server_thread_;
};

} // namespace spotycli
