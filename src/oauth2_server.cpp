#include "oauth2_server.hpp"
#include "oauth2_callback_handler.hpp"
#include "auth_errors.hpp"
#include "spotycli_tracing.hpp"
#include <chrono>
#include <stdexcept>
#include <string>

// Windows headers define min/max macros that conflict with C++ std:: functions
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

namespace spotycli {

namespace {

std::string HtmlEscape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&#39;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

std::string RenderPage(const std::string& title, const std::string& body_html, bool success) {
    const std::string accent = success ? "#1db954" : "#e53e3e";
    return
        "<!DOCTYPE html>"
        "<html>"
        "<head>"
        "<title>" + title + "</title>"
        "<meta charset='utf-8'>"
        "<style>"
        "body { font-family: -apple-system, BlinkMacSystemFont, 'Segoe UI', Roboto, sans-serif; background: #121212; margin: 0; padding: 0; min-height: 100vh; display: flex; align-items: center; justify-content: center; }"
        ".container { background: white; border-radius: 20px; border-top: 6px solid " + accent + "; padding: 40px; text-align: center; max-width: 500px; margin: 20px; }"
        "h1 { color: " + accent + "; margin-bottom: 20px; font-size: 28px; }"
        ".message { color: #4a5568; font-size: 16px; line-height: 1.6; }"
        "</style>"
        "</head>"
        "<body>"
        "<div class='container'>"
        "<h1>" + title + "</h1>"
        "<div class='message'>" + body_html + "</div>"
        "</div>"
        "</body>"
        "</html>";
}

// Browser retries, reloads, or a callback that lost the race to publish
void RenderAlreadyCompleted(httplib::Response& res) {
    res.set_content(RenderPage("Authentication Already Completed",
                               "<p>You can close this window.</p>", true),
                    "text/html");
}

} // namespace

OAuth2Server::OAuth2Server(std::string host, int port, std::string callback_path)
    : host_(std::move(host)), port_(port), callback_path_(std::move(callback_path)) {
    callback_handler_ = std::make_unique<OAuth2CallbackHandler>();
    SPOTYCLI_TRACE_INFO("OAUTH2_SERVER", "Created callback listener for " + host_ + ":" + std::to_string(port_) + callback_path_);
}

OAuth2Server::~OAuth2Server() {
    Stop();
}

std::future<CallbackResult> OAuth2Server::GetResultFuture() {
    return callback_handler_->GetFuture();
}

void OAuth2Server::Start() {
    if (running_.load()) {
        throw std::logic_error("OAuth2 callback listener already started");
    }

    server_instance_ = std::make_unique<httplib::Server>();

    // Exclusive bind: httplib's defaults add SO_REUSEPORT, which lets a second
    // listener share the port and receive the redirect meant for this one
    server_instance_->set_socket_options([](socket_t sock) {
#ifdef _WIN32
        BOOL exclusive = TRUE;
        if (setsockopt(sock, SOL_SOCKET, SO_EXCLUSIVEADDRUSE,
                       reinterpret_cast<const char*>(&exclusive), sizeof(exclusive)) != 0) {
            SPOTYCLI_TRACE_WARN("OAUTH2_SERVER", "Could not set SO_EXCLUSIVEADDRUSE on callback socket");
        }
#else
        int reuse = 1;
        if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
            SPOTYCLI_TRACE_WARN("OAUTH2_SERVER", "Could not set SO_REUSEADDR on callback socket");
        }
#endif
    });

    server_instance_->Get(callback_path_, [this](const httplib::Request& req, httplib::Response& res) {
        HandleCallbackRequest(req, res);
    });

    if (port_ == 0) {
        auto bound_port = server_instance_->bind_to_any_port(host_);
        if (bound_port <= 0) {
            server_instance_.reset();
            throw ListenerBindError(host_, port_);
        }
        port_ = bound_port;
    } else if (!server_instance_->bind_to_port(host_, port_)) {
        SPOTYCLI_TRACE_ERROR("OAUTH2_SERVER", "Failed to bind " + host_ + ":" + std::to_string(port_));
        server_instance_.reset();
        throw ListenerBindError(host_, port_);
    }

    running_.store(true);
    SPOTYCLI_TRACE_INFO("OAUTH2_SERVER", "Listening on " + host_ + ":" + std::to_string(port_));

    // httplib handles requests on its own worker pool; this thread only runs the accept loop
    accept_loop_done_.store(false);
    server_thread_ = std::thread([this]() {
        if (!server_instance_->listen_after_bind()) {
            SPOTYCLI_TRACE_DEBUG("OAUTH2_SERVER", "Accept loop ended");
        }
        accept_loop_done_.store(true);
    });

    // stop() is a no-op until the accept loop runs
    constexpr int max_wait_ms = 5000;
    int waited_ms = 0;
    while (!server_instance_->is_running() && !accept_loop_done_.load() && waited_ms < max_wait_ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        waited_ms += 1;
    }

    if (!server_instance_->is_running()) {
        Stop();
        throw ListenerBindError(host_, port_);
    }
}

void OAuth2Server::Stop() {
    if (!server_instance_) {
        return;
    }

    SPOTYCLI_TRACE_INFO("OAUTH2_SERVER", "Stopping server...");
    running_.store(false);
    server_instance_->stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    server_instance_.reset();
    SPOTYCLI_TRACE_INFO("OAUTH2_SERVER", "Server stopped");
}

void OAuth2Server::HandleCallbackRequest(const httplib::Request& req, httplib::Response& res) {
    SPOTYCLI_TRACE_DEBUG("OAUTH2_SERVER", "Received HTTP request: " + req.path);

    if (req.has_param("error")) {
        auto error = req.get_param_value("error");
        auto description = req.get_param_value("error_description");
        SPOTYCLI_TRACE_WARN("OAUTH2_SERVER", "Received OAuth error: " + error + (description.empty() ? "" : " - " + description));

        if (!callback_handler_->HandleError(error)) {
            RenderAlreadyCompleted(res);
            return;
        }
        res.set_content(RenderPage("Authentication Failed",
                                   "<p>" + HtmlEscape(error) + "</p><p>You can close this window.</p>", false),
                        "text/html");
        return;
    }

    if (req.has_param("code") && req.has_param("state")) {
        if (!callback_handler_->HandleCallback(req.get_param_value("code"), req.get_param_value("state"))) {
            RenderAlreadyCompleted(res);
            return;
        }
        res.set_content(RenderPage("Authentication Successful!",
                                   "<p>You can close this window and return to spotycli.</p>", true),
                        "text/html");
        return;
    }

    if (!callback_handler_->HandleError("Missing authorization code")) {
        RenderAlreadyCompleted(res);
        return;
    }
    res.set_content(RenderPage("Authentication Failed",
                               "<p>Missing authorization code. You can close this window.</p>", false),
                    "text/html");
}

} // namespace spotycli
