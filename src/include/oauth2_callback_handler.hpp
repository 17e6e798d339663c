#pragma once

#include "oauth2_types.hpp"
#include <future>
#include <mutex>
#include <string>

namespace spotycli {

// One-shot handoff between the callback listener and the authorization waiter.
// The first published result wins; later publications are ignored.
class OAuth2CallbackHandler {
public:
    OAuth2CallbackHandler();
    ~OAuth2CallbackHandler() = default;

    // Non-copyable, non-movable
    OAuth2CallbackHandler(const OAuth2CallbackHandler&) = delete;
    OAuth2CallbackHandler& operator=(const OAuth2CallbackHandler&) = delete;
    OAuth2CallbackHandler(OAuth2CallbackHandler&&) = delete;
    OAuth2CallbackHandler& operator=(OAuth2CallbackHandler&&) = delete;

    // Returns false when a result was already published
    bool HandleCallback(const std::string& code, const std::string& state);
    bool HandleError(const std::string& error);

    // May be called once; the future becomes ready on the first publication
    std::future<CallbackResult> GetFuture();

    bool IsPublished() const;

private:
    bool Publish(CallbackResult result);

    std::promise<CallbackResult> promise_;
    bool published_ = false;
    mutable std::mutex mutex_;
};

} // namespace spotycli
