#include "oauth2_callback_handler.hpp"
#include "spotycli_tracing.hpp"

namespace spotycli {

OAuth2CallbackHandler::OAuth2CallbackHandler() = default;

bool OAuth2CallbackHandler::HandleCallback(const std::string& code, const std::string& state) {
    SPOTYCLI_TRACE_INFO("OAUTH2_CALLBACK", "Received callback with code=" + TruncateSecret(code, 10) + " state=" + TruncateSecret(state));
    return Publish(CallbackResult::Success(code, state));
}

bool OAuth2CallbackHandler::HandleError(const std::string& error) {
    SPOTYCLI_TRACE_WARN("OAUTH2_CALLBACK", "Received error: " + error);
    return Publish(CallbackResult::Failure(error));
}

std::future<CallbackResult> OAuth2CallbackHandler::GetFuture() {
    std::lock_guard<std::mutex> lock(mutex_);
    return promise_.get_future();
}

bool OAuth2CallbackHandler::IsPublished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

bool OAuth2CallbackHandler::Publish(CallbackResult result) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (published_) {
        SPOTYCLI_TRACE_DEBUG("OAUTH2_CALLBACK", "Result already published, ignoring later callback");
        return false;
    }

    promise_.set_value(std::move(result));
    published_ = true;

    SPOTYCLI_TRACE_DEBUG("OAUTH2_CALLBACK", "Published callback result to waiter");
    return true;
}

} // namespace spotycli
