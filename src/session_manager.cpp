#include "session_manager.hpp"
#include "oauth2_flow.hpp"
#include "auth_errors.hpp"
#include "spotycli_tracing.hpp"
#include <yyjson.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <sstream>
#include <system_error>

namespace spotycli {

SessionManager::SessionManager(std::shared_ptr<OAuth2TokenClient> token_client, std::string session_file)
    : token_client_(std::move(token_client))
    , session_file_(std::move(session_file))
{
    SPOTYCLI_TRACE_DEBUG("SESSION", "Session file: " + session_file_);
}

void SessionManager::SetTokens(const OAuth2Tokens& tokens) {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    tokens_ = tokens;
    SPOTYCLI_TRACE_DEBUG("SESSION", "Installed access token " + TruncateSecret(tokens.access_token));
}

std::optional<std::string> SessionManager::CurrentAccessToken() const {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    if (!tokens_ || tokens_->access_token.empty()) {
        return std::nullopt;
    }
    return tokens_->access_token;
}

std::optional<OAuth2Tokens> SessionManager::CurrentTokens() const {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    return tokens_;
}

bool SessionManager::IsAuthenticated() const {
    return CurrentAccessToken().has_value();
}

OAuth2Tokens SessionManager::Login(OAuth2Flow& flow) {
    auto tokens = flow.Authenticate();
    SetTokens(tokens);
    SaveTokens(tokens);
    SPOTYCLI_TRACE_INFO("SESSION", "Login completed, session saved to " + session_file_);
    return tokens;
}

bool SessionManager::Load() {
    std::ifstream file(session_file_);
    if (!file.is_open()) {
        SPOTYCLI_TRACE_DEBUG("SESSION", "No session file at " + session_file_);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto tokens = DeserializeTokens(buffer.str());
    if (!tokens) {
        SPOTYCLI_TRACE_WARN("SESSION", "Ignoring malformed session file " + session_file_);
        return false;
    }

    SetTokens(*tokens);
    SPOTYCLI_TRACE_INFO("SESSION", "Restored session from " + session_file_);
    return true;
}

void SessionManager::Save() const {
    auto tokens = CurrentTokens();
    if (!tokens) {
        throw NotAuthenticatedError();
    }
    SaveTokens(*tokens);
}

void SessionManager::SaveTokens(const OAuth2Tokens& tokens) const {
    namespace fs = std::filesystem;

    auto content = SerializeTokens(tokens);
    auto tmp_path = session_file_ + ".tmp";

    {
        std::ofstream file(tmp_path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw SessionStoreError(session_file_, "cannot open " + tmp_path + " for writing");
        }
        file << content;
        file.flush();
        if (!file) {
            throw SessionStoreError(session_file_, "write failed");
        }
    }

    std::error_code ec;
    fs::permissions(tmp_path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec) {
        SPOTYCLI_TRACE_WARN("SESSION", "Could not restrict session file permissions: " + ec.message());
    }

    fs::rename(tmp_path, session_file_, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        throw SessionStoreError(session_file_, "rename failed");
    }

    SPOTYCLI_TRACE_DEBUG("SESSION", "Saved session to " + session_file_);
}

OAuth2Tokens SessionManager::Refresh() {
    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);

    auto current = CurrentTokens();
    if (!current || current->refresh_token.empty()) {
        SPOTYCLI_TRACE_WARN("SESSION", "Refresh requested without a refresh token");
        throw NotAuthenticatedError();
    }

    if (!token_client_) {
        throw std::logic_error("Session manager has no token client to refresh with");
    }

    auto refreshed = token_client_->Refresh(current->refresh_token);
    SetTokens(refreshed);
    SaveTokens(refreshed);

    SPOTYCLI_TRACE_INFO("SESSION", "Access token refreshed");
    return refreshed;
}

void SessionManager::Clear() {
    {
        std::lock_guard<std::mutex> lock(tokens_mutex_);
        tokens_.reset();
    }

    std::error_code ec;
    if (std::filesystem::remove(session_file_, ec)) {
        SPOTYCLI_TRACE_INFO("SESSION", "Removed session file " + session_file_);
    } else if (ec) {
        throw SessionStoreError(session_file_, "cannot remove: " + ec.message());
    }
}

std::string SessionManager::SerializeTokens(const OAuth2Tokens& tokens) {
    auto doc = std::shared_ptr<yyjson_mut_doc>(yyjson_mut_doc_new(nullptr), yyjson_mut_doc_free);
    if (!doc) {
        throw std::runtime_error("Failed to allocate session JSON document");
    }

    auto root = yyjson_mut_obj(doc.get());
    yyjson_mut_doc_set_root(doc.get(), root);

    yyjson_mut_obj_add_strcpy(doc.get(), root, "access_token", tokens.access_token.c_str());
    yyjson_mut_obj_add_strcpy(doc.get(), root, "refresh_token", tokens.refresh_token.c_str());
    yyjson_mut_obj_add_int(doc.get(), root, "expires_in", tokens.expires_in);
    yyjson_mut_obj_add_strcpy(doc.get(), root, "scope", tokens.scope.c_str());

    size_t len = 0;
    char* json = yyjson_mut_write(doc.get(), YYJSON_WRITE_PRETTY, &len);
    if (!json) {
        throw std::runtime_error("Failed to serialize session JSON");
    }

    std::string result(json, len);
    free(json);
    return result;
}

std::optional<OAuth2Tokens> SessionManager::DeserializeTokens(const std::string& content) {
    if (content.empty()) {
        return std::nullopt;
    }

    auto doc = std::shared_ptr<yyjson_doc>(yyjson_read(content.c_str(), content.size(), 0), yyjson_doc_free);
    if (!doc) {
        return std::nullopt;
    }

    auto root = yyjson_doc_get_root(doc.get());
    if (!root || !yyjson_is_obj(root)) {
        return std::nullopt;
    }

    auto access_token_val = yyjson_obj_get(root, "access_token");
    if (!access_token_val || !yyjson_is_str(access_token_val) || yyjson_get_len(access_token_val) == 0) {
        return std::nullopt;
    }

    OAuth2Tokens tokens;
    tokens.access_token = yyjson_get_str(access_token_val);

    auto refresh_token_val = yyjson_obj_get(root, "refresh_token");
    if (refresh_token_val && yyjson_is_str(refresh_token_val)) {
        tokens.refresh_token = yyjson_get_str(refresh_token_val);
    }

    auto expires_in_val = yyjson_obj_get(root, "expires_in");
    if (expires_in_val && yyjson_is_int(expires_in_val)) {
        if (yyjson_is_uint(expires_in_val) &&
            yyjson_get_uint(expires_in_val) > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        tokens.expires_in = yyjson_get_sint(expires_in_val);
    }

    auto scope_val = yyjson_obj_get(root, "scope");
    if (scope_val && yyjson_is_str(scope_val)) {
        tokens.scope = yyjson_get_str(scope_val);
    }

    return tokens;
}

} // namespace spotycli
