#pragma once

#include "oauth2_types.hpp"
#include "oauth2_token_client.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace spotycli {

class OAuth2Flow;

// Owns the current token set of the single local user, persists it to the
// session file and refreshes it on demand. Shared between the UI thread and
// background refreshes.
class SessionManager {
public:
    static constexpr const char* DEFAULT_SESSION_FILE = ".spotify_tokens";

    explicit SessionManager(std::shared_ptr<OAuth2TokenClient> token_client,
                            std::string session_file = DEFAULT_SESSION_FILE);

    void SetTokens(const OAuth2Tokens& tokens);

    // Empty when no session is installed; never throws
    std::optional<std::string> CurrentAccessToken() const;
    std::optional<OAuth2Tokens> CurrentTokens() const;
    bool IsAuthenticated() const;

    // Runs a full authorization attempt, installs and persists its tokens
    OAuth2Tokens Login(OAuth2Flow& flow);

    // Restores the session file. Returns false for an absent or malformed file.
    bool Load();

    // Throws SessionStoreError
    void Save() const;

    // Refresh grant with the stored refresh token, then install and persist.
    // Throws NotAuthenticatedError without a refresh token.
    OAuth2Tokens Refresh();

    // Drops the in-memory session and deletes the session file
    void Clear();

    const std::string& SessionFile() const { return session_file_; }

    static std::string SerializeTokens(const OAuth2Tokens& tokens);
    static std::optional<OAuth2Tokens> DeserializeTokens(const std::string& content);

private:
    void SaveTokens(const OAuth2Tokens& tokens) const;

    std::shared_ptr<OAuth2TokenClient> token_client_;
    std::string session_file_;
    std::optional<OAuth2Tokens> tokens_;
    mutable std::mutex tokens_mutex_;
    std::mutex refresh_mutex_;
};

} // namespace spotycli
