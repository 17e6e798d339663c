#pragma once

#include "oauth2_types.hpp"
#include "spotycli_http_client.hpp"
#include "spotycli_tracing.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace spotycli {

// Runtime settings, read from the process environment after an optional .env file.
struct SpotycliConfig {
    static constexpr const char* DEFAULT_DOTENV_FILE = ".env";
    static constexpr const char* DEFAULT_SESSION_FILE = ".spotify_tokens";

    // Upper bounds keep the durations representable in std::chrono arithmetic
    static constexpr uint64_t MAX_CALLBACK_TIMEOUT_SECONDS = 365ULL * 24 * 60 * 60;
    static constexpr uint64_t MAX_HTTP_TIMEOUT_MS = 24ULL * 60 * 60 * 1000;

    OAuth2Config oauth2;
    std::string session_file = DEFAULT_SESSION_FILE;
    std::optional<std::chrono::seconds> callback_timeout;
    uint64_t http_timeout_ms = HttpParams::DEFAULT_TIMEOUT;

    std::optional<TraceLevel> trace_level;
    std::string trace_output = "console";
    std::string trace_directory = ".";

    // Throws std::invalid_argument for malformed values. Missing client
    // credentials are reported later by OAuth2Config::Validate.
    static SpotycliConfig FromEnvironment();

    // Sets KEY=VALUE pairs that are not already in the environment.
    // Returns the number of variables set; an absent file sets none.
    static int LoadDotEnv(const std::string& path = DEFAULT_DOTENV_FILE);

    // Token endpoint calls are never retried
    HttpParams TokenHttpParams() const { return HttpParams::NoRetry(http_timeout_ms); }
    HttpParams ApiHttpParams() const;

    // Applies the trace settings to the process-wide tracer
    void ApplyTracing() const;
};

} // namespace spotycli
