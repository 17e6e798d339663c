#include "spotycli_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace spotycli {

namespace {

std::optional<std::string> GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string Trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

uint64_t ParsePositiveNumber(const std::string& name, const std::string& value, uint64_t max_value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument(name + " must be a positive number, got: " + value);
    }
    uint64_t number = 0;
    try {
        number = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(name + " is out of range: " + value);
    }
    if (number == 0) {
        throw std::invalid_argument(name + " must be greater than zero");
    }
    if (number > max_value) {
        throw std::invalid_argument(name + " must not exceed " + std::to_string(max_value) + ", got: " + value);
    }
    return number;
}

} // namespace

int SpotycliConfig::LoadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return 0;
    }

    int loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.compare(0, 7, "export ") == 0) {
            line = Trim(line.substr(7));
        }

        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }

        auto key = Trim(line.substr(0, eq));
        auto value = Trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }

        // The real environment wins over the file
        if (std::getenv(key.c_str())) {
            continue;
        }
#ifdef _WIN32
        if (_putenv_s(key.c_str(), value.c_str()) == 0) {
            ++loaded;
        }
#else
        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++loaded;
        }
#endif
    }

    return loaded;
}

SpotycliConfig SpotycliConfig::FromEnvironment() {
    SpotycliConfig config;

    config.oauth2.client_id = GetEnv("SPOTIFY_CLIENT_ID").value_or("");
    config.oauth2.client_secret = GetEnv("SPOTIFY_CLIENT_SECRET").value_or("");
    config.oauth2.redirect_uri = GetEnv("SPOTIFY_REDIRECT_URI").value_or(OAuth2Config::DEFAULT_REDIRECT_URI);
    config.oauth2.scope = GetEnv("SPOTIFY_SCOPE").value_or(OAuth2Config::DEFAULT_SCOPE);
    config.oauth2.authorization_url = GetEnv("SPOTIFY_AUTH_URL").value_or(OAuth2Config::DEFAULT_AUTHORIZATION_URL);
    config.oauth2.token_url = GetEnv("SPOTIFY_TOKEN_URL").value_or(OAuth2Config::DEFAULT_TOKEN_URL);

    config.session_file = GetEnv("SPOTYCLI_SESSION_FILE").value_or(DEFAULT_SESSION_FILE);

    if (auto timeout = GetEnv("SPOTYCLI_CALLBACK_TIMEOUT")) {
        auto seconds = ParsePositiveNumber("SPOTYCLI_CALLBACK_TIMEOUT", *timeout, MAX_CALLBACK_TIMEOUT_SECONDS);
        config.callback_timeout = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(seconds));
    }

    if (auto timeout = GetEnv("SPOTYCLI_HTTP_TIMEOUT_MS")) {
        config.http_timeout_ms = ParsePositiveNumber("SPOTYCLI_HTTP_TIMEOUT_MS", *timeout, MAX_HTTP_TIMEOUT_MS);
    }

    if (auto level = GetEnv("SPOTYCLI_TRACE_LEVEL")) {
        config.trace_level = StringToTraceLevel(*level);
    }

    if (auto output = GetEnv("SPOTYCLI_TRACE_OUTPUT")) {
        std::string mode = *output;
        std::transform(mode.begin(), mode.end(), mode.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (mode != "console" && mode != "file" && mode != "both") {
            throw std::invalid_argument("Invalid trace output: " + *output + ". Valid outputs are: console, file, both");
        }
        config.trace_output = mode;
    }

    config.trace_directory = GetEnv("SPOTYCLI_TRACE_DIR").value_or(".");

    return config;
}

HttpParams SpotycliConfig::ApiHttpParams() const {
    HttpParams params;
    params.timeout = http_timeout_ms;
    return params;
}

void SpotycliConfig::ApplyTracing() const {
    auto& tracer = SpotycliTracer::Instance();

    if (!trace_level.has_value() || *trace_level == TraceLevel::NONE) {
        tracer.SetEnabled(false);
        return;
    }

    tracer.SetOutputMode(trace_output);
    tracer.SetTraceDirectory(trace_directory);
    tracer.SetLevel(*trace_level);
    tracer.SetEnabled(true);
}

} // namespace spotycli
