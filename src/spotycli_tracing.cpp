#include "spotycli_tracing.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <stdexcept>

namespace spotycli {

TraceLevel StringToTraceLevel(const std::string& level_str) {
    std::string level_str_upper = level_str;
    std::transform(level_str_upper.begin(), level_str_upper.end(), level_str_upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (level_str_upper == "NONE") {
        return TraceLevel::NONE;
    } else if (level_str_upper == "ERROR") {
        return TraceLevel::ERROR;
    } else if (level_str_upper == "WARN") {
        return TraceLevel::WARN;
    } else if (level_str_upper == "INFO") {
        return TraceLevel::INFO;
    } else if (level_str_upper == "DEBUG") {
        return TraceLevel::DEBUG_LEVEL;
    } else if (level_str_upper == "TRACE") {
        return TraceLevel::TRACE;
    }

    throw std::invalid_argument("Invalid trace level: " + level_str + ". Valid levels are: NONE, ERROR, WARN, INFO, DEBUG, TRACE");
}

std::string TraceLevelToString(TraceLevel level) {
    switch (level) {
        case TraceLevel::NONE: return "NONE";
        case TraceLevel::ERROR: return "ERROR";
        case TraceLevel::WARN: return "WARN";
        case TraceLevel::INFO: return "INFO";
        case TraceLevel::DEBUG_LEVEL: return "DEBUG";
        case TraceLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

std::string TruncateSecret(const std::string& secret, size_t visible) {
    if (secret.length() <= visible) {
        return std::string(secret.length(), '*');
    }
    return secret.substr(0, visible) + "...";
}

SpotycliTracer& SpotycliTracer::Instance() {
    static SpotycliTracer instance;
    return instance;
}

void SpotycliTracer::SetEnabled(bool enabled) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->enabled = enabled;

        if (enabled && !trace_file && output_mode != "console") {
            OpenTraceFile();
        } else if (!enabled && trace_file) {
            trace_file->close();
            trace_file.reset();
        }
    }

    if (enabled) {
        Info("TRACER", "Tracing enabled, output mode: " + output_mode);
    }
}

void SpotycliTracer::SetLevel(TraceLevel level) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->level = level;
    }
    Info("TRACER", "Trace level set to: " + TraceLevelToString(level));
}

void SpotycliTracer::SetTraceDirectory(const std::string& directory) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        trace_directory = directory;

        std::filesystem::path dir_path(directory);
        std::error_code ec;
        if (!std::filesystem::exists(dir_path, ec)) {
            std::filesystem::create_directories(dir_path, ec);
            if (ec) {
                std::cerr << "Failed to create trace directory: " << directory << " (" << ec.message() << ")" << std::endl;
            }
        }

        // Reopen trace file if tracing is enabled
        if (trace_file) {
            trace_file->close();
            trace_file.reset();
        }
        if (enabled && output_mode != "console") {
            OpenTraceFile();
        }
    }
    Info("TRACER", "Trace directory set to: " + directory);
}

void SpotycliTracer::SetOutputMode(const std::string& output_mode) {
    std::string mode = output_mode;
    std::transform(mode.begin(), mode.end(), mode.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (mode != "console" && mode != "file" && mode != "both") {
        throw std::invalid_argument("Invalid trace output: " + output_mode + ". Valid outputs are: console, file, both");
    }

    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->output_mode = mode;
        if (enabled && mode != "console" && !trace_file) {
            OpenTraceFile();
        }
    }
    Info("TRACER", "Trace output mode set to: " + mode);
}

void SpotycliTracer::SetMaxFileSize(int64_t max_size) {
    if (max_size < 0) {
        throw std::invalid_argument("Trace max file size must be non-negative");
    }
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        max_file_size = max_size;
    }
    Info("TRACER", "Trace max file size set to: " + std::to_string(max_size));
}

void SpotycliTracer::SetRotation(bool rotation) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        rotation_enabled = rotation;
    }
    Info("TRACER", "Trace rotation " + std::string(rotation ? "enabled" : "disabled"));
}

void SpotycliTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message) {
    Trace(msg_level, component, message, std::string());
}

void SpotycliTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data) {
    if (!enabled || msg_level > level) {
        return;
    }

    std::string log_message;
    log_message.reserve(100 + component.length() + message.length() + data.length());

    log_message += GetTimestamp();
    log_message += " [";
    log_message += TraceLevelToString(msg_level);
    log_message += "] [";
    log_message += component;
    log_message += "] ";
    log_message += message;

    if (!data.empty()) {
        log_message += "\nData: ";
        log_message += data;
    }

    std::lock_guard<std::mutex> lock(trace_mutex);
    Emit(log_message);
}

void SpotycliTracer::Error(const std::string& component, const std::string& message) {
    Trace(TraceLevel::ERROR, component, message);
}

void SpotycliTracer::Error(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::ERROR, component, message, data);
}

void SpotycliTracer::Warn(const std::string& component, const std::string& message) {
    Trace(TraceLevel::WARN, component, message);
}

void SpotycliTracer::Warn(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::WARN, component, message, data);
}

void SpotycliTracer::Info(const std::string& component, const std::string& message) {
    Trace(TraceLevel::INFO, component, message);
}

void SpotycliTracer::Info(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::INFO, component, message, data);
}

void SpotycliTracer::Debug(const std::string& component, const std::string& message) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message);
}

void SpotycliTracer::Debug(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message, data);
}

void SpotycliTracer::Trace(const std::string& component, const std::string& message) {
    Trace(TraceLevel::TRACE, component, message);
}

void SpotycliTracer::Trace(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::TRACE, component, message, data);
}

// Caller holds trace_mutex
void SpotycliTracer::Emit(const std::string& message) {
    if (output_mode == "console" || output_mode == "both") {
        std::cout << message << std::endl;
    }

    if (output_mode == "file" || output_mode == "both") {
        RotateIfNeeded();
        if (trace_file && trace_file->is_open()) {
            *trace_file << message << std::endl;
            trace_file->flush();
        }
    }
}

// Caller holds trace_mutex
void SpotycliTracer::OpenTraceFile() {
    auto trace_path = TraceFilePath();
    trace_file = std::make_unique<std::ofstream>(trace_path, std::ios::app);
    if (!trace_file->is_open()) {
        std::cerr << "Failed to open trace file: " << trace_path << std::endl;
        trace_file.reset();
    }
}

// Caller holds trace_mutex
void SpotycliTracer::RotateIfNeeded() {
    if (!rotation_enabled || max_file_size <= 0 || !trace_file) {
        return;
    }

    auto position = static_cast<int64_t>(trace_file->tellp());
    if (position < max_file_size) {
        return;
    }

    trace_file->close();
    auto trace_path = TraceFilePath();
    std::error_code ec;
    std::filesystem::rename(trace_path, trace_path + ".1", ec);
    if (ec) {
        std::cerr << "Failed to rotate trace file: " << ec.message() << std::endl;
    }
    OpenTraceFile();
}

std::string SpotycliTracer::TraceFilePath() const {
    std::filesystem::path trace_path = trace_directory;
    trace_path /= TRACE_FILE_NAME;
    return trace_path.string();
}

std::string SpotycliTracer::GetTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &time_t);
#else
    localtime_r(&time_t, &local_tm);
#endif

    char time_buffer[32];
    std::strftime(time_buffer, sizeof(time_buffer), "%Y-%m-%d %H:%M:%S", &local_tm);

    std::ostringstream timestamp;
    timestamp << time_buffer << "." << std::setw(3) << std::setfill('0') << ms.count();
    return timestamp.str();
}

} // namespace spotycli
