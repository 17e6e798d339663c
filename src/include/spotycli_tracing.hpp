#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <sstream>
#include <iostream>

namespace spotycli {

enum class TraceLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG_LEVEL = 4,
    TRACE = 5
};

// Parses NONE, ERROR, WARN, INFO, DEBUG, TRACE (case-insensitive)
TraceLevel StringToTraceLevel(const std::string& level_str);
std::string TraceLevelToString(TraceLevel level);

class SpotycliTracer {
public:
    static constexpr const char* TRACE_FILE_NAME = "spotycli_trace.log";

    static SpotycliTracer& Instance();

    void SetEnabled(bool enabled);
    void SetLevel(TraceLevel level);
    void SetTraceDirectory(const std::string& directory);
    void SetOutputMode(const std::string& output_mode);
    void SetMaxFileSize(int64_t max_size);
    void SetRotation(bool rotation);

    bool IsEnabled() const { return enabled; }
    TraceLevel GetLevel() const { return level; }
    std::string GetOutputMode() const { return output_mode; }
    std::string GetTraceDirectory() const { return trace_directory; }
    int64_t GetMaxFileSize() const { return max_file_size; }
    bool GetRotation() const { return rotation_enabled; }

    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message);
    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data);

    void Error(const std::string& component, const std::string& message);
    void Error(const std::string& component, const std::string& message, const std::string& data);
    void Warn(const std::string& component, const std::string& message);
    void Warn(const std::string& component, const std::string& message, const std::string& data);
    void Info(const std::string& component, const std::string& message);
    void Info(const std::string& component, const std::string& message, const std::string& data);
    void Debug(const std::string& component, const std::string& message);
    void Debug(const std::string& component, const std::string& message, const std::string& data);
    void Trace(const std::string& component, const std::string& message);
    void Trace(const std::string& component, const std::string& message, const std::string& data);

private:
    SpotycliTracer() = default;
    ~SpotycliTracer() = default;
    SpotycliTracer(const SpotycliTracer&) = delete;
    SpotycliTracer& operator=(const SpotycliTracer&) = delete;

    void Emit(const std::string& message);
    void OpenTraceFile();
    void RotateIfNeeded();
    std::string TraceFilePath() const;
    std::string GetTimestamp();

    bool enabled = false;
    TraceLevel level = TraceLevel::INFO;
    std::string trace_directory = ".";
    std::string output_mode = "console";
    int64_t max_file_size = 10485760; // 10MB default
    bool rotation_enabled = true;
    std::unique_ptr<std::ofstream> trace_file;
    std::mutex trace_mutex;
};

// Masks all but the first few characters of a credential for log output
std::string TruncateSecret(const std::string& secret, size_t visible = 6);

#define SPOTYCLI_TRACE_ERROR(component, message) \
    ::spotycli::SpotycliTracer::Instance().Error(component, message)

#define SPOTYCLI_TRACE_ERROR_DATA(component, message, data) \
    ::spotycli::SpotycliTracer::Instance().Error(component, message, data)

#define SPOTYCLI_TRACE_WARN(component, message) \
    ::spotycli::SpotycliTracer::Instance().Warn(component, message)

#define SPOTYCLI_TRACE_WARN_DATA(component, message, data) \
    ::spotycli::SpotycliTracer::Instance().Warn(component, message, data)

#define SPOTYCLI_TRACE_INFO(component, message) \
    ::spotycli::SpotycliTracer::Instance().Info(component, message)

#define SPOTYCLI_TRACE_INFO_DATA(component, message, data) \
    ::spotycli::SpotycliTracer::Instance().Info(component, message, data)

#define SPOTYCLI_TRACE_DEBUG(component, message) \
    ::spotycli::SpotycliTracer::Instance().Debug(component, message)

#define SPOTYCLI_TRACE_DEBUG_DATA(component, message, data) \
    ::spotycli::SpotycliTracer::Instance().Debug(component, message, data)

#define SPOTYCLI_TRACE_TRACE(component, message) \
    ::spotycli::SpotycliTracer::Instance().Trace(component, message)

#define SPOTYCLI_TRACE_TRACE_DATA(component, message, data) \
    ::spotycli::SpotycliTracer::Instance().Trace(component, message, data)

} // namespace spotycli
