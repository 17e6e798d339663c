#include <catch2/catch.hpp>
#include "spotycli_tracing.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace spotycli;

namespace {

// Captures std::cout for the lifetime of the object
class CoutCapture {
public:
    CoutCapture() : old_buf_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old_buf_); }

    std::string str() const { return buffer_.str(); }

private:
    std::stringstream buffer_;
    std::streambuf* old_buf_;
};

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

void ResetTracer() {
    auto& tracer = SpotycliTracer::Instance();
    tracer.SetEnabled(false);
    tracer.SetOutputMode("console");
    tracer.SetTraceDirectory(".");
    tracer.SetLevel(TraceLevel::INFO);
    tracer.SetMaxFileSize(10485760);
    tracer.SetRotation(true);
}

} // namespace

TEST_CASE("SpotycliTracer Singleton Pattern", "[tracing]") {
    auto& instance1 = SpotycliTracer::Instance();
    auto& instance2 = SpotycliTracer::Instance();
    REQUIRE(&instance1 == &instance2);
}

TEST_CASE("SpotycliTracer Basic Functionality", "[tracing]") {
    ResetTracer();
    auto& tracer = SpotycliTracer::Instance();

    SECTION("Disabled after reset") {
        REQUIRE_FALSE(tracer.IsEnabled());
        REQUIRE(tracer.GetLevel() == TraceLevel::INFO);
        REQUIRE(tracer.GetOutputMode() == "console");
    }

    SECTION("Enable/Disable tracing") {
        tracer.SetEnabled(true);
        REQUIRE(tracer.IsEnabled());

        tracer.SetEnabled(false);
        REQUIRE_FALSE(tracer.IsEnabled());
    }

    SECTION("Disabled tracer writes nothing") {
        CoutCapture capture;
        tracer.Error("TEST", "should not appear");
        REQUIRE(capture.str().empty());
    }

    ResetTracer();
}

TEST_CASE("SpotycliTracer Level Filtering", "[tracing]") {
    ResetTracer();
    auto& tracer = SpotycliTracer::Instance();
    tracer.SetEnabled(true);

    SECTION("Messages at or below current level are logged") {
        CoutCapture capture;
        tracer.Error("TEST", "Error message");
        tracer.Warn("TEST", "Warning message");
        tracer.Info("TEST", "Info message");

        auto output = capture.str();
        REQUIRE(output.find("[ERROR] [TEST] Error message") != std::string::npos);
        REQUIRE(output.find("[WARN] [TEST] Warning message") != std::string::npos);
        REQUIRE(output.find("[INFO] [TEST] Info message") != std::string::npos);
    }

    SECTION("Messages above current level are dropped") {
        CoutCapture capture;
        tracer.Debug("TEST", "Debug message");
        tracer.Trace("TEST", "Trace message");

        auto output = capture.str();
        REQUIRE(output.find("Debug message") == std::string::npos);
        REQUIRE(output.find("Trace message") == std::string::npos);
    }

    SECTION("Data is appended on its own line") {
        CoutCapture capture;
        std::string test_data = "{\"key\": \"value\"}";
        tracer.Info("TEST", "JSON data received", test_data);

        auto output = capture.str();
        REQUIRE(output.find("JSON data received") != std::string::npos);
        REQUIRE(output.find("\nData: " + test_data) != std::string::npos);
    }

    ResetTracer();
}

TEST_CASE("Trace level string conversion", "[tracing]") {
    REQUIRE(StringToTraceLevel("debug") == TraceLevel::DEBUG_LEVEL);
    REQUIRE(StringToTraceLevel("TRACE") == TraceLevel::TRACE);
    REQUIRE(StringToTraceLevel("None") == TraceLevel::NONE);
    REQUIRE(TraceLevelToString(TraceLevel::WARN) == "WARN");
    REQUIRE(TraceLevelToString(TraceLevel::DEBUG_LEVEL) == "DEBUG");
    REQUIRE_THROWS_AS(StringToTraceLevel("verbose"), std::invalid_argument);
}

TEST_CASE("Secrets are truncated for log output", "[tracing]") {
    REQUIRE(TruncateSecret("BQDx1234567890abcdef") == "BQDx12...");
    REQUIRE(TruncateSecret("BQDx1234567890abcdef", 10) == "BQDx123456...");
    REQUIRE(TruncateSecret("abc") == "***");
    REQUIRE(TruncateSecret("").empty());
}

TEST_CASE("SpotycliTracer File Output", "[tracing]") {
    ResetTracer();
    auto& tracer = SpotycliTracer::Instance();

    std::filesystem::path test_dir = "./test_trace_output";
    std::filesystem::remove_all(test_dir);

    tracer.SetTraceDirectory(test_dir.string());
    REQUIRE(std::filesystem::exists(test_dir));

    SECTION("File mode writes only to the trace file") {
        tracer.SetOutputMode("file");
        tracer.SetEnabled(true);

        CoutCapture capture;
        tracer.Info("TEST", "Test trace message");
        REQUIRE(capture.str().empty());

        auto trace_file_path = test_dir / SpotycliTracer::TRACE_FILE_NAME;
        REQUIRE(std::filesystem::exists(trace_file_path));

        auto content = ReadFile(trace_file_path);
        REQUIRE(content.find("Test trace message") != std::string::npos);
        REQUIRE(content.find("[INFO] [TEST]") != std::string::npos);
    }

    SECTION("Both mode writes to console and file") {
        tracer.SetOutputMode("BOTH");
        REQUIRE(tracer.GetOutputMode() == "both");
        tracer.SetEnabled(true);

        CoutCapture capture;
        tracer.Warn("TEST", "Mirrored message");
        REQUIRE(capture.str().find("Mirrored message") != std::string::npos);

        tracer.SetEnabled(false);
        auto content = ReadFile(test_dir / SpotycliTracer::TRACE_FILE_NAME);
        REQUIRE(content.find("Mirrored message") != std::string::npos);
    }

    SECTION("Oversized trace file is rotated") {
        tracer.SetOutputMode("file");
        tracer.SetMaxFileSize(64);
        tracer.SetEnabled(true);

        std::string long_message(100, 'x');
        tracer.Info("TEST", long_message);
        tracer.Info("TEST", long_message);
        tracer.SetEnabled(false);

        auto rotated = test_dir / (std::string(SpotycliTracer::TRACE_FILE_NAME) + ".1");
        REQUIRE(std::filesystem::exists(rotated));
        REQUIRE(std::filesystem::exists(test_dir / SpotycliTracer::TRACE_FILE_NAME));
    }

    SECTION("Invalid output mode is rejected") {
        REQUIRE_THROWS_AS(tracer.SetOutputMode("syslog"), std::invalid_argument);
        REQUIRE_THROWS_AS(tracer.SetMaxFileSize(-1), std::invalid_argument);
    }

    ResetTracer();
    std::filesystem::remove_all(test_dir);
}

TEST_CASE("SpotycliTracer Thread Safety", "[tracing]") {
    ResetTracer();
    auto& tracer = SpotycliTracer::Instance();
    tracer.SetEnabled(true);

    const int num_threads = 8;
    const int messages_per_thread = 50;
    std::atomic<int> total_messages(0);

    {
        CoutCapture capture;
        std::vector<std::thread> threads;
        for (int i = 0; i < num_threads; ++i) {
            threads.emplace_back([&tracer, i, &total_messages]() {
                for (int j = 0; j < messages_per_thread; ++j) {
                    tracer.Info("THREAD_" + std::to_string(i), "Message " + std::to_string(j));
                    total_messages++;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    REQUIRE(total_messages == num_threads * messages_per_thread);
    ResetTracer();
}
