#include <catch2/catch_test_macros.hpp>

#include <portainer_mcp/core/log.hpp>
#include "../../test/mocks/capture_log_sink.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace portainer_mcp;
using namespace portainer_mcp::testing;

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: accepts known names case-insensitively", "[log]") {
    CHECK(ParseLogLevel("debug") == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO") == LogLevel::Info);
    CHECK(ParseLogLevel("warn") == LogLevel::Warn);
    CHECK(ParseLogLevel("Warning") == LogLevel::Warn);
    CHECK(ParseLogLevel("error") == LogLevel::Error);
    CHECK_FALSE(ParseLogLevel("verbose").has_value());
    CHECK_FALSE(ParseLogLevel("").has_value());
}

// ===========================================================================
// ConsoleSink
// ===========================================================================

TEST_CASE("ConsoleSink: writes level, component and message", "[log]") {
    std::ostringstream oss;
    ConsoleSink sink(oss);

    sink.Write(LogLevel::Warn, "proxy", "docker proxy request failed");

    auto line = oss.str();
    CHECK(line.find("[WARN]") != std::string::npos);
    CHECK(line.find("[proxy]") != std::string::npos);
    CHECK(line.find("docker proxy request failed") != std::string::npos);
    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: writes valid JSON lines", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "mcp", "Registered 31 tools");

    auto line = oss.str();
    CHECK(line.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(line.find("\"component\":\"mcp\"") != std::string::npos);
    CHECK(line.find("\"message\":\"Registered 31 tools\"") != std::string::npos);
    CHECK(line.find("\"ts\":\"") != std::string::npos);
    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');
}

TEST_CASE("JsonSink: each write produces one line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Debug, "a", "first");
    sink.Write(LogLevel::Warn, "b", "second");

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 2);
}

TEST_CASE("JsonSink: escapes special characters in message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "esc", "line1\nline2\ttab \"quoted\" back\\slash");

    auto output = oss.str();
    CHECK(output.find("\\n") != std::string::npos);
    CHECK(output.find("\\t") != std::string::npos);
    CHECK(output.find("\\\"quoted\\\"") != std::string::npos);
    CHECK(output.find("back\\\\slash") != std::string::npos);
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Debug("c", "should be filtered");
    logger.Info("c", "should be filtered");
    logger.Warn("c", "should pass");
    logger.Error("c", "should pass");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].level == LogLevel::Warn);
    CHECK(sink_ptr->messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel and Enabled", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    CHECK_FALSE(logger.Enabled(LogLevel::Info));
    logger.Info("c", "filtered");
    CHECK(sink_ptr->messages.empty());

    logger.SetLevel(LogLevel::Info);
    CHECK(logger.Enabled(LogLevel::Info));
    CHECK_FALSE(logger.Enabled(LogLevel::Debug));
    logger.Info("c", "now passes");
    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].message == "now passes");
    CHECK(sink_ptr->messages[0].component == "c");
}

TEST_CASE("Logger: concurrent logging keeps every message", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.Info("thread-" + std::to_string(t), "msg-" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(sink_ptr->messages.size() == kThreads * kMessagesPerThread);
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("Global logger: free functions route to the installed sink", "[log]") {
    ScopedLogCapture capture(LogLevel::Info);

    LogDebug("bootstrap", "hidden");
    LogInfo("bootstrap", "visible");
    LogError("bootstrap", "failed");

    const auto& messages = capture.Sink().messages;
    REQUIRE(messages.size() == 2);
    CHECK(messages[0].message == "visible");
    CHECK(messages[1].level == LogLevel::Error);
    CHECK(capture.Sink().Contains("failed"));
}

TEST_CASE("JsonSink: invalid UTF-8 is replaced, not thrown", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);
    const std::string bytes = std::string("body: ") + '\xff' + '\xfe';
    REQUIRE_NOTHROW(sink.Write(LogLevel::Debug, "proxy", bytes));

    auto parsed = nlohmann::json::parse(oss.str());
    CHECK(parsed["component"] == "proxy");
    CHECK(parsed["message"].get<std::string>().rfind("body: ", 0) == 0);
}

TEST_CASE("LogLevelName: upper-case names", "[log]") {
    CHECK(std::string(LogLevelName(LogLevel::Debug)) == "DEBUG");
    CHECK(std::string(LogLevelName(LogLevel::Warn)) == "WARN");
    CHECK(ParseLogLevel(LogLevelName(LogLevel::Error)) == LogLevel::Error);
}
