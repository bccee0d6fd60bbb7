#include <portainer_mcp/core/log.hpp>

#include <portainer_mcp/core/text.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace portainer_mcp {

namespace {

// UTC with millisecond precision, e.g. 2024-05-01T12:00:00.042Z.
std::string TimestampUtc() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

// Discards everything until InitGlobalLogger() runs.
class DiscardSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalSlot() {
    static auto logger = std::make_unique<Logger>(std::make_unique<DiscardSink>(),
                                                  LogLevel::Error);
    return logger;
}

} // anonymous namespace

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    if (text::IEquals(name, "debug")) return LogLevel::Debug;
    if (text::IEquals(name, "info")) return LogLevel::Info;
    if (text::IEquals(name, "warn") || text::IEquals(name, "warning")) return LogLevel::Warn;
    if (text::IEquals(name, "error")) return LogLevel::Error;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------
ConsoleSink::ConsoleSink(std::ostream& out) : out_(out) {}

void ConsoleSink::Write(LogLevel level, std::string_view component,
                        std::string_view message) {
    out_ << TimestampUtc() << " [" << LogLevelName(level) << "] [" << component << "] "
         << message << std::endl;
}

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    const nlohmann::json line = {
        {"ts", TimestampUtc()},
        {"level", LogLevelName(level)},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << std::endl;
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    min_level_.store(level, std::memory_order_relaxed);
}

bool Logger::Enabled(LogLevel level) const {
    return static_cast<int>(level) >=
           static_cast<int>(min_level_.load(std::memory_order_relaxed));
}

void Logger::Debug(std::string_view component, std::string_view message) {
    Log(LogLevel::Debug, component, message);
}

void Logger::Info(std::string_view component, std::string_view message) {
    Log(LogLevel::Info, component, message);
}

void Logger::Warn(std::string_view component, std::string_view message) {
    Log(LogLevel::Warn, component, message);
}

void Logger::Error(std::string_view component, std::string_view message) {
    Log(LogLevel::Error, component, message);
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    if (!Enabled(level)) return;
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_->Write(level, component, message);
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalSlot() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalSlot();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Error(component, message);
}

} // namespace portainer_mcp
