#include <gemini_mcp/core/log.hpp>

#include <gemini_mcp/core/text.hpp>

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace gemini_mcp {

namespace {

constexpr const char* kReset = "\033[0m";
constexpr const char* kDim = "\033[2m";

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[2m";
        case LogLevel::Info:  return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
    }
    return kReset;
}

std::tm ToTm(std::time_t t, bool utc) {
    std::tm out{};
#ifdef _WIN32
    if (utc) gmtime_s(&out, &t); else localtime_s(&out, &t);
#else
    if (utc) gmtime_r(&t, &out); else localtime_r(&t, &out);
#endif
    return out;
}

// 2025-01-01T12:00:00.123Z
std::string FormatUtc(std::chrono::system_clock::time_point tp) {
    const auto secs = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            tp.time_since_epoch()).count() % 1000;
    const auto tm = ToTm(secs, true);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

// 12:00:00 in local time
std::string FormatClock(std::chrono::system_clock::time_point tp) {
    const auto tm = ToTm(std::chrono::system_clock::to_time_t(tp), false);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
}

class DiscardSink : public ILogSink {
public:
    void Write(const LogRecord&) override {}
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
    return "INFO";
}

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    const auto lowered = ToLower(name);
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    return std::nullopt;
}

bool StderrWantsColor() {
    const char* no_color = std::getenv("NO_COLOR");
    if (no_color != nullptr && *no_color != '\0') return false;
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ---------------------------------------------------------------------------
// TextSink
// ---------------------------------------------------------------------------
TextSink::TextSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void TextSink::Write(const LogRecord& record) {
    if (use_color_) {
        std::string tag = LogLevelName(record.level);
        tag.resize(5, ' ');
        out_ << kDim << FormatClock(record.time) << kReset << ' '
             << LevelColor(record.level) << tag << kReset << ' '
             << kDim << '[' << record.component << ']' << kReset << ' ';
        if (record.level == LogLevel::Error) {
            out_ << LevelColor(record.level) << record.message << kReset;
        } else {
            out_ << record.message;
        }
    } else {
        out_ << FormatUtc(record.time) << " [" << LogLevelName(record.level)
             << "] [" << record.component << "] " << record.message;
    }
    out_ << '\n' << std::flush;
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(const LogRecord& record) {
    nlohmann::json line = {
        {"ts", FormatUtc(record.time)},
        {"level", LogLevelName(record.level)},
        {"component", std::string(record.component)},
        {"message", std::string(record.message)},
    };
    // Invalid UTF-8 in a message is replaced rather than thrown.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n' << std::flush;
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::Enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) return;
    sink_->Write(LogRecord{std::chrono::system_clock::now(), level, component, message});
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalSlot() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() { return *GlobalSlot(); }

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Debug, component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Info, component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Warn, component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Error, component, message);
}

} // namespace gemini_mcp
