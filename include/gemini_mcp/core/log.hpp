#pragma once

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string_view>

namespace gemini_mcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// Upper-case name ("DEBUG", "INFO", "WARN", "ERROR").
const char* LogLevelName(LogLevel level);

/// Parse "debug", "info", "warn"/"warning", "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

// ---------------------------------------------------------------------------
// LogRecord: one event handed to a sink. Views are only valid during Write.
// ---------------------------------------------------------------------------
struct LogRecord {
    std::chrono::system_clock::time_point time;
    LogLevel level;
    std::string_view component;
    std::string_view message;
};

// ---------------------------------------------------------------------------
// ILogSink: where records end up. stdout carries the MCP protocol, so every
// sink in this project writes to stderr (or a test stream).
// ---------------------------------------------------------------------------
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

// Human-readable lines.
//   plain: "2025-01-01T12:00:00.000Z [INFO] [mcp] message"
//   color: "12:00:00 INFO  [mcp] message" with ANSI level colors
class TextSink : public ILogSink {
public:
    explicit TextSink(bool use_color, std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;

private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line: {"ts","level","component","message"}.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;

private:
    std::ostream& out_;
};

/// True when stderr is a terminal and NO_COLOR is unset or empty.
bool StderrWantsColor();

// ---------------------------------------------------------------------------
// Logger: level filter in front of a sink. Safe to call from any thread;
// writes are serialized so lines never interleave.
// ---------------------------------------------------------------------------
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool Enabled(LogLevel level) const;

    void Log(LogLevel level, std::string_view component, std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

// Process-wide logger. Until InitGlobalLogger runs, records are dropped.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace gemini_mcp
