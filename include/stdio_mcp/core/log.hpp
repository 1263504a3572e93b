#pragma once

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string_view>

namespace stdio_mcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// "DEBUG", "INFO", "WARN" or "ERROR".
const char* LogLevelName(LogLevel level);

/// Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view text);

// One log event. The views are only valid for the duration of Write().
struct LogRecord {
    LogLevel level;
    std::string_view component;
    std::string_view message;
    std::chrono::system_clock::time_point time;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

// Human-readable lines. With color: "HH:MM:SS LEVEL [component] message"
// in local time; without: "<ISO-8601 UTC> [LEVEL] [component] message".
// Defaults to stderr: stdout carries protocol frames.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line with keys ts, level, component and message.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(const LogRecord& record) override;
private:
    std::ostream& out_;
};

// Filters by level and serializes writes to one sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool Enabled(LogLevel level);

    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Process-wide logger, installed once by main().
// ---------------------------------------------------------------------------

/// Replace the global logger. Until the first call everything is discarded.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace stdio_mcp
