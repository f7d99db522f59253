#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace kmcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

enum class LogFormat {
    Text,
    Json,
};

/// Upper-case level name ("DEBUG", "INFO", ...).
const char* LogLevelName(LogLevel level) noexcept;

/// Parse "debug", "info", "warn"/"warning", "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view text);

/// Parse "text" or "json" (case-insensitive).
std::optional<LogFormat> ParseLogFormat(std::string_view text);

// One log record rendered as a single line (no trailing newline).
std::string FormatTextLine(LogLevel level, std::string_view component,
                           std::string_view message);
std::string FormatJsonLine(LogLevel level, std::string_view component,
                           std::string_view message);

// Abstract log sink: implementations decide where/how to write.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Colored, compact lines. Falls back to the plain format when use_color is
// false. Must never be pointed at stdout in stdio transport mode.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

private:
    bool use_color_;
    std::ostream& out_;
};

// JSON lines to a stream.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

private:
    std::ostream& out_;
};

// Owns an append-mode log file and writes text or JSON lines into it.
class FileSink : public ILogSink {
public:
    FileSink(std::ofstream file, LogFormat format);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

private:
    std::ofstream file_;
    LogFormat format_;
};

// Thread-safe logger that dispatches to a sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool IsEnabled(LogLevel level) const;

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Global logger: installed once during bootstrap, before any transport
// starts; a null sink discards everything until then.
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace kmcp
