#pragma once

#include "types.hpp"
#include <chrono>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace folio {

// ============================================================================
// Log levels
// ============================================================================

enum class LogLevel : u8 {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

// Parses "trace", "debug", "info", "warn", "error", "fatal" or "off"
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// Call site captured through compiler builtins (no <source_location> on GCC 9)
struct SourceLocation {
    const char* file;
    int line;

    static SourceLocation current(const char* file = __builtin_FILE(),
                                  int line = __builtin_LINE()) {
        return {file, line};
    }
};

struct LogRecord {
    LogLevel level;
    std::string_view message;
    std::string_view logger_name;
    SourceLocation location;
    std::chrono::system_clock::time_point timestamp;
};

// Renders "[time] [LEVEL] [logger] message", with " (file:line)" appended
// when with_location is set. No trailing newline.
[[nodiscard]] std::string format_record(const LogRecord& record, bool with_location);

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// Info and below go to stdout, warnings and up to stderr. Locations are
// printed for debug and trace records only.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_use_colors;
};

// Appends every record, with its location, to a file. Check is_open()
// after construction; a sink that failed to open drops records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path);

    [[nodiscard]] bool is_open() const { return m_out.is_open(); }
    [[nodiscard]] const std::string& path() const { return m_path; }

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::string m_path;
    std::ofstream m_out;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    explicit Logger(std::string_view name);

    void log(LogLevel level, std::string_view msg, SourceLocation loc = SourceLocation::current());

    void trace(std::string_view msg, SourceLocation loc = SourceLocation::current()) {
        log(LogLevel::Trace, msg, loc);
    }
    void debug(std::string_view msg, SourceLocation loc = SourceLocation::current()) {
        log(LogLevel::Debug, msg, loc);
    }
    void info(std::string_view msg, SourceLocation loc = SourceLocation::current()) {
        log(LogLevel::Info, msg, loc);
    }
    void warn(std::string_view msg, SourceLocation loc = SourceLocation::current()) {
        log(LogLevel::Warn, msg, loc);
    }
    void error(std::string_view msg, SourceLocation loc = SourceLocation::current()) {
        log(LogLevel::Error, msg, loc);
    }

    void set_level(LogLevel level) { m_level = level; }
    [[nodiscard]] LogLevel level() const { return m_level; }
    [[nodiscard]] std::string_view name() const { return m_name; }

private:
    std::string m_name;
    LogLevel m_level{LogLevel::Trace};
};

// ============================================================================
// Process-wide configuration
// ============================================================================

namespace logging {

// Installs a console sink unless sinks are already configured
void init();
void init(std::vector<std::unique_ptr<LogSink>> sinks);

// Flushes and drops every sink and logger
void shutdown();

void add_sink(std::unique_ptr<LogSink> sink);

// Global minimum level, applied on top of each logger's own level
void set_level(LogLevel level);
[[nodiscard]] LogLevel level();

// Named loggers live until shutdown()
[[nodiscard]] Logger& get(std::string_view name);

// The "folio" logger used by the FOLIO_LOG_* macros; initializes lazily
[[nodiscard]] Logger& default_logger();

void flush();

} // namespace logging

#define FOLIO_LOG_TRACE(msg) ::folio::logging::default_logger().trace(msg)
#define FOLIO_LOG_DEBUG(msg) ::folio::logging::default_logger().debug(msg)
#define FOLIO_LOG_INFO(msg)  ::folio::logging::default_logger().info(msg)
#define FOLIO_LOG_WARN(msg)  ::folio::logging::default_logger().warn(msg)
#define FOLIO_LOG_ERROR(msg) ::folio::logging::default_logger().error(msg)

} // namespace folio
