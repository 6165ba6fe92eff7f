#include "folio/core/logger.hpp"
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <unordered_map>

namespace folio {

namespace {

constexpr std::string_view DEFAULT_LOGGER = "folio";

struct LoggingState {
    std::recursive_mutex mutex;
    std::vector<std::unique_ptr<LogSink>> sinks;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers;
    LogLevel global_level{LogLevel::Info};
    bool initialized{false};
};

LoggingState& state() {
    static LoggingState s;
    return s;
}

// "2026-01-31 12:00:00.250" in local time
std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t time = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);

    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03d", date, static_cast<int>(ms.count()));
    return out;
}

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35m";
        case LogLevel::Off:   break;
    }
    return "";
}

void append_location(std::string& line, const SourceLocation& loc) {
    line += " (";
    line += loc.file ? loc.file : "?";
    line += ':';
    line += std::to_string(loc.line);
    line += ')';
}

} // anonymous namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "fatal") return LogLevel::Fatal;
    if (name == "off") return LogLevel::Off;
    return std::nullopt;
}

std::string format_record(const LogRecord& record, bool with_location) {
    std::string line;
    line.reserve(64 + record.message.size());
    line += '[';
    line += format_timestamp(record.timestamp);
    line += "] [";
    line += log_level_name(record.level);
    line += "] ";
    if (!record.logger_name.empty()) {
        line += '[';
        line += record.logger_name;
        line += "] ";
    }
    line += record.message;
    if (with_location) {
        append_location(line, record.location);
    }
    return line;
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) : m_use_colors(use_colors) {}

void ConsoleSink::write(const LogRecord& record) {
    std::ostream& out = record.level >= LogLevel::Warn ? std::cerr : std::cout;
    const bool with_location = record.level <= LogLevel::Debug;

    if (!m_use_colors) {
        out << format_record(record, with_location) << '\n';
        return;
    }

    // Only the level tag is colored
    out << '[' << format_timestamp(record.timestamp) << "] "
        << level_color(record.level) << '[' << log_level_name(record.level) << ']'
        << "\033[0m ";
    if (!record.logger_name.empty()) {
        out << '[' << record.logger_name << "] ";
    }
    std::string tail(record.message);
    if (with_location) {
        append_location(tail, record.location);
    }
    out << tail << '\n';
}

void ConsoleSink::flush() {
    std::cout.flush();
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path)
    : m_path(path), m_out(path, std::ios::out | std::ios::app) {}

void FileSink::write(const LogRecord& record) {
    if (!m_out.is_open()) return;
    m_out << format_record(record, true) << '\n';
}

void FileSink::flush() {
    if (m_out.is_open()) {
        m_out.flush();
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(std::string_view name) : m_name(name) {}

void Logger::log(LogLevel level, std::string_view msg, SourceLocation loc) {
    if (level < m_level || level == LogLevel::Off) return;

    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (level < s.global_level) return;

    const LogRecord record{
        .level = level,
        .message = msg,
        .logger_name = m_name,
        .location = loc,
        .timestamp = std::chrono::system_clock::now()
    };
    for (auto& sink : s.sinks) {
        sink->write(record);
    }
}

// ============================================================================
// logging::
// ============================================================================

namespace logging {

void init() {
    std::vector<std::unique_ptr<LogSink>> sinks;
    sinks.push_back(std::make_unique<ConsoleSink>());
    init(std::move(sinks));
}

void init(std::vector<std::unique_ptr<LogSink>> sinks) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.initialized) return;

    s.sinks = std::move(sinks);
    s.initialized = true;
}

void shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    for (auto& sink : s.sinks) {
        sink->flush();
    }
    s.sinks.clear();
    s.loggers.clear();
    s.initialized = false;
}

void add_sink(std::unique_ptr<LogSink> sink) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.sinks.push_back(std::move(sink));
}

void set_level(LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.global_level = level;
}

LogLevel level() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.global_level;
}

Logger& get(std::string_view name) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    std::string key(name);
    auto it = s.loggers.find(key);
    if (it == s.loggers.end()) {
        it = s.loggers.emplace(key, std::make_unique<Logger>(name)).first;
    }
    return *it->second;
}

Logger& default_logger() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (!s.initialized) {
        init();
    }
    return get(DEFAULT_LOGGER);
}

void flush() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    for (auto& sink : s.sinks) {
        sink->flush();
    }
}

} // namespace logging

} // namespace folio
