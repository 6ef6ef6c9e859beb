#pragma once

#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace laurel::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Log sink interface for custom log handlers
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& category, const std::string& message) = 0;
};

// Dispatches an already formatted message to stdout and every registered sink
void write_log(LogLevel level, const std::string& category, const std::string& message);
void log(LogLevel level, const char* message);

void set_log_level(LogLevel level);
LogLevel get_log_level();
bool is_log_enabled(LogLevel level);

// Parses "trace", "debug", "info", "warn", "error" or "fatal"; returns fallback otherwise
LogLevel parse_log_level(std::string_view name, LogLevel fallback = LogLevel::Info);
const char* log_level_name(LogLevel level);

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

// ============================================================================
// Formatted logging
// ============================================================================

template<typename... Args>
void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    if (!is_log_enabled(level)) return;
    write_log(level, std::string{}, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_debug(const std::string& category, std::format_string<Args...> fmt, Args&&... args) {
    if (!is_log_enabled(LogLevel::Debug)) return;
    write_log(LogLevel::Debug, category, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_info(const std::string& category, std::format_string<Args...> fmt, Args&&... args) {
    if (!is_log_enabled(LogLevel::Info)) return;
    write_log(LogLevel::Info, category, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_warning(const std::string& category, std::format_string<Args...> fmt, Args&&... args) {
    if (!is_log_enabled(LogLevel::Warn)) return;
    write_log(LogLevel::Warn, category, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_error(const std::string& category, std::format_string<Args...> fmt, Args&&... args) {
    if (!is_log_enabled(LogLevel::Error)) return;
    write_log(LogLevel::Error, category, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace laurel::core
