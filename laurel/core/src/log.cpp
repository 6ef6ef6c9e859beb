#include <laurel/core/log.hpp>
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <mutex>
#include <vector>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace laurel::core {

static std::atomic<LogLevel> s_log_level{LogLevel::Info};
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

void write_log(LogLevel level, const std::string& category, const std::string& message) {
    if (level < s_log_level.load()) return;

    std::string line;
    if (category.empty()) {
        line = message;
    } else {
        line.reserve(category.size() + message.size() + 3);
        line += '[';
        line += category;
        line += "] ";
        line += message;
    }

#ifdef _WIN32
    OutputDebugStringA(line.c_str());
    OutputDebugStringA("\n");
#endif
    std::FILE* stream = level >= LogLevel::Warn ? stderr : stdout;
    std::fprintf(stream, "%s\n", line.c_str());

    // Forward to registered sinks
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, category, message);
        }
    }
}

void log(LogLevel level, const char* message) {
    write_log(level, std::string{}, message ? message : "");
}

void set_log_level(LogLevel level) {
    s_log_level = level;
}

LogLevel get_log_level() {
    return s_log_level.load();
}

bool is_log_enabled(LogLevel level) {
    return level >= s_log_level.load();
}

LogLevel parse_log_level(std::string_view name, LogLevel fallback) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "fatal") return LogLevel::Fatal;
    return fallback;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
    }
    return "info";
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.push_back(sink);
}

void remove_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.erase(
        std::remove(s_log_sinks.begin(), s_log_sinks.end(), sink),
        s_log_sinks.end()
    );
}

} // namespace laurel::core
