#include "rpn2tex/log.hpp"

#include <cctype>
#include <iostream>
#include <mutex>

namespace rpn2tex::log {

static LogLevel g_level = LogLevel::Warn;
static std::ostream* g_sink = nullptr;
static std::mutex g_mutex;

static bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

static const LogLevel kAllLevels[] = {
    LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
    LogLevel::Warn,  LogLevel::Error, LogLevel::Off,
};

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "???";
}

bool is_level_name(std::string_view s) {
    for (LogLevel l : kAllLevels) {
        if (iequals(s, level_name(l))) return true;
    }
    return false;
}

LogLevel parse_level(std::string_view s) {
    for (LogLevel l : kAllLevels) {
        if (iequals(s, level_name(l))) return l;
    }
    return LogLevel::Info;
}

void set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_level = level;
}

LogLevel level() {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_level;
}

void set_sink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_sink = sink;
}

void write(LogLevel level, std::string_view module, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_mutex);
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << '[' << level_name(level) << "] " << module << ": " << message << '\n';
}

} // namespace rpn2tex::log
