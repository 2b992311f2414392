#pragma once

#include <format>
#include <string>
#include <string_view>

namespace labyrinth::core {

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

void log(LogLevel level, const char* message);
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

const char* get_log_level_name(LogLevel level);
bool parse_log_level(std::string_view name, LogLevel& out_level);

// Throws std::format_error when pattern does not match the arguments
template<typename... Args>
std::string format_message(std::string_view pattern, const Args&... args) {
    return std::vformat(pattern, std::make_format_args(args...));
}

template<typename... Args>
void log(LogLevel level, std::string_view pattern, const Args&... args) {
    if (level < get_log_level()) return;
    std::string message;
    try {
        message = format_message(pattern, args...);
    } catch (const std::format_error& e) {
        message = std::string(pattern) + " [format error: " + e.what() + "]";
    }
    log(level, message.c_str());
}

} // namespace labyrinth::core
