#include <labyrinth/core/log.hpp>
#include <cstdio>
#include <vector>
#include <algorithm>
#include <cctype>
#include <cstring>

namespace labyrinth::core {

static LogLevel s_log_level = LogLevel::Info;
static std::vector<ILogSink*> s_log_sinks;

namespace {

// "[Quiz] Presenting q1" -> "Quiz"
std::string extract_category(const char* message) {
    if (!message || message[0] != '[') return "";
    const char* end = std::strchr(message, ']');
    if (!end) return "";
    return std::string(message + 1, end);
}

} // anonymous namespace

void log(LogLevel level, const char* message) {
    if (level < s_log_level || !message) return;

    std::FILE* stream = level >= LogLevel::Warn ? stderr : stdout;
    std::fprintf(stream, "[%s] %s\n", get_log_level_name(level), message);

    // Forward to registered sinks
    std::string category = extract_category(message);
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, category, message);
        }
    }
}

void set_log_level(LogLevel level) {
    s_log_level = level;
}

LogLevel get_log_level() {
    return s_log_level;
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    s_log_sinks.push_back(sink);
}

void remove_log_sink(ILogSink* sink) {
    if (!sink) return;
    s_log_sinks.erase(
        std::remove(s_log_sinks.begin(), s_log_sinks.end(), sink),
        s_log_sinks.end()
    );
}

const char* get_log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
    }
    return "unknown";
}

bool parse_log_level(std::string_view name, LogLevel& out_level) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const LogLevel levels[] = {
        LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
        LogLevel::Warn, LogLevel::Error, LogLevel::Fatal
    };
    for (LogLevel level : levels) {
        if (lower == get_log_level_name(level)) {
            out_level = level;
            return true;
        }
    }
    if (lower == "warning") {
        out_level = LogLevel::Warn;
        return true;
    }
    return false;
}

} // namespace labyrinth::core
