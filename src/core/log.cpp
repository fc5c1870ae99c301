#include "audience/log.hpp"

#include <iostream>

namespace audience {

std::optional<LogLevel> try_parse_log_level(std::string_view text) {
    if (text == "0" || text == "error" || text == "ERROR") return LogLevel::Error;
    if (text == "1" || text == "warn" || text == "WARN") return LogLevel::Warn;
    if (text == "2" || text == "info" || text == "INFO") return LogLevel::Info;
    if (text == "3" || text == "debug" || text == "DEBUG") return LogLevel::Debug;
    return std::nullopt;
}

LogLevel parse_log_level(std::string_view text, LogLevel def) {
    return try_parse_log_level(text).value_or(def);
}

const char* log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:
    default: return "INFO";
    }
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    level_ = level;
}

LogLevel Logger::level() const {
    return level_;
}

void Logger::log(LogLevel level, std::string_view tag, std::string_view message) const {
    if (static_cast<int>(level) > static_cast<int>(level_))
        return;

    // stdout carries command replies, so every level goes to stderr
    std::ostream& os = (level == LogLevel::Error) ? std::cerr : std::clog;
    os << log_level_name(level) << " [" << tag << "] " << message << "\n";
}

} // namespace audience
