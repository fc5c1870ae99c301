#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace audience {

enum class LogLevel : int { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// "error"/"warn"/"info"/"debug" (or upper case, or 0-3); std::nullopt otherwise.
std::optional<LogLevel> try_parse_log_level(std::string_view text);

// Unknown text falls back to def.
LogLevel parse_log_level(std::string_view text, LogLevel def = LogLevel::Info);
const char* log_level_name(LogLevel level);

/*
 * Process-wide leveled log sink.
 * One line per message: <LEVEL> [<tag>] <message>
 * Errors go to std::cerr, everything else to std::clog.
 */
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    void log(LogLevel level, std::string_view tag, std::string_view message) const;

private:
    Logger() = default;
    LogLevel level_{LogLevel::Info};
};

namespace log {

inline void error(std::string_view tag, std::string_view message) {
    Logger::instance().log(LogLevel::Error, tag, message);
}

inline void warn(std::string_view tag, std::string_view message) {
    Logger::instance().log(LogLevel::Warn, tag, message);
}

inline void info(std::string_view tag, std::string_view message) {
    Logger::instance().log(LogLevel::Info, tag, message);
}

inline void debug(std::string_view tag, std::string_view message) {
    Logger::instance().log(LogLevel::Debug, tag, message);
}

} // namespace log

} // namespace audience
