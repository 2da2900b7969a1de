/*
 * Scratchpad C++ - Logger
 *
 * Process-wide stderr logger with printf-style macros.
 */
#ifndef scratchpad_CORE_LOGGER_HPP
#define scratchpad_CORE_LOGGER_HPP

#include <string>
#include <cstdarg>

namespace scratchpad {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

// Parse "debug" / "info" / "warn" / "error" / "off" (case-insensitive).
// Unknown names yield fallback.
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);

    void debug(const char* file, int line, const char* func, const char* fmt, ...);
    void info(const char* file, int line, const char* func, const char* fmt, ...);
    void warn(const char* file, int line, const char* func, const char* fmt, ...);
    void error(const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    LogLevel level_;
};

#define LOG_DEBUG(...) scratchpad::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  scratchpad::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  scratchpad::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) scratchpad::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace scratchpad

#endif // scratchpad_CORE_LOGGER_HPP
