/*
 * MateBridge C++11 - Logger
 *
 * Process-wide printf-style logger. Lines go to stderr and, when configured,
 * are appended to a log file as well.
 */
#ifndef MATEBRIDGE_CORE_LOGGER_HPP
#define MATEBRIDGE_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>

namespace matebridge {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error" (case-insensitive), INFO otherwise
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Mirror log lines into an append-mode file. Empty path closes the file.
    bool set_file(const std::string& path);

    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

private:
    Logger();
    ~Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(const char* level_str, const char* fmt, va_list args);

    LogLevel level_;
    FILE* file_;
    std::mutex mutex_;
};

#define LOG_DEBUG(...) matebridge::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  matebridge::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  matebridge::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) matebridge::Logger::instance().error(__VA_ARGS__)

} // namespace matebridge

#endif // MATEBRIDGE_CORE_LOGGER_HPP
