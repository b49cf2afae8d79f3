#include <matebridge/core/logger.hpp>
#include <cctype>

namespace matebridge {

LogLevel parse_log_level(const std::string& name) {
    std::string lower;
    for (size_t i = 0; i < name.size(); ++i) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(name[i])));
    }
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : level_(LogLevel::INFO), file_(NULL) {}

Logger::~Logger() {
    if (file_) {
        fclose(file_);
        file_ = NULL;
    }
}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

bool Logger::set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        fclose(file_);
        file_ = NULL;
    }
    if (path.empty()) return true;

    file_ = fopen(path.c_str(), "a");
    return file_ != NULL;
}

void Logger::debug(const char* fmt, ...) {
    if (level_ > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl("DEBUG", fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    if (level_ > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl("INFO", fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    if (level_ > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl("WARN", fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    if (level_ > LogLevel::ERROR) return;
    va_list args;
    va_start(args, fmt);
    log_impl("ERROR", fmt, args);
    va_end(args);
}

void Logger::log_impl(const char* level_str, const char* fmt, va_list args) {
    char message[4096];
    vsnprintf(message, sizeof(message), fmt, args);

    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    std::lock_guard<std::mutex> lock(mutex_);
    fprintf(stderr, "[%s] [%s] %s\n", timestamp, level_str, message);
    fflush(stderr);

    if (file_) {
        fprintf(file_, "[%s] [%s] %s\n", timestamp, level_str, message);
        fflush(file_);
    }
}

} // namespace matebridge
