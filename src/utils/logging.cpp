#include "utils/logging.hpp"

#include <chrono>
#include <ctime>

namespace auraseal::utils {

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::setLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::enabled(LogLevel level) const
{
    return level != LogLevel::Off && level >= this->level();
}

const char* Logger::levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    default:
        return "ERROR";
    }
}

void Logger::log(LogLevel level, const char* fmt, ...)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (level == LogLevel::Off || level < level_) {
        return;
    }

    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local {};
    localtime_r(&now, &local);
    char timestamp[32];
    std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &local);

    std::fprintf(stderr, "%s [%s] ", timestamp, levelName(level));
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fprintf(stderr, "\n");
}

} // namespace auraseal::utils
