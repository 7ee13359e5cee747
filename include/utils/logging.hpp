#pragma once

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace auraseal::utils {

enum class LogLevel { Trace = 0, Debug, Info, Warn, Error, Off };

class Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const;

    void log(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

private:
    Logger() = default;

    static const char* levelName(LogLevel level);

    mutable std::mutex mutex_;
    LogLevel level_ {LogLevel::Info};
};

} // namespace auraseal::utils
