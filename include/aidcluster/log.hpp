#ifndef AIDCLUSTER_LOG_HPP
#define AIDCLUSTER_LOG_HPP

#include <cstdio>

namespace aidcluster {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Threshold from AIDCLUSTER_LOG (debug|info|warn|error|off), read once.
// Defaults to Warn.
LogLevel log_threshold();

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(log_threshold());
}

void log_message(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

}  // namespace aidcluster

#define AC_LOG(level, tag, fmt, ...)                                          \
    do {                                                                      \
        if (::aidcluster::log_enabled(level))                                 \
            ::aidcluster::log_message(level, tag, fmt, ##__VA_ARGS__);        \
    } while (0)

#define AC_LOG_DEBUG(tag, fmt, ...) AC_LOG(::aidcluster::LogLevel::Debug, tag, fmt, ##__VA_ARGS__)
#define AC_LOG_INFO(tag, fmt, ...)  AC_LOG(::aidcluster::LogLevel::Info, tag, fmt, ##__VA_ARGS__)
#define AC_LOG_WARN(tag, fmt, ...)  AC_LOG(::aidcluster::LogLevel::Warn, tag, fmt, ##__VA_ARGS__)
#define AC_LOG_ERROR(tag, fmt, ...) AC_LOG(::aidcluster::LogLevel::Error, tag, fmt, ##__VA_ARGS__)

#endif  // AIDCLUSTER_LOG_HPP
