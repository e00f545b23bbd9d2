#include "aidcluster/log.hpp"

#include <cctype>
#include <cstdarg>
#include <cstdlib>
#include <string>

namespace aidcluster {

namespace {

LogLevel parse_level(const char* e) {
    if (!e || !*e) return LogLevel::Warn;
    std::string v(e);
    for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "debug" || v == "1" || v == "y") return LogLevel::Debug;
    if (v == "info") return LogLevel::Info;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "error") return LogLevel::Error;
    if (v == "off" || v == "0" || v == "n") return LogLevel::Off;
    return LogLevel::Warn;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        default:              return "";
    }
}

}  // namespace

LogLevel log_threshold() {
    static const LogLevel once = parse_level(std::getenv("AIDCLUSTER_LOG"));
    return once;
}

void log_message(LogLevel level, const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::fprintf(stderr, "[%s] %s: ", tag, level_name(level));
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
    va_end(args);
}

}  // namespace aidcluster
