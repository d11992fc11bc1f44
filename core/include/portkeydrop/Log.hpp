// Minimal logging utility (header-only) for the PortkeyDrop core.
// Controlled by PORTKEYDROP_LOG: "1/true/yes/on" enables info and above,
// or a level name (debug|info|warn|error) sets the minimum level.
#pragma once
#include "RuntimeLogging.hpp"

#include <cstdarg>
#include <cstdio>

namespace portkeydrop {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

inline LogLevel configuredLogLevel() {
    const std::string v = normalizedEnv("PORTKEYDROP_LOG");
    if (v.empty() || v == "0" || v == "false" || v == "off" || v == "no")
        return LogLevel::Off;
    if (v == "debug")
        return LogLevel::Debug;
    if (v == "warn" || v == "warning")
        return LogLevel::Warn;
    if (v == "error")
        return LogLevel::Error;
    return LogLevel::Info;
}

inline bool logEnabled(LogLevel level) {
    const LogLevel min = configuredLogLevel();
    return min != LogLevel::Off && static_cast<int>(level) >= static_cast<int>(min);
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 2, 3)))
#endif
inline void logf(const char *level, const char *fmt, ...) {
    std::fprintf(stderr, "[PortkeyDrop][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace portkeydrop

#define PKD_LOGD(fmt, ...)                                                     \
    do {                                                                       \
        if (portkeydrop::logEnabled(portkeydrop::LogLevel::Debug))             \
            portkeydrop::logf("DEBUG", fmt, ##__VA_ARGS__);                    \
    } while (0)

#define PKD_LOGI(fmt, ...)                                                     \
    do {                                                                       \
        if (portkeydrop::logEnabled(portkeydrop::LogLevel::Info))              \
            portkeydrop::logf("INFO", fmt, ##__VA_ARGS__);                     \
    } while (0)

#define PKD_LOGW(fmt, ...)                                                     \
    do {                                                                       \
        if (portkeydrop::logEnabled(portkeydrop::LogLevel::Warn))              \
            portkeydrop::logf("WARN", fmt, ##__VA_ARGS__);                     \
    } while (0)

#define PKD_LOGE(fmt, ...)                                                     \
    do {                                                                       \
        if (portkeydrop::logEnabled(portkeydrop::LogLevel::Error))             \
            portkeydrop::logf("ERROR", fmt, ##__VA_ARGS__);                    \
    } while (0)
