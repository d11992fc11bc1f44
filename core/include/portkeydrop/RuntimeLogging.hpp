// Runtime policy helpers for diagnostics/sensitive logging.
#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace portkeydrop {

// Trimmed, lower-cased value of an environment variable ("" when unset).
inline std::string normalizedEnv(const char *name) {
    const char *raw = name ? std::getenv(name) : nullptr;
    if (!raw)
        return {};
    const std::string value(raw);
    const char *ws = " \t\r\n";
    const auto first = value.find_first_not_of(ws);
    if (first == std::string::npos)
        return {};
    const auto last = value.find_last_not_of(ws);
    std::string out = value.substr(first, last - first + 1);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

inline bool isDevEnvironment() {
    const std::string env = normalizedEnv("PORTKEYDROP_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

// Usernames and hosts may only appear verbatim in logs when both a
// development environment and the explicit opt-in flag are present.
inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("PORTKEYDROP_LOG_SENSITIVE");
}

inline std::string redacted(const std::string &value) {
    if (sensitiveLoggingEnabled())
        return value;
    return value.empty() ? std::string() : std::string("<redacted>");
}

} // namespace portkeydrop
