// Runtime policy helpers for diagnostics/sensitive logging. Hosts and user
// names reach the logs only with SKIFF_ENV=dev and SKIFF_LOG_SENSITIVE=1.
#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace skiff {

inline std::string trimmed(const std::string &in) {
    std::size_t start = 0;
    while (start < in.size() &&
           std::isspace(static_cast<unsigned char>(in[start]))) {
        ++start;
    }
    std::size_t end = in.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(in[end - 1]))) {
        --end;
    }
    return in.substr(start, end - start);
}

inline std::string lowered(std::string in) {
    for (char &c : in)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return in;
}

inline std::string normalizedEnv(const char *name) {
    if (!name)
        return {};
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return {};
    return lowered(trimmed(raw));
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

inline bool isDevEnvironment() {
    const std::string env = normalizedEnv("SKIFF_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("SKIFF_LOG_SENSITIVE");
}

} // namespace skiff
