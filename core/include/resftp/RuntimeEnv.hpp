// Environment helpers shared by config loading and logging policy.
#pragma once

#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>

namespace resftp {

// Trimmed raw value, or nullopt when unset/blank.
inline std::optional<std::string> envValue(const char *name) {
    if (!name)
        return std::nullopt;
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return std::nullopt;
    std::string out(raw);
    std::size_t start = 0;
    while (start < out.size() &&
           std::isspace(static_cast<unsigned char>(out[start]))) {
        ++start;
    }
    std::size_t end = out.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(out[end - 1]))) {
        --end;
    }
    out = out.substr(start, end - start);
    if (out.empty())
        return std::nullopt;
    return out;
}

inline std::string normalizedEnv(const char *name) {
    std::string out = envValue(name).value_or(std::string());
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

inline bool isDevEnvironment() {
    const std::string env = normalizedEnv("RESFTP_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

// Remote paths are only logged when explicitly allowed in a dev setup.
inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("RESFTP_LOG_SENSITIVE");
}

} // namespace resftp
