#pragma once

/// Leveled logging macros for the docpress library and CLI.
/// Messages go to stderr; the process-wide threshold filters them.

#include <cstdio>
#include <optional>
#include <string>

namespace docpress {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

/// Current threshold (default: Warn)
LogLevel logLevel();

void setLogLevel(LogLevel level);

/// Parse "debug", "info", "warn"/"warning", "error" or "off" (case-insensitive)
std::optional<LogLevel> parseLogLevel(const std::string& text);

inline bool logEnabled(LogLevel level) {
    return level >= logLevel() && level != LogLevel::Off;
}

} // namespace docpress

#define DP_LOG_AT(level, tag, fmt, ...)                                          \
    do {                                                                         \
        if (docpress::logEnabled(level)) {                                       \
            fprintf(stderr, "[Docpress " tag "] " fmt "\n", ##__VA_ARGS__);      \
        }                                                                        \
    } while (0)

#define DP_LOGD(fmt, ...) DP_LOG_AT(docpress::LogLevel::Debug, "D", fmt, ##__VA_ARGS__)
#define DP_LOGI(fmt, ...) DP_LOG_AT(docpress::LogLevel::Info,  "I", fmt, ##__VA_ARGS__)
#define DP_LOGW(fmt, ...) DP_LOG_AT(docpress::LogLevel::Warn,  "W", fmt, ##__VA_ARGS__)
#define DP_LOGE(fmt, ...) DP_LOG_AT(docpress::LogLevel::Error, "E", fmt, ##__VA_ARGS__)
