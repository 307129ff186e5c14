#include "docpress/log.h"
#include <algorithm>
#include <atomic>
#include <cctype>

namespace docpress {

namespace {

std::atomic<LogLevel> gLevel{LogLevel::Warn};

} // anonymous namespace

LogLevel logLevel() {
    return gLevel.load(std::memory_order_relaxed);
}

void setLogLevel(LogLevel level) {
    gLevel.store(level, std::memory_order_relaxed);
}

std::optional<LogLevel> parseLogLevel(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

} // namespace docpress
