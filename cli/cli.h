#pragma once

#include "docpress/log.h"
#include <optional>
#include <string>
#include <vector>

namespace docpress {
namespace cli {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

enum class Mode {
    Markup,
    Sheet,
    Sample,
};

struct Options {
    Mode mode = Mode::Markup;
    std::optional<LogLevel> logLevel;
    std::string fontPath;
    std::optional<float> fontSize;
    bool drawMarginLine = false;
    bool drawDebugPoints = false;
    std::optional<std::string> password;
    std::vector<std::string> files;
};

void printUsage();

/// Strip one pair of surrounding double quotes
std::string trimQuotes(const std::string& arg);

/// "dir/name.ext" + ".pages.txt" -> "dir/name.pages.txt"
std::string outputPath(const std::string& input, const std::string& suffix);

/// Parse arguments (without the program name). Options may appear before
/// or after the mode word. Returns false on a usage error.
bool parseArguments(const std::vector<std::string>& args, Options& options);

/// Convert every file in options. A failing file is logged and the next
/// one is processed. Returns kExitOk when all converted, else kExitFailed.
int run(const Options& options);

/// Entry point: parse argv, apply the log level, run
int main(int argc, char* argv[]);

} // namespace cli
} // namespace docpress
