#include "cli.h"

#include "docpress/engine.h"
#include "docpress/errors.h"
#include "docpress/fixed_metrics.h"
#include "docpress/freetype_metrics.h"
#include "docpress/markup.h"
#include "docpress/spreadsheet.h"
#include "docpress/text_sink.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>

namespace docpress {
namespace cli {

namespace {

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw LookupFailure("cannot read '" + path + "'");
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

std::ofstream createOutput(const std::string& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw SinkFailure("cannot create '" + path + "'");
    }
    return out;
}

Style documentStyle(const Options& options) {
    Style style;
    if (options.mode == Mode::Sheet) {
        style = Style::spreadsheetProfile();
        if (options.fontSize) style.fontSize = *options.fontSize;
    } else if (options.fontSize) {
        style.fontSize = *options.fontSize;
        style.lineSpace = *options.fontSize / 2;
    }
    style.drawMarginLine = options.drawMarginLine;
    style.drawDebugPoints = options.drawDebugPoints;
    return style;
}

void convertMarkup(Engine& engine, const std::string& path, const Style& style) {
    std::string markup = readFile(path);
    std::string target = outputPath(path, ".pages.txt");
    std::ofstream out = createOutput(target);
    TextDumpSink sink(out);
    int pages = engine.renderMarkup(markup, sink, style);
    DP_LOGI("%s -> %s (%d pages)", path.c_str(), target.c_str(), pages);
}

/// Write the page dump of the built-in sample document to target
void writeSample(Engine& engine, const std::string& target, const Style& style) {
    std::ofstream out = createOutput(target);
    TextDumpSink sink(out);
    int pages = engine.renderMarkup(sampleMarkup(), sink, style);
    DP_LOGI("sample -> %s (%d pages)", target.c_str(), pages);
}

void convertSheet(Engine& engine, const std::string& path, const Style& style,
                  const SourceOptions& sourceOptions) {
    auto source = openSpreadsheet(path, sourceOptions);

    std::string pagesTarget = outputPath(path, ".pages.txt");
    {
        std::ofstream out = createOutput(pagesTarget);
        TextDumpSink sink(out);
        int pages = engine.renderSpreadsheet(*source, sink, style);
        DP_LOGI("%s -> %s (%d pages)", path.c_str(), pagesTarget.c_str(), pages);
    }

    std::string textTarget = outputPath(path, ".txt");
    std::ofstream out = createOutput(textTarget);
    int sheets = SheetPrinter::dump(*source, out);
    DP_LOGI("%s -> %s (%d sheets)", path.c_str(), textTarget.c_str(), sheets);
}

} // anonymous namespace

void printUsage() {
    std::fprintf(stderr,
        "usage: docpress [options] <markup|sheet> <files...>\n"
        "       docpress [options] sample <output>\n"
        "  -v <level>     log level: debug, info, warn, error, off (default warn)\n"
        "  -f <font>      TrueType/OpenType font for measurement (default: built-in Courier metrics)\n"
        "  -s <points>    base font size\n"
        "  -m             draw margin rectangles\n"
        "  -d             draw debug tick marks at horizontal stops\n"
        "  -p <password>  password for protected spreadsheet sources\n");
}

std::string trimQuotes(const std::string& arg) {
    if (arg.size() >= 2 && arg.front() == '"' && arg.back() == '"') {
        return arg.substr(1, arg.size() - 2);
    }
    return arg;
}

std::string outputPath(const std::string& input, const std::string& suffix) {
    size_t slash = input.find_last_of("/\\");
    size_t dot = input.rfind('.');
    bool hasExtension = dot != std::string::npos && dot > 0 &&
                        (slash == std::string::npos || dot > slash + 1);
    return (hasExtension ? input.substr(0, dot) : input) + suffix;
}

bool parseArguments(const std::vector<std::string>& args, Options& options) {
    bool haveMode = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&](const char* name) -> const std::string* {
            if (i + 1 >= args.size()) {
                std::fprintf(stderr, "docpress: %s requires a value\n", name);
                return nullptr;
            }
            return &args[++i];
        };

        if (arg == "-v") {
            const std::string* text = value("-v");
            if (!text) return false;
            auto level = parseLogLevel(*text);
            if (!level) {
                std::fprintf(stderr, "docpress: unknown log level '%s'\n", text->c_str());
                return false;
            }
            options.logLevel = level;
        } else if (arg == "-f") {
            const std::string* text = value("-f");
            if (!text) return false;
            options.fontPath = trimQuotes(*text);
        } else if (arg == "-s") {
            const std::string* text = value("-s");
            if (!text) return false;
            char* end = nullptr;
            float size = std::strtof(text->c_str(), &end);
            if (text->empty() || *end != '\0' || !(size > 0)) {
                std::fprintf(stderr, "docpress: invalid font size '%s'\n", text->c_str());
                return false;
            }
            options.fontSize = size;
        } else if (arg == "-m") {
            options.drawMarginLine = true;
        } else if (arg == "-d") {
            options.drawDebugPoints = true;
        } else if (arg == "-p") {
            const std::string* text = value("-p");
            if (!text) return false;
            options.password = *text;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::fprintf(stderr, "docpress: unknown option '%s'\n", arg.c_str());
            return false;
        } else if (!haveMode) {
            if (arg == "markup") {
                options.mode = Mode::Markup;
            } else if (arg == "sheet") {
                options.mode = Mode::Sheet;
            } else if (arg == "sample") {
                options.mode = Mode::Sample;
            } else {
                std::fprintf(stderr, "docpress: unknown command '%s'\n", arg.c_str());
                return false;
            }
            haveMode = true;
        } else {
            options.files.push_back(trimQuotes(arg));
        }
    }
    return haveMode && !options.files.empty();
}

int run(const Options& options) {
    std::shared_ptr<FontMetrics> metrics;
    try {
        if (options.fontPath.empty()) {
            metrics = std::make_shared<FixedPitchMetrics>();
        } else {
            metrics = std::make_shared<FreeTypeMetrics>(options.fontPath);
        }
    } catch (const Error& e) {
        DP_LOGE("%s", e.what());
        return kExitFailed;
    }

    Engine engine(metrics);
    Style style = documentStyle(options);
    SourceOptions sourceOptions;
    sourceOptions.password = options.password;

    int converted = 0;
    int failed = 0;
    for (const auto& path : options.files) {
        try {
            switch (options.mode) {
                case Mode::Markup:
                    convertMarkup(engine, path, style);
                    break;
                case Mode::Sheet:
                    convertSheet(engine, path, style, sourceOptions);
                    break;
                case Mode::Sample:
                    writeSample(engine, path, style);
                    break;
            }
            ++converted;
        } catch (const std::exception& e) {
            DP_LOGE("%s: %s", path.c_str(), e.what());
            ++failed;
        }
    }

    DP_LOGI("%d file(s) converted, %d failed", converted, failed);
    return failed == 0 ? kExitOk : kExitFailed;
}

int main(int argc, char* argv[]) {
    Options options;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    if (!parseArguments(args, options)) {
        printUsage();
        return kExitUsage;
    }
    if (options.logLevel) {
        setLogLevel(*options.logLevel);
    }
    return run(options);
}

} // namespace cli
} // namespace docpress
