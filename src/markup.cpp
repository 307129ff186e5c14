#include "docpress/markup.h"
#include "docpress/errors.h"
#include "docpress/log.h"
#include <cctype>
#include <cstdlib>
#include <utility>

namespace docpress {

namespace {

const char* const kBlankChars = " \t\r\n";
const char* const kBlockTerminator = "::";

bool matched(EatResult result) {
    return result == EatResult::Matched;
}

/// Split on a single separator, keeping empty fields
std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> fields;
    size_t start = 0;
    for (;;) {
        size_t end = text.find(separator, start);
        if (end == std::string::npos) {
            fields.push_back(text.substr(start));
            return fields;
        }
        fields.push_back(text.substr(start, end - start));
        start = end + 1;
    }
}

/// Split "prefix  text" at the first run of spaces.
/// The second element is empty when the line has no space.
std::pair<std::string, std::optional<std::string>> splitPrefix(const std::string& line) {
    size_t space = line.find(' ');
    if (space == std::string::npos) {
        return {line, std::nullopt};
    }
    size_t textStart = line.find_first_not_of(' ', space);
    std::string text = textStart == std::string::npos ? "" : line.substr(textStart);
    return {line.substr(0, space), text};
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(kBlankChars);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(kBlankChars);
    return s.substr(start, end - start + 1);
}

std::optional<float> parseNumber(const std::string& text) {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    float value = std::strtof(text.c_str(), &end);
    if (end != text.c_str() + text.size()) return std::nullopt;
    return value;
}

/// "120%" -> 120; nullopt unless a positive integer followed by '%'
std::optional<int> parsePercent(const std::string& token) {
    if (token.size() < 2 || token.back() != '%') return std::nullopt;
    std::string digits = token.substr(0, token.size() - 1);
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    if (digits.size() > 6) return std::nullopt;
    int value = std::atoi(digits.c_str());
    if (value <= 0) return std::nullopt;
    return value;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Directive parsing
// ---------------------------------------------------------------------------

Directive Directive::parse(const std::string& token) {
    Directive directive;
    for (const auto& partText : split(token, ':')) {
        if (partText.empty()) continue;
        auto fields = split(partText, '-');
        DirectivePart part;
        part.key = fields[0];
        part.modifiers.assign(fields.begin() + 1, fields.end());
        directive.parts.push_back(std::move(part));
    }
    return directive;
}

BlockKind parseBlockKind(const std::string& token) {
    if (token == "header") return BlockKind::Header;
    if (token == "footer") return BlockKind::Footer;
    if (token == "table") return BlockKind::Table;
    return BlockKind::Unknown;
}

LineStyle LineStyle::parse(const std::string& prefix) {
    LineStyle style;
    for (const auto& part : Directive::parse(prefix).parts) {
        if (part.key == "left") {
            style.alignment = TextAlignment::Left;
        } else if (part.key == "center") {
            style.alignment = TextAlignment::Center;
        } else if (part.key == "right") {
            style.alignment = TextAlignment::Right;
        } else if (auto percent = parsePercent(part.key)) {
            style.scalePercent = *percent;
        } else {
            DP_LOGD("markup: ignoring style token '%s'", part.key.c_str());
        }
        // A percentage may also trail a token: "center-120%"
        for (const auto& modifier : part.modifiers) {
            if (auto percent = parsePercent(modifier)) {
                style.scalePercent = *percent;
            }
        }
    }
    return style;
}

// ---------------------------------------------------------------------------
// Interpreter
// ---------------------------------------------------------------------------

MarkupInterpreter::MarkupInterpreter(LayoutEngine& layout)
    : layout_(layout) {}

MarkupStats MarkupInterpreter::run(const std::string& markup) {
    TextCursor cursor(markup);
    return run(cursor);
}

MarkupStats MarkupInterpreter::run(TextCursor& cursor) {
    stats_ = MarkupStats{};
    for (;;) {
        if (!cursor.skip(kBlankChars)) break;

        if (matched(cursor.eat("\\:"))) {
            printPlain(":" + cursor.nextLine().value_or(""));
            continue;
        }

        if (matched(cursor.eat(":"))) {
            if (matched(cursor.eat(":"))) {
                if (matched(cursor.eat(":"))) {
                    if (!cursor.skip(" \t")) break;
                    auto line = cursor.nextLine();
                    if (!line) break;
                    applySetup(*line);
                    continue;
                }
                if (!runBlock(cursor)) break;
                continue;
            }
            auto line = cursor.nextLine();
            if (!line) break;
            printStyled(*line);
            continue;
        }

        auto line = cursor.nextLine();
        if (!line) break;
        printPlain(*line);
    }
    return stats_;
}

void MarkupInterpreter::applySetup(const std::string& line) {
    ++stats_.setupLines;
    auto directive = Directive::parse(splitPrefix(line).first);
    for (const auto& part : directive.parts) {
        if (part.key == "page") {
            if (part.modifiers.empty() || part.modifiers[0].empty()) {
                throw LookupFailure("page directive without a page size: '" + line + "'");
            }
            PageSize size = lookupPageSize(part.modifiers[0]);
            bool landscape = part.modifiers.size() > 1 && !part.modifiers[1].empty() &&
                             std::toupper(static_cast<unsigned char>(part.modifiers[1][0])) == 'H';
            DP_LOGI("markup: pageSize=%s landscape=%d", part.modifiers[0].c_str(), landscape ? 1 : 0);
            layout_.newPage();
            layout_.setPageSize(size, landscape);
        } else if (part.key == "margin") {
            applyMargin(part);
        } else {
            DP_LOGD("markup: ignoring directive '%s'", part.key.c_str());
        }
    }
}

void MarkupInterpreter::applyMargin(const DirectivePart& part) {
    if (part.modifiers.empty()) return;

    // "margin-20" sets all four; "margin-TB-20" selects sides
    if (part.modifiers.size() == 1) {
        auto value = parseNumber(part.modifiers[0]);
        if (!value) {
            DP_LOGD("markup: ignoring margin value '%s'", part.modifiers[0].c_str());
            return;
        }
        layout_.setMargin(*value);
        DP_LOGI("markup: margin=%.2f", *value);
        return;
    }

    auto value = parseNumber(part.modifiers[1]);
    if (!value) {
        DP_LOGD("markup: ignoring margin value '%s'", part.modifiers[1].c_str());
        return;
    }
    for (char side : part.modifiers[0]) {
        switch (std::toupper(static_cast<unsigned char>(side))) {
            case 'T':
                layout_.setMarginTop(*value);
                DP_LOGI("markup: margin top=%.2f", *value);
                break;
            case 'B':
                layout_.setMarginBottom(*value);
                DP_LOGI("markup: margin bottom=%.2f", *value);
                break;
            case 'L':
                layout_.setMarginLeft(*value);
                DP_LOGI("markup: margin left=%.2f", *value);
                break;
            case 'R':
                layout_.setMarginRight(*value);
                DP_LOGI("markup: margin right=%.2f", *value);
                break;
            default:
                break;
        }
    }
}

bool MarkupInterpreter::runBlock(TextCursor& cursor) {
    auto header = cursor.nextLine();
    if (!header) return false;
    ++stats_.blocks;

    auto parts = Directive::parse(splitPrefix(*header).first).parts;
    std::string kindName = parts.empty() ? "" : parts[0].key;
    if (parseBlockKind(kindName) == BlockKind::Unknown) {
        DP_LOGD("markup: block '%s'", kindName.c_str());
    } else {
        DP_LOGI("markup: block %s", kindName.c_str());
    }

    for (;;) {
        auto line = cursor.nextLine();
        if (!line) return false;
        if (trim(*line) == kBlockTerminator) return true;
        printStyled(*line);
    }
}

void MarkupInterpreter::printStyled(const std::string& line) {
    auto prefixed = splitPrefix(line);
    if (!prefixed.second) {
        printPlain(line);
        return;
    }

    LineStyle style = LineStyle::parse(prefixed.first);
    float baseSize = layout_.fontSize();
    if (style.scalePercent && *style.scalePercent != 100) {
        layout_.setFontSize(baseSize * static_cast<float>(*style.scalePercent) / 100.0f);
    }
    ++stats_.contentLines;
    layout_.print(*prefixed.second, style.alignment);
    layout_.newLine();
    if (layout_.fontSize() != baseSize) {
        layout_.setFontSize(baseSize);
    }
}

void MarkupInterpreter::printPlain(const std::string& line) {
    ++stats_.contentLines;
    layout_.println(line);
}

std::string sampleMarkup() {
    std::string sample = ":center:120% title\n:right date\ncontents...";
    for (int i = 0; i < 6000; ++i) {
        sample += static_cast<char>('A' + i % 26);
    }
    sample += "\n:::page-A3-h\nnext page";
    return sample;
}

} // namespace docpress
