#pragma once

#include "docpress/layout.h"
#include "docpress/style.h"
#include "docpress/text_cursor.h"
#include <optional>
#include <string>
#include <vector>

namespace docpress {

/// One colon-separated part of a directive token: "page-A3-h" has key
/// "page" and modifiers {"A3", "h"}.
struct DirectivePart {
    std::string key;
    std::vector<std::string> modifiers;
};

/// A directive token such as "margin-T-20:margin-B-15"
struct Directive {
    std::vector<DirectivePart> parts;

    static Directive parse(const std::string& token);
};

/// Block kinds opened by a "::" line
enum class BlockKind {
    Header,
    Footer,
    Table,
    Unknown,
};

BlockKind parseBlockKind(const std::string& token);

/// Style prefix of a content line, e.g. "center:120%"
struct LineStyle {
    TextAlignment alignment = TextAlignment::Left;
    std::optional<int> scalePercent;   // Font size scale for one line

    /// Unknown or malformed tokens are ignored
    static LineStyle parse(const std::string& prefix);
};

/// Counters collected while interpreting a document
struct MarkupStats {
    int setupLines = 0;      // ":::" lines
    int blocks = 0;          // "::" blocks
    int contentLines = 0;    // Lines printed
};

/// Interprets the line-oriented markup and drives a LayoutEngine.
///
///   ":::key-mod:key-mod ..."  page setup (page size, margins)
///   "::kind" ... "::"          block; inner lines are styled content lines
///   ":style:style text"        styled content line
///   "\:text"                   plain line that starts with a colon
///   anything else              plain line, left aligned
///
/// Blank lines and leading whitespace are skipped. Unknown directives and
/// style tokens are ignored; an unknown page size throws LookupFailure.
class MarkupInterpreter {
public:
    explicit MarkupInterpreter(LayoutEngine& layout);

    /// Interpret until the cursor reaches the end of text
    MarkupStats run(TextCursor& cursor);

    MarkupStats run(const std::string& markup);

private:
    LayoutEngine& layout_;
    MarkupStats stats_;

    void applySetup(const std::string& line);
    void applyMargin(const DirectivePart& part);
    /// Returns false if the text ended inside the block
    bool runBlock(TextCursor& cursor);
    void printStyled(const std::string& line);
    void printPlain(const std::string& line);
};

/// Built-in demonstration document: a styled heading, a long run that wraps
/// across pages, then a switch to A3 landscape.
std::string sampleMarkup();

} // namespace docpress
