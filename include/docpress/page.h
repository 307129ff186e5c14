#pragma once

#include <string>
#include <vector>

namespace docpress {

/// A single text run placed on a page
struct TextRun {
    std::string text;
    std::string font;
    float fontSize = 0;
    float x = 0;           // Horizontal position from left edge of page
    float y = 0;           // Baseline position from top edge of page
};

/// Types of visual decorations on a page
enum class DecorationType {
    MarginRect,
    DebugTick,
};

/// A non-text element on a page.
/// MarginRect: rectangle at (x, y) of size width x height.
/// DebugTick: line from (x, y) to (x + width, y + height).
struct Decoration {
    DecorationType type = DecorationType::MarginRect;
    float x = 0;
    float y = 0;
    float width = 0;
    float height = 0;
};

/// A single laid-out page
struct Page {
    int pageIndex = 0;
    float width = 0;
    float height = 0;
    std::vector<TextRun> runs;
    std::vector<Decoration> decorations;

    /// Text of each visual line: runs sharing a baseline, joined left to right
    std::vector<std::string> lineTexts() const;
};

/// Warning types that may occur during layout
enum class LayoutWarning {
    None,
    EmptyContent,
};

/// Result of laying out one document
struct LayoutResult {
    std::vector<Page> pages;
    std::vector<LayoutWarning> warnings;
};

} // namespace docpress
