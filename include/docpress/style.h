#pragma once

#include <string>

namespace docpress {

/// Page dimensions in points
struct PageSize {
    float width = 595.27563f;    // A4
    float height = 841.8898f;

    /// Same size with width and height swapped
    PageSize landscape() const { return {height, width}; }
};

/// Look up a standard page size by name (A0-A6, LETTER, LEGAL), ignoring case.
/// Throws LookupFailure for an unknown name.
PageSize lookupPageSize(const std::string& name);

/// Text alignment options
enum class TextAlignment {
    Left,
    Center,
    Right,
};

/// Document settings applied when a layout starts.
struct Style {
    PageSize pageSize;

    float fontSize = 10.5f;
    float lineSpace = 5.25f;               // Extra space between lines

    // Page margins
    float marginTop = 10.5f;
    float marginBottom = 10.5f;
    float marginLeft = 10.5f;
    float marginRight = 10.5f;

    // Visual QA
    bool drawMarginLine = false;
    bool drawDebugPoints = false;

    /// Set all four margins
    void setMargin(float points) {
        marginTop = marginBottom = marginLeft = marginRight = points;
    }

    /// Available content width given a page width
    float contentWidth(float pageWidth) const {
        return pageWidth - marginLeft - marginRight;
    }

    /// Available content height given a page height
    float contentHeight(float pageHeight) const {
        return pageHeight - marginTop - marginBottom;
    }

    /// Settings used for spreadsheet conversion
    static Style spreadsheetProfile();
};

} // namespace docpress
