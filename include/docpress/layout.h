#pragma once

#include "docpress/platform.h"
#include "docpress/style.h"
#include <memory>
#include <string>

namespace docpress {

namespace linebreaker {

/// Byte length of the longest prefix of text (on a code point boundary)
/// whose measured width at `size` is <= maxWidth, given that the whole
/// text is already known to be wider than maxWidth. Returns 0 when not
/// even one code point fits. Uses O(log n) measurements.
size_t fitPrefix(FontMetrics& metrics, const std::string& text,
                 float size, float maxWidth);

} // namespace linebreaker

/// Places text on pages with automatic wrapping and pagination.
///
/// Pages are opened lazily on the first write, using the page size,
/// margins and font settings current at that moment. The engine owns
/// the document on the sink until close() or abandon(); the destructor
/// abandons a document that was not closed.
class LayoutEngine {
public:
    LayoutEngine(std::shared_ptr<FontMetrics> metrics,
                 PageSink& sink,
                 const Style& style = Style());
    ~LayoutEngine();

    LayoutEngine(const LayoutEngine&) = delete;
    LayoutEngine& operator=(const LayoutEngine&) = delete;

    // -- Placement -----------------------------------------------------------

    void printLeft(const std::string& text);
    void printCenter(const std::string& text);
    void printRight(const std::string& text);
    void print(const std::string& text, TextAlignment alignment);

    /// printLeft followed by newLine
    void println(const std::string& text);

    void newLine();
    void newPage();

    // -- Settings ------------------------------------------------------------

    void setFontMetrics(std::shared_ptr<FontMetrics> metrics);
    void setFontSize(float points);
    void setLineSpace(float points);
    /// Applies to the next page opened
    void setPageSize(const PageSize& size, bool landscape);
    void setMarginTop(float points);
    void setMarginBottom(float points);
    void setMarginLeft(float points);
    void setMarginRight(float points);
    void setMargin(float points);
    void setDrawMarginLine(bool enabled);
    void setDrawDebugPoints(bool enabled);

    // -- State ---------------------------------------------------------------

    const Style& style() const;
    float fontSize() const;
    bool pageOpen() const;
    int pageCount() const;
    float x() const;
    float y() const;

    /// Page width minus left and right margins
    float innerWidth() const;
    /// Page height minus top and bottom margins
    float innerHeight() const;

    // -- Lifetime ------------------------------------------------------------

    /// Finalize the current page and the document. Throws on sink failure
    /// after still attempting to finalize. Idempotent.
    void close();

    /// Best-effort close that logs sink errors instead of throwing
    void abandon();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace docpress
