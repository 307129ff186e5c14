#pragma once

#include "docpress/platform.h"
#include <ostream>
#include <string>

namespace docpress {

/// PageSink writing a plain-text dump of every page:
///
///   page 1 595.28x841.89
///     font Courier 10.50
///     run 10.50 21.00 "text"
///     rect 10.50 10.50 574.28 820.89
///     line 30.00 0.00 30.00 5.25
///   end page 1
///
/// The stream is checked after every page and on finalization.
class TextDumpSink : public PageSink {
public:
    explicit TextDumpSink(std::ostream& out);

    void openPage(float width, float height) override;
    void setFont(const std::string& font, float size) override;
    void placeRun(const std::string& text, float x, float y) override;
    void strokeRect(float x, float y, float width, float height) override;
    void strokeLine(float x1, float y1, float x2, float y2) override;
    void closePage() override;
    void finalizeDocument() override;

    int pagesWritten() const { return pageNumber_; }

private:
    std::ostream& out_;
    int pageNumber_ = 0;
    bool pageOpen_ = false;

    void requirePage(const char* operation) const;
    void checkStream(const char* operation) const;
};

/// Quote text for a dump line, escaping '"' and '\'
std::string quoteRunText(const std::string& text);

} // namespace docpress
