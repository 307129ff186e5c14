#pragma once

#include "docpress/page.h"
#include "docpress/platform.h"
#include <string>

namespace docpress {

/// PageSink that keeps laid-out pages in memory
class PageCollector : public PageSink {
public:
    void openPage(float width, float height) override;
    void setFont(const std::string& font, float size) override;
    void placeRun(const std::string& text, float x, float y) override;
    void strokeRect(float x, float y, float width, float height) override;
    void strokeLine(float x1, float y1, float x2, float y2) override;
    void closePage() override;
    void finalizeDocument() override;

    bool finalized() const { return finalized_; }

    const std::vector<Page>& pages() const { return result_.pages; }

    /// Pages collected so far; a page still open is not included
    const LayoutResult& result() const { return result_; }

    LayoutResult takeResult();

private:
    LayoutResult result_;
    Page current_;
    bool pageOpen_ = false;
    bool finalized_ = false;
    std::string font_;
    float fontSize_ = 0;

    Page& openPageOrThrow(const char* operation);
};

} // namespace docpress
