#include "docpress/page_collector.h"
#include "docpress/errors.h"
#include <algorithm>
#include <map>
#include <utility>

namespace docpress {

std::vector<std::string> Page::lineTexts() const {
    // Group by baseline, keeping the order baselines first appear in
    std::vector<float> baselines;
    std::map<float, std::vector<const TextRun*>> byBaseline;
    for (const auto& run : runs) {
        auto& group = byBaseline[run.y];
        if (group.empty()) baselines.push_back(run.y);
        group.push_back(&run);
    }

    std::vector<std::string> lines;
    lines.reserve(baselines.size());
    for (float baseline : baselines) {
        auto group = byBaseline[baseline];
        std::stable_sort(group.begin(), group.end(),
                         [](const TextRun* a, const TextRun* b) { return a->x < b->x; });
        std::string line;
        for (const auto* run : group) line += run->text;
        lines.push_back(std::move(line));
    }
    return lines;
}

void PageCollector::openPage(float width, float height) {
    if (pageOpen_) {
        throw SinkFailure("openPage: previous page is still open");
    }
    if (finalized_) {
        throw SinkFailure("openPage: document already finalized");
    }
    current_ = Page{};
    current_.pageIndex = static_cast<int>(result_.pages.size());
    current_.width = width;
    current_.height = height;
    pageOpen_ = true;
}

void PageCollector::setFont(const std::string& font, float size) {
    font_ = font;
    fontSize_ = size;
}

void PageCollector::placeRun(const std::string& text, float x, float y) {
    Page& page = openPageOrThrow("placeRun");
    TextRun run;
    run.text = text;
    run.font = font_;
    run.fontSize = fontSize_;
    run.x = x;
    run.y = y;
    page.runs.push_back(std::move(run));
}

void PageCollector::strokeRect(float x, float y, float width, float height) {
    Page& page = openPageOrThrow("strokeRect");
    Decoration deco;
    deco.type = DecorationType::MarginRect;
    deco.x = x;
    deco.y = y;
    deco.width = width;
    deco.height = height;
    page.decorations.push_back(deco);
}

void PageCollector::strokeLine(float x1, float y1, float x2, float y2) {
    Page& page = openPageOrThrow("strokeLine");
    Decoration deco;
    deco.type = DecorationType::DebugTick;
    deco.x = x1;
    deco.y = y1;
    deco.width = x2 - x1;
    deco.height = y2 - y1;
    page.decorations.push_back(deco);
}

void PageCollector::closePage() {
    openPageOrThrow("closePage");
    result_.pages.push_back(std::move(current_));
    current_ = Page{};
    pageOpen_ = false;
}

void PageCollector::finalizeDocument() {
    finalized_ = true;
}

LayoutResult PageCollector::takeResult() {
    LayoutResult result = std::move(result_);
    result_ = LayoutResult{};
    return result;
}

Page& PageCollector::openPageOrThrow(const char* operation) {
    if (!pageOpen_) {
        throw SinkFailure(std::string(operation) + ": no open page");
    }
    return current_;
}

} // namespace docpress
