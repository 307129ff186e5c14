#include "docpress/engine.h"
#include "docpress/log.h"
#include "docpress/page_collector.h"
#include <stdexcept>
#include <utility>

namespace docpress {

namespace {

/// Run body against a fresh layout; close on success, abandon and rethrow
/// on failure.
template <typename Body>
int runDocument(std::shared_ptr<FontMetrics> metrics, PageSink& sink,
                const Style& style, Body&& body) {
    LayoutEngine layout(std::move(metrics), sink, style);
    try {
        body(layout);
    } catch (...) {
        layout.abandon();
        throw;
    }
    layout.close();
    return layout.pageCount();
}

LayoutResult collectedResult(PageCollector& collector, const char* operation) {
    LayoutResult result = collector.takeResult();
    if (result.pages.empty()) {
        DP_LOGW("%s: empty content", operation);
        result.warnings.push_back(LayoutWarning::EmptyContent);
    }
    return result;
}

} // anonymous namespace

Engine::Engine(std::shared_ptr<FontMetrics> metrics)
    : metrics_(std::move(metrics)) {
    if (!metrics_) {
        throw std::invalid_argument("Engine requires font metrics");
    }
}

Engine::~Engine() = default;

int Engine::renderMarkup(const std::string& markup, PageSink& sink, const Style& style) {
    DP_LOGI("renderMarkup: bytes=%zu page=%.0fx%.0f font=%s %.2f", markup.size(),
            style.pageSize.width, style.pageSize.height,
            metrics_->name().c_str(), style.fontSize);

    MarkupStats stats;
    int pages = runDocument(metrics_, sink, style, [&](LayoutEngine& layout) {
        MarkupInterpreter interpreter(layout);
        stats = interpreter.run(markup);
    });

    DP_LOGI("renderMarkup: setup=%d blocks=%d lines=%d pages=%d",
            stats.setupLines, stats.blocks, stats.contentLines, pages);
    return pages;
}

int Engine::renderSpreadsheet(const SpreadsheetSource& source, PageSink& sink,
                              const Style& style) {
    DP_LOGI("renderSpreadsheet: sheets=%zu page=%.0fx%.0f", source.sheetCount(),
            style.pageSize.width, style.pageSize.height);

    int sheets = 0;
    int pages = runDocument(metrics_, sink, style, [&](LayoutEngine& layout) {
        sheets = SheetPrinter::print(source, layout);
    });

    DP_LOGI("renderSpreadsheet: printed=%d pages=%d", sheets, pages);
    return pages;
}

LayoutResult Engine::layoutMarkup(const std::string& markup, const Style& style) {
    PageCollector collector;
    renderMarkup(markup, collector, style);
    return collectedResult(collector, "layoutMarkup");
}

LayoutResult Engine::layoutSpreadsheet(const SpreadsheetSource& source, const Style& style) {
    PageCollector collector;
    renderSpreadsheet(source, collector, style);
    return collectedResult(collector, "layoutSpreadsheet");
}

std::shared_ptr<FontMetrics> Engine::metrics() const {
    return metrics_;
}

} // namespace docpress
