#pragma once

#include "docpress/layout.h"
#include "docpress/markup.h"
#include "docpress/page.h"
#include "docpress/platform.h"
#include "docpress/spreadsheet.h"
#include "docpress/style.h"
#include <memory>
#include <string>

namespace docpress {

/// Main entry point: runs one document at a time through the layout
/// engine with guaranteed release of the sink.
///
/// On success the document is closed (last page and document finalized).
/// If anything throws, the document is abandoned (best-effort finalize,
/// secondary errors logged) and the original exception propagates.
class Engine {
public:
    explicit Engine(std::shared_ptr<FontMetrics> metrics);
    ~Engine();

    /// Interpret markup into the sink. Returns the number of pages written.
    int renderMarkup(const std::string& markup, PageSink& sink,
                     const Style& style = Style());

    /// Print every non-empty sheet into the sink. Returns the number of
    /// pages written.
    int renderSpreadsheet(const SpreadsheetSource& source, PageSink& sink,
                          const Style& style = Style::spreadsheetProfile());

    /// Interpret markup into pages kept in memory
    LayoutResult layoutMarkup(const std::string& markup,
                              const Style& style = Style());

    LayoutResult layoutSpreadsheet(const SpreadsheetSource& source,
                                   const Style& style = Style::spreadsheetProfile());

    std::shared_ptr<FontMetrics> metrics() const;

private:
    std::shared_ptr<FontMetrics> metrics_;
};

} // namespace docpress
