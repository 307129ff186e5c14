#include "docpress/layout.h"
#include "docpress/errors.h"
#include "docpress/log.h"
#include "docpress/utf8.h"
#include <algorithm>
#include <utility>
#include <vector>

namespace docpress {

namespace linebreaker {

size_t fitPrefix(FontMetrics& metrics, const std::string& text,
                 float size, float maxWidth) {
    if (maxWidth <= 0 || text.empty()) return 0;

    std::vector<size_t> offsets = utf8::boundaries(text);
    size_t count = offsets.size() - 1;
    auto fits = [&](size_t chars) {
        return metrics.measure(text.substr(0, offsets[chars]), size) <= maxWidth;
    };

    // Halve from the middle until a prefix fits, then bisect between the
    // last fitting and first overflowing counts. The whole text overflows.
    size_t tooWide = count;
    size_t fitting = count / 2;
    while (fitting > 0 && !fits(fitting)) {
        tooWide = fitting;
        fitting /= 2;
    }
    while (tooWide - fitting > 1) {
        size_t mid = fitting + (tooWide - fitting) / 2;
        if (fits(mid)) {
            fitting = mid;
        } else {
            tooWide = mid;
        }
    }
    return offsets[fitting];
}

} // namespace linebreaker

class LayoutEngine::Impl {
public:
    Impl(std::shared_ptr<FontMetrics> metrics, PageSink& sink, const Style& style)
        : metrics_(std::move(metrics))
        , sink_(sink)
        , style_(style) {}

    ~Impl() {
        if (!closed_) {
            abandon();
        }
    }

    // ---------------------------------------------------------------
    // Placement
    // ---------------------------------------------------------------
    void print(const std::string& text, TextAlignment alignment) {
        if (text.empty()) return;

        // Embedded line breaks split the run into independent lines
        size_t lineBreak = text.find('\n');
        if (lineBreak != std::string::npos) {
            std::string head = text.substr(0, lineBreak);
            if (!head.empty() && head.back() == '\r') head.pop_back();
            print(head, alignment);
            newLine();
            print(text.substr(lineBreak + 1), alignment);
            return;
        }

        std::string remaining = text;
        while (!remaining.empty()) {
            ensurePage();
            float available = availableWidth(alignment);
            float width = measure(remaining);
            if (width <= available) {
                place(remaining, width, available, alignment);
                return;
            }

            size_t fit = linebreaker::fitPrefix(*metrics_, remaining, style_.fontSize, available);
            if (fit == 0) {
                if (!atLineStart()) {
                    // Retry on a fresh line
                    newLine();
                    continue;
                }
                // Line is empty: force one code point
                fit = std::min(utf8::charLen(static_cast<unsigned char>(remaining[0])),
                               remaining.size());
            }

            std::string fragment = remaining.substr(0, fit);
            place(fragment, measure(fragment), available, alignment);
            remaining = remaining.substr(fit);
            // A forced last code point ends the run like any fitting tail
            if (!remaining.empty()) newLine();
        }
    }

    void newLine() {
        ensurePage();
        y_ += style_.fontSize + style_.lineSpace;
        x_ = style_.marginLeft;
        if (y_ + style_.fontSize > pageHeight_ - style_.marginBottom) {
            newPage();
        }
    }

    void newPage() {
        if (!pageOpen_) return;
        pageOpen_ = false;

        if (style_.drawMarginLine) {
            sink_.strokeRect(style_.marginLeft, style_.marginTop,
                             pageWidth_ - style_.marginLeft - style_.marginRight,
                             pageHeight_ - style_.marginTop - style_.marginBottom);
        }
        if (style_.drawDebugPoints) {
            for (float stop : debugPoints_) {
                sink_.strokeLine(stop, style_.marginTop / 2, stop, 0);
            }
        }
        debugPoints_.clear();
        DP_LOGD("layout: closePage index=%d", pageCount_ - 1);
        sink_.closePage();
    }

    // ---------------------------------------------------------------
    // Settings
    // ---------------------------------------------------------------
    void setFontMetrics(std::shared_ptr<FontMetrics> metrics) {
        metrics_ = std::move(metrics);
        if (pageOpen_) sink_.setFont(metrics_->name(), style_.fontSize);
    }

    void setFontSize(float points) {
        style_.fontSize = points;
        if (pageOpen_) sink_.setFont(metrics_->name(), style_.fontSize);
    }

    void setPageSize(const PageSize& size, bool landscape) {
        style_.pageSize = landscape ? size.landscape() : size;
    }

    Style& style() { return style_; }
    const Style& style() const { return style_; }
    bool pageOpen() const { return pageOpen_; }
    int pageCount() const { return pageCount_; }
    float x() const { return x_; }
    float y() const { return y_; }

    float innerWidth() const {
        return style_.contentWidth(pageOpen_ ? pageWidth_ : style_.pageSize.width);
    }

    float innerHeight() const {
        return style_.contentHeight(pageOpen_ ? pageHeight_ : style_.pageSize.height);
    }

    // ---------------------------------------------------------------
    // Lifetime
    // ---------------------------------------------------------------
    void close() {
        if (closed_) return;
        closed_ = true;
        try {
            newPage();
        } catch (...) {
            finalizeQuietly();
            throw;
        }
        if (documentStarted_) {
            DP_LOGD("layout: finalizeDocument pages=%d", pageCount_);
            sink_.finalizeDocument();
        }
    }

    void abandon() {
        if (closed_) return;
        closed_ = true;
        try {
            newPage();
        } catch (const std::exception& e) {
            DP_LOGW("layout: closing page after failure: %s", e.what());
        }
        finalizeQuietly();
    }

private:
    std::shared_ptr<FontMetrics> metrics_;
    PageSink& sink_;
    Style style_;

    bool pageOpen_ = false;
    bool documentStarted_ = false;
    bool closed_ = false;
    int pageCount_ = 0;
    float pageWidth_ = 0;
    float pageHeight_ = 0;
    float x_ = 0;
    float y_ = 0;
    std::vector<float> debugPoints_;   // Horizontal stops on the open page

    void ensurePage() {
        if (pageOpen_) return;
        if (closed_) {
            throw SinkFailure("document already closed");
        }
        pageWidth_ = style_.pageSize.width;
        pageHeight_ = style_.pageSize.height;
        DP_LOGD("layout: openPage index=%d size=%.2fx%.2f", pageCount_, pageWidth_, pageHeight_);
        sink_.openPage(pageWidth_, pageHeight_);
        pageOpen_ = true;
        documentStarted_ = true;
        ++pageCount_;
        sink_.setFont(metrics_->name(), style_.fontSize);
        x_ = style_.marginLeft;
        y_ = style_.marginTop;
    }

    void finalizeQuietly() {
        if (!documentStarted_) return;
        try {
            sink_.finalizeDocument();
        } catch (const std::exception& e) {
            DP_LOGW("layout: finalizing document after failure: %s", e.what());
        }
    }

    bool atLineStart() const {
        return x_ <= style_.marginLeft;
    }

    float remainingWidth() const {
        return pageWidth_ - style_.marginRight - x_;
    }

    /// Width the next run may occupy. Centered text is centered on the
    /// page's inner column: the usable span is symmetric around its middle.
    float availableWidth(TextAlignment alignment) const {
        if (alignment == TextAlignment::Center) {
            return remainingWidth() * 2 - innerWidth();
        }
        return remainingWidth();
    }

    float measure(const std::string& text) {
        if (text.empty()) return 0;
        return metrics_->measure(text, style_.fontSize);
    }

    void addCurrentX(float offset) {
        x_ += offset;
        debugPoints_.push_back(x_);
    }

    void place(const std::string& text, float width, float available, TextAlignment alignment) {
        if (alignment != TextAlignment::Left) {
            float offset = available - width;
            if (alignment == TextAlignment::Center) offset /= 2;
            addCurrentX(std::max(offset, 0.0f));
        }
        sink_.placeRun(text, x_, y_ + style_.fontSize);
        addCurrentX(width);
    }
};

LayoutEngine::LayoutEngine(std::shared_ptr<FontMetrics> metrics,
                           PageSink& sink,
                           const Style& style)
    : impl_(std::make_unique<Impl>(std::move(metrics), sink, style)) {}

LayoutEngine::~LayoutEngine() = default;

void LayoutEngine::printLeft(const std::string& text) {
    impl_->print(text, TextAlignment::Left);
}

void LayoutEngine::printCenter(const std::string& text) {
    impl_->print(text, TextAlignment::Center);
}

void LayoutEngine::printRight(const std::string& text) {
    impl_->print(text, TextAlignment::Right);
}

void LayoutEngine::print(const std::string& text, TextAlignment alignment) {
    impl_->print(text, alignment);
}

void LayoutEngine::println(const std::string& text) {
    impl_->print(text, TextAlignment::Left);
    impl_->newLine();
}

void LayoutEngine::newLine() {
    impl_->newLine();
}

void LayoutEngine::newPage() {
    impl_->newPage();
}

void LayoutEngine::setFontMetrics(std::shared_ptr<FontMetrics> metrics) {
    impl_->setFontMetrics(std::move(metrics));
}

void LayoutEngine::setFontSize(float points) {
    impl_->setFontSize(points);
}

void LayoutEngine::setLineSpace(float points) {
    impl_->style().lineSpace = points;
}

void LayoutEngine::setPageSize(const PageSize& size, bool landscape) {
    impl_->setPageSize(size, landscape);
}

void LayoutEngine::setMarginTop(float points) {
    impl_->style().marginTop = points;
}

void LayoutEngine::setMarginBottom(float points) {
    impl_->style().marginBottom = points;
}

void LayoutEngine::setMarginLeft(float points) {
    impl_->style().marginLeft = points;
}

void LayoutEngine::setMarginRight(float points) {
    impl_->style().marginRight = points;
}

void LayoutEngine::setMargin(float points) {
    impl_->style().setMargin(points);
}

void LayoutEngine::setDrawMarginLine(bool enabled) {
    impl_->style().drawMarginLine = enabled;
}

void LayoutEngine::setDrawDebugPoints(bool enabled) {
    impl_->style().drawDebugPoints = enabled;
}

const Style& LayoutEngine::style() const {
    return impl_->style();
}

float LayoutEngine::fontSize() const {
    return impl_->style().fontSize;
}

bool LayoutEngine::pageOpen() const {
    return impl_->pageOpen();
}

int LayoutEngine::pageCount() const {
    return impl_->pageCount();
}

float LayoutEngine::x() const {
    return impl_->x();
}

float LayoutEngine::y() const {
    return impl_->y();
}

float LayoutEngine::innerWidth() const {
    return impl_->innerWidth();
}

float LayoutEngine::innerHeight() const {
    return impl_->innerHeight();
}

void LayoutEngine::close() {
    impl_->close();
}

void LayoutEngine::abandon() {
    impl_->abandon();
}

} // namespace docpress
