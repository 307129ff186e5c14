#pragma once

#include <string>

namespace docpress {

/// Text measurement supplied by the embedding application.
/// Implementations must be deterministic and monotonic in text length:
/// a longer prefix never measures narrower than a shorter one.
class FontMetrics {
public:
    virtual ~FontMetrics() = default;

    /// Width of text in points at the given font size.
    /// Throws MeasurementFailure if the text cannot be measured.
    virtual float measure(const std::string& text, float size) = 0;

    /// Descender at the given size (negative, in points)
    virtual float descent(float size) = 0;

    /// Font name passed on to page sinks
    virtual std::string name() const = 0;
};

/// Receives laid-out pages. Coordinates are in points from the top-left
/// corner of the page; a run's y is its baseline.
/// Implementations report I/O problems by throwing SinkFailure.
class PageSink {
public:
    virtual ~PageSink() = default;

    virtual void openPage(float width, float height) = 0;

    virtual void setFont(const std::string& font, float size) = 0;

    virtual void placeRun(const std::string& text, float x, float y) = 0;

    /// Optional: margin rectangle
    virtual void strokeRect(float x, float y, float width, float height) {}

    /// Optional: debug tick marks
    virtual void strokeLine(float x1, float y1, float x2, float y2) {}

    virtual void closePage() = 0;

    /// Flush the whole document to its output. Called at most once.
    virtual void finalizeDocument() = 0;
};

} // namespace docpress
