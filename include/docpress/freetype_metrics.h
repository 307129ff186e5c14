#pragma once

#include "docpress/platform.h"
#include <memory>
#include <string>

namespace docpress {

/// FontMetrics read from a TrueType/OpenType file through FreeType.
///
/// Widths are the sum of unscaled glyph advances, plus pair kerning when
/// the face has a kerning table, scaled by size / units_per_EM.
/// Throws LookupFailure if the file cannot be opened as a font.
class FreeTypeMetrics : public FontMetrics {
public:
    explicit FreeTypeMetrics(const std::string& path);
    ~FreeTypeMetrics() override;

    FreeTypeMetrics(const FreeTypeMetrics&) = delete;
    FreeTypeMetrics& operator=(const FreeTypeMetrics&) = delete;

    /// Throws MeasurementFailure for a code point the face has no glyph for
    float measure(const std::string& text, float size) override;
    float descent(float size) override;
    std::string name() const override;

    int unitsPerEm() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace docpress
