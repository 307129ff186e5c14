#pragma once

#include "docpress/platform.h"

namespace docpress {

/// Monospaced metrics of the standard PDF Courier font: every code point
/// advances 600/1000 em.
class FixedPitchMetrics : public FontMetrics {
public:
    static constexpr float kAdvancePerEm = 0.6f;
    static constexpr float kDescentPerEm = -0.157f;

    float measure(const std::string& text, float size) override;
    float descent(float size) override;
    std::string name() const override;
};

} // namespace docpress
