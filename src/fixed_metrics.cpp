#include "docpress/fixed_metrics.h"
#include "docpress/utf8.h"

namespace docpress {

float FixedPitchMetrics::measure(const std::string& text, float size) {
    return static_cast<float>(utf8::length(text)) * kAdvancePerEm * size;
}

float FixedPitchMetrics::descent(float size) {
    return kDescentPerEm * size;
}

std::string FixedPitchMetrics::name() const {
    return "Courier";
}

} // namespace docpress
