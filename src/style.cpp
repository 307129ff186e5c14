#include "docpress/style.h"
#include "docpress/errors.h"
#include <algorithm>
#include <cctype>
#include <map>

namespace docpress {

namespace {

constexpr float kPointsPerMillimeter = 72.0f / 25.4f;

PageSize fromMillimeters(float width, float height) {
    return {width * kPointsPerMillimeter, height * kPointsPerMillimeter};
}

const std::map<std::string, PageSize>& standardSizes() {
    static const std::map<std::string, PageSize> sizes = {
        {"A0", fromMillimeters(841, 1189)},
        {"A1", fromMillimeters(594, 841)},
        {"A2", fromMillimeters(420, 594)},
        {"A3", fromMillimeters(297, 420)},
        {"A4", fromMillimeters(210, 297)},
        {"A5", fromMillimeters(148, 210)},
        {"A6", fromMillimeters(105, 148)},
        {"LETTER", {612.0f, 792.0f}},
        {"LEGAL", {612.0f, 1008.0f}},
    };
    return sizes;
}

} // anonymous namespace

PageSize lookupPageSize(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    const auto& sizes = standardSizes();
    auto it = sizes.find(key);
    if (it == sizes.end()) {
        throw LookupFailure("unknown page size: '" + name + "'");
    }
    return it->second;
}

Style Style::spreadsheetProfile() {
    Style style;
    style.pageSize = lookupPageSize("A4");
    style.fontSize = 10.5f;
    style.setMargin(15.0f);
    style.lineSpace = 5.0f;
    return style;
}

} // namespace docpress
