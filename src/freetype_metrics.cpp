#include "docpress/freetype_metrics.h"
#include "docpress/errors.h"
#include "docpress/log.h"
#include "docpress/utf8.h"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <cstdio>
#include <unordered_map>

namespace docpress {

class FreeTypeMetrics::Impl {
public:
    explicit Impl(const std::string& path) {
        FT_Error error = FT_Init_FreeType(&library_);
        if (error) {
            library_ = nullptr;
            throw LookupFailure("FreeType initialization failed (error " +
                                std::to_string(error) + ")");
        }
        error = FT_New_Face(library_, path.c_str(), 0, &face_);
        if (error || !face_) {
            face_ = nullptr;
            FT_Done_FreeType(library_);
            library_ = nullptr;
            throw LookupFailure("cannot open font '" + path + "' (error " +
                                std::to_string(error) + ")");
        }
        if (face_->units_per_EM == 0) {
            FT_Done_Face(face_);
            FT_Done_FreeType(library_);
            face_ = nullptr;
            library_ = nullptr;
            throw LookupFailure("font '" + path + "' is not scalable");
        }
        family_ = face_->family_name ? face_->family_name : "Unknown";
        hasKerning_ = FT_HAS_KERNING(face_);
        DP_LOGI("font: '%s' family=%s unitsPerEM=%d kerning=%d", path.c_str(),
                family_.c_str(), face_->units_per_EM, hasKerning_ ? 1 : 0);
    }

    ~Impl() {
        if (face_) FT_Done_Face(face_);
        if (library_) FT_Done_FreeType(library_);
    }

    float measure(const std::string& text, float size) {
        FT_Pos total = 0;
        FT_UInt previous = 0;
        size_t pos = 0;
        while (pos < text.size()) {
            char32_t cp = utf8::decode(text, pos);
            FT_UInt glyph = FT_Get_Char_Index(face_, static_cast<FT_ULong>(cp));
            if (glyph == 0) {
                throw MeasurementFailure("font '" + family_ + "' has no glyph for U+" +
                                         hex(static_cast<unsigned long>(cp)));
            }
            if (hasKerning_ && previous) {
                FT_Vector kerning;
                if (!FT_Get_Kerning(face_, previous, glyph, FT_KERNING_UNSCALED, &kerning)) {
                    total += kerning.x;
                }
            }
            total += advance(glyph);
            previous = glyph;
        }
        return static_cast<float>(total) * size / static_cast<float>(face_->units_per_EM);
    }

    float descent(float size) const {
        return static_cast<float>(face_->descender) * size /
               static_cast<float>(face_->units_per_EM);
    }

    const std::string& family() const { return family_; }
    int unitsPerEm() const { return face_->units_per_EM; }

private:
    FT_Library library_ = nullptr;
    FT_Face face_ = nullptr;
    std::string family_;
    bool hasKerning_ = false;
    std::unordered_map<FT_UInt, FT_Pos> advances_;   // Unscaled, per glyph

    FT_Pos advance(FT_UInt glyph) {
        auto it = advances_.find(glyph);
        if (it != advances_.end()) return it->second;

        FT_Error error = FT_Load_Glyph(face_, glyph, FT_LOAD_NO_SCALE);
        if (error) {
            throw MeasurementFailure("font '" + family_ + "' failed to load glyph " +
                                     std::to_string(glyph) + " (error " +
                                     std::to_string(error) + ")");
        }
        FT_Pos value = face_->glyph->advance.x;
        advances_.emplace(glyph, value);
        return value;
    }

    static std::string hex(unsigned long value) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04lX", value);
        return buf;
    }
};

FreeTypeMetrics::FreeTypeMetrics(const std::string& path)
    : impl_(std::make_unique<Impl>(path)) {}

FreeTypeMetrics::~FreeTypeMetrics() = default;

float FreeTypeMetrics::measure(const std::string& text, float size) {
    return impl_->measure(text, size);
}

float FreeTypeMetrics::descent(float size) {
    return impl_->descent(size);
}

std::string FreeTypeMetrics::name() const {
    return impl_->family();
}

int FreeTypeMetrics::unitsPerEm() const {
    return impl_->unitsPerEm();
}

} // namespace docpress
