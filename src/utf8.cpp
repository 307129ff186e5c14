#include "docpress/utf8.h"

namespace docpress {

namespace utf8 {

std::vector<size_t> boundaries(const std::string& text) {
    std::vector<size_t> offsets;
    offsets.reserve(text.size() + 1);
    size_t pos = 0;
    while (pos < text.size()) {
        offsets.push_back(pos);
        size_t len = charLen(static_cast<unsigned char>(text[pos]));
        // Ensure we don't read past the string
        if (pos + len > text.size()) len = text.size() - pos;
        pos += len;
    }
    offsets.push_back(text.size());
    return offsets;
}

size_t length(const std::string& text) {
    return boundaries(text).size() - 1;
}

char32_t decode(const std::string& text, size_t& pos) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t len = charLen(lead);
    if (len == 1) {
        ++pos;
        return lead < 0x80 ? static_cast<char32_t>(lead) : U'\uFFFD';
    }
    if (pos + len > text.size()) {
        ++pos;
        return U'\uFFFD';
    }

    char32_t cp = 0;
    if (len == 2) cp = lead & 0x1F;
    else if (len == 3) cp = lead & 0x0F;
    else cp = lead & 0x07;

    for (size_t i = 1; i < len; ++i) {
        unsigned char cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            ++pos;
            return U'\uFFFD';
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    pos += len;
    return cp;
}

} // namespace utf8

} // namespace docpress
