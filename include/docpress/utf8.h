#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace docpress {

namespace utf8 {

/// Byte length of the UTF-8 sequence starting with `lead`.
/// Returns 1 for invalid lead bytes (safe fallback).
inline size_t charLen(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

/// Byte offsets of every code point start, followed by text.size().
/// A truncated trailing sequence counts as one code point.
std::vector<size_t> boundaries(const std::string& text);

/// Number of code points in text
size_t length(const std::string& text);

/// Decode the code point at pos and advance pos past it.
/// Malformed bytes decode as U+FFFD and advance by one byte.
char32_t decode(const std::string& text, size_t& pos);

} // namespace utf8

} // namespace docpress
