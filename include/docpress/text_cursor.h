#pragma once

#include <string>
#include <optional>
#include <cstddef>

namespace docpress {

/// Outcome of TextCursor::eat
enum class EatResult {
    Matched,     // word consumed
    NoMatch,     // word differs; position unchanged
    EndOfText,   // not enough text left for the word
};

/// Forward scanner over an immutable text buffer.
///
/// Reads that run out of text report end-of-text through their return value
/// (false, std::nullopt or EatResult::EndOfText) and leave the position where
/// it was before the call. Queries (indexOf, indexOfAny, previousEquals)
/// never move the position.
class TextCursor {
public:
    static constexpr size_t npos = std::string::npos;

    explicit TextCursor(std::string text);

    size_t position() const { return position_; }
    size_t length() const { return text_.size(); }
    bool atEnd() const { return position_ >= text_.size(); }
    const std::string& text() const { return text_; }

    /// Character at the position, or nullopt at end of text
    std::optional<char> peek() const;

    /// Advance while the current character is one of `chars`.
    /// Returns false if the text ends before a non-member is found,
    /// including when the cursor is already at the end.
    bool skip(const std::string& chars);

    /// Advance while the current character is NOT one of `chars`.
    /// Returns false if none of `chars` occurs before the end.
    bool skipUntil(const std::string& chars);

    /// Consume `word` if the text at the position equals it
    EatResult eat(const std::string& word);

    /// Return [position, endPosition) and move to endPosition.
    /// nullopt if endPosition is past the end or before the position.
    std::optional<std::string> substring(size_t endPosition);

    /// True if the text just before the position equals `word`
    bool previousEquals(const std::string& word) const;

    /// Absolute index of the next occurrence of `word`, or npos
    size_t indexOf(const std::string& word) const;

    /// Absolute index of the nearest occurrence of any of `chars`, or npos
    size_t indexOfAny(const std::string& chars) const;

    /// Text up to the next "\n", "\r" or "\r\n", consuming the terminator.
    /// Unterminated trailing text is returned as the last line;
    /// nullopt once the cursor is at the end.
    std::optional<std::string> nextLine();

private:
    std::string text_;
    size_t position_ = 0;
};

} // namespace docpress
