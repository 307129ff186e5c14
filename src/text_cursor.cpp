#include "docpress/text_cursor.h"
#include <utility>

namespace docpress {

TextCursor::TextCursor(std::string text)
    : text_(std::move(text)) {}

std::optional<char> TextCursor::peek() const {
    if (atEnd()) return std::nullopt;
    return text_[position_];
}

bool TextCursor::skip(const std::string& chars) {
    size_t pos = position_;
    while (pos < text_.size()) {
        if (chars.find(text_[pos]) == std::string::npos) {
            position_ = pos;
            return true;
        }
        ++pos;
    }
    return false;
}

bool TextCursor::skipUntil(const std::string& chars) {
    size_t found = text_.find_first_of(chars, position_);
    if (found == std::string::npos) return false;
    position_ = found;
    return true;
}

EatResult TextCursor::eat(const std::string& word) {
    if (position_ + word.size() > text_.size()) {
        return EatResult::EndOfText;
    }
    if (text_.compare(position_, word.size(), word) != 0) {
        return EatResult::NoMatch;
    }
    position_ += word.size();
    return EatResult::Matched;
}

std::optional<std::string> TextCursor::substring(size_t endPosition) {
    if (endPosition > text_.size() || endPosition < position_) {
        return std::nullopt;
    }
    std::string result = text_.substr(position_, endPosition - position_);
    position_ = endPosition;
    return result;
}

bool TextCursor::previousEquals(const std::string& word) const {
    if (word.size() > position_) return false;
    return text_.compare(position_ - word.size(), word.size(), word) == 0;
}

size_t TextCursor::indexOf(const std::string& word) const {
    return text_.find(word, position_);
}

size_t TextCursor::indexOfAny(const std::string& chars) const {
    return text_.find_first_of(chars, position_);
}

std::optional<std::string> TextCursor::nextLine() {
    if (atEnd()) return std::nullopt;

    size_t lineEnd = indexOfAny("\r\n");
    if (lineEnd == npos) {
        return substring(text_.size());
    }

    auto line = substring(lineEnd);
    // "\r\n" counts as one terminator
    if (text_[position_] == '\r' && position_ + 1 < text_.size() && text_[position_ + 1] == '\n') {
        position_ += 2;
    } else {
        ++position_;
    }
    return line;
}

} // namespace docpress
