#include "docpress/text_sink.h"
#include "docpress/errors.h"
#include <cstdio>

namespace docpress {

namespace {

std::string formatPoints(float value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", static_cast<double>(value));
    return buf;
}

} // anonymous namespace

std::string quoteRunText(const std::string& text) {
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted += '"';
    for (char c : text) {
        if (c == '"' || c == '\\') quoted += '\\';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

TextDumpSink::TextDumpSink(std::ostream& out)
    : out_(out) {}

void TextDumpSink::openPage(float width, float height) {
    if (pageOpen_) {
        throw SinkFailure("openPage: previous page is still open");
    }
    ++pageNumber_;
    pageOpen_ = true;
    out_ << "page " << pageNumber_ << ' '
         << formatPoints(width) << 'x' << formatPoints(height) << '\n';
}

void TextDumpSink::setFont(const std::string& font, float size) {
    requirePage("setFont");
    out_ << "  font " << font << ' ' << formatPoints(size) << '\n';
}

void TextDumpSink::placeRun(const std::string& text, float x, float y) {
    requirePage("placeRun");
    out_ << "  run " << formatPoints(x) << ' ' << formatPoints(y) << ' '
         << quoteRunText(text) << '\n';
}

void TextDumpSink::strokeRect(float x, float y, float width, float height) {
    requirePage("strokeRect");
    out_ << "  rect " << formatPoints(x) << ' ' << formatPoints(y) << ' '
         << formatPoints(width) << ' ' << formatPoints(height) << '\n';
}

void TextDumpSink::strokeLine(float x1, float y1, float x2, float y2) {
    requirePage("strokeLine");
    out_ << "  line " << formatPoints(x1) << ' ' << formatPoints(y1) << ' '
         << formatPoints(x2) << ' ' << formatPoints(y2) << '\n';
}

void TextDumpSink::closePage() {
    requirePage("closePage");
    pageOpen_ = false;
    out_ << "end page " << pageNumber_ << '\n';
    checkStream("closePage");
}

void TextDumpSink::finalizeDocument() {
    out_.flush();
    checkStream("finalizeDocument");
}

void TextDumpSink::requirePage(const char* operation) const {
    if (!pageOpen_) {
        throw SinkFailure(std::string(operation) + ": no open page");
    }
}

void TextDumpSink::checkStream(const char* operation) const {
    if (!out_) {
        throw SinkFailure(std::string(operation) + ": output stream failed");
    }
}

} // namespace docpress
