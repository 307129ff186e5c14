#pragma once

#include "docpress/errors.h"
#include "docpress/platform.h"
#include "docpress/utf8.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace docpress {
namespace test {

/// Fixed-width metrics: every code point is charWidth points wide at any size
/// unless scaleWithSize is set, in which case the width is charWidth * size / 10.
class MockMetrics : public FontMetrics {
public:
    float charWidth = 8.0f;
    bool scaleWithSize = false;
    int measureCalls = 0;
    std::string failOn;   // Throw MeasurementFailure for text containing this

    float measure(const std::string& text, float size) override {
        ++measureCalls;
        if (!failOn.empty() && text.find(failOn) != std::string::npos) {
            throw MeasurementFailure("mock cannot measure '" + text + "'");
        }
        float width = static_cast<float>(utf8::length(text)) * charWidth;
        return scaleWithSize ? width * size / 10.0f : width;
    }

    float descent(float size) override { return -0.2f * size; }

    std::string name() const override { return "Mock"; }
};

/// Records every sink call as a short line: "open 100x200", "font Mock 10",
/// "run x y text", "rect ...", "line ...", "close", "finalize".
/// failOn* make the matching call throw SinkFailure.
class RecordingSink : public PageSink {
public:
    std::vector<std::string> calls;
    bool failOnClosePage = false;
    bool failOnFinalize = false;
    bool failOnPlaceRun = false;

    void openPage(float width, float height) override {
        calls.push_back("open " + num(width) + "x" + num(height));
    }

    void setFont(const std::string& font, float size) override {
        calls.push_back("font " + font + " " + num(size));
    }

    void placeRun(const std::string& text, float x, float y) override {
        if (failOnPlaceRun) throw SinkFailure("placeRun failed");
        calls.push_back("run " + num(x) + " " + num(y) + " " + text);
    }

    void strokeRect(float x, float y, float width, float height) override {
        calls.push_back("rect " + num(x) + " " + num(y) + " " + num(width) + " " + num(height));
    }

    void strokeLine(float x1, float y1, float x2, float y2) override {
        calls.push_back("line " + num(x1) + " " + num(y1) + " " + num(x2) + " " + num(y2));
    }

    void closePage() override {
        calls.push_back("close");
        if (failOnClosePage) throw SinkFailure("closePage failed");
    }

    void finalizeDocument() override {
        calls.push_back("finalize");
        if (failOnFinalize) throw SinkFailure("finalize failed");
    }

    int count(const std::string& prefix) const {
        int n = 0;
        for (const auto& call : calls) {
            if (call.compare(0, prefix.size(), prefix) == 0) ++n;
        }
        return n;
    }

private:
    static std::string num(float value) {
        std::ostringstream ss;
        ss << value;
        return ss.str();
    }
};

inline std::string testdataDir() {
    std::filesystem::path thisFile(__FILE__);
    return (thisFile.parent_path() / "testdata").string();
}

inline std::string readFile(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return "";
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

} // namespace test
} // namespace docpress
