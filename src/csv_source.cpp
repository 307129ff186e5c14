#include "docpress/csv_source.h"
#include "docpress/errors.h"
#include "docpress/log.h"
#include "docpress/text_cursor.h"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace docpress {

namespace {

const char* const kUtf8Bom = "\xEF\xBB\xBF";

struct Field {
    std::string text;
    bool quoted = false;
};

CellValue typedValue(const Field& field) {
    if (field.text.empty()) return std::monostate{};
    if (field.quoted) return field.text;
    if (field.text == "TRUE") return true;
    if (field.text == "FALSE") return false;

    const char* begin = field.text.c_str();
    if (!std::isspace(static_cast<unsigned char>(*begin))) {
        char* end = nullptr;
        double number = std::strtod(begin, &end);
        if (end == begin + field.text.size()) return number;
    }
    return field.text;
}

class CsvReader {
public:
    CsvReader(const std::string& text, char delimiter)
        : cursor_(text)
        , delimiter_(delimiter)
        , stops_(std::string(1, delimiter) + "\r\n") {}

    /// Next record, or false at end of text
    bool nextRecord(std::vector<Field>& fields) {
        fields.clear();
        if (cursor_.atEnd()) return false;
        ++line_;
        for (;;) {
            fields.push_back(readField());
            auto next = cursor_.peek();
            if (!next) return true;
            if (*next == delimiter_) {
                cursor_.eat(std::string(1, delimiter_));
                continue;
            }
            // Consume the line terminator
            cursor_.nextLine();
            return true;
        }
    }

    int line() const { return line_; }

private:
    TextCursor cursor_;
    char delimiter_;
    std::string stops_;
    int line_ = 0;

    Field readField() {
        Field field;
        if (cursor_.eat("\"") == EatResult::Matched) {
            field.quoted = true;
            int startLine = line_;
            for (;;) {
                size_t quote = cursor_.indexOf("\"");
                if (quote == TextCursor::npos) {
                    throw ParseFailure("unterminated quoted field starting on line " +
                                       std::to_string(startLine));
                }
                std::string chunk = *cursor_.substring(quote);
                for (char c : chunk) {
                    if (c == '\n') ++line_;
                }
                field.text += chunk;
                cursor_.eat("\"");
                if (cursor_.eat("\"") != EatResult::Matched) break;
                field.text += '"';
            }
        }
        // Unquoted text, or stray text after a closing quote
        size_t stop = cursor_.indexOfAny(stops_);
        if (stop == TextCursor::npos) stop = cursor_.length();
        field.text += *cursor_.substring(stop);
        return field;
    }
};

bool isBlankRecord(const std::vector<Field>& fields) {
    return fields.size() == 1 && fields[0].text.empty() && !fields[0].quoted;
}

std::string fileStem(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    size_t dot = name.rfind('.');
    if (dot != std::string::npos && dot > 0) name = name.substr(0, dot);
    return name;
}

} // anonymous namespace

CsvSource::CsvSource(const std::string& sheetName, const std::string& text, char delimiter) {
    sheet_.name = sheetName;

    std::string body = text.compare(0, 3, kUtf8Bom) == 0 ? text.substr(3) : text;
    CsvReader reader(body, delimiter);
    std::vector<Field> fields;
    int rowIndex = -1;
    while (reader.nextRecord(fields)) {
        // Blank records leave a gap in the row indices, like an empty sheet row
        ++rowIndex;
        if (isBlankRecord(fields)) continue;
        Row row;
        row.index = rowIndex;
        for (size_t column = 0; column < fields.size(); ++column) {
            Cell cell;
            cell.row = rowIndex;
            cell.column = static_cast<int>(column);
            cell.value = typedValue(fields[column]);
            row.cells.push_back(std::move(cell));
        }
        sheet_.rows.push_back(std::move(row));
    }
    DP_LOGD("csv: sheet '%s' rows=%zu", sheetName.c_str(), sheet_.rows.size());
}

std::unique_ptr<CsvSource> CsvSource::open(const std::string& path, char delimiter) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw LookupFailure("cannot read '" + path + "'");
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        throw LookupFailure("error reading '" + path + "'");
    }
    return std::make_unique<CsvSource>(fileStem(path), contents.str(), delimiter);
}

const Sheet& CsvSource::sheet(size_t index) const {
    if (index != 0) {
        throw std::out_of_range("csv source has one sheet, index " + std::to_string(index));
    }
    return sheet_;
}

} // namespace docpress
