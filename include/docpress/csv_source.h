#pragma once

#include "docpress/spreadsheet.h"
#include <memory>
#include <string>

namespace docpress {

/// One-sheet SpreadsheetSource over delimited text.
///
/// Fields may be quoted with '"'; a doubled quote inside a quoted field is
/// a literal quote and line breaks inside quotes are kept. Unquoted fields
/// that parse fully as numbers become numeric cells, TRUE/FALSE become
/// booleans, empty fields are blank cells. Row indices count records as they
/// appear in the text; a blank line produces no row but keeps its index.
class CsvSource : public SpreadsheetSource {
public:
    /// Throws ParseFailure on an unterminated quoted field
    CsvSource(const std::string& sheetName, const std::string& text, char delimiter = ',');

    /// Read a file; the sheet is named after the file stem.
    /// Throws LookupFailure if the file cannot be read.
    static std::unique_ptr<CsvSource> open(const std::string& path, char delimiter);

    size_t sheetCount() const override { return 1; }
    const Sheet& sheet(size_t index) const override;

private:
    Sheet sheet_;
};

} // namespace docpress
