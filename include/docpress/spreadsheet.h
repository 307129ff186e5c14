#pragma once

#include "docpress/layout.h"
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace docpress {

/// Blank, text, number or boolean
using CellValue = std::variant<std::monostate, std::string, double, bool>;

struct Cell {
    int row = 0;       // 0-based
    int column = 0;    // 0-based
    CellValue value;
    std::optional<std::string> comment;
};

struct Row {
    int index = 0;
    std::vector<Cell> cells;

    /// Last column index + 1, or 0 for a row without cells
    int lastCellNum() const;
};

/// Rectangle of cells shown as one (inclusive bounds)
struct MergedRegion {
    int firstRow = 0;
    int lastRow = 0;
    int firstColumn = 0;
    int lastColumn = 0;

    bool contains(int row, int column) const;

    /// "A1:B2"
    std::string reference() const;
};

struct Sheet {
    std::string name;
    std::vector<Row> rows;
    std::vector<MergedRegion> mergedRegions;
    std::vector<std::string> shapeTexts;

    /// Index of the last row, or -1 when the sheet has no rows
    int lastRowIndex() const;

    /// Largest lastCellNum over all rows
    int maxColumnCount() const;

    /// Region containing the cell, if any
    const MergedRegion* regionAt(int row, int column) const;
};

/// Workbook-like source of sheets
class SpreadsheetSource {
public:
    virtual ~SpreadsheetSource() = default;

    virtual size_t sheetCount() const = 0;

    virtual const Sheet& sheet(size_t index) const = 0;
};

/// SpreadsheetSource over sheets built in memory
class MemorySpreadsheet : public SpreadsheetSource {
public:
    MemorySpreadsheet() = default;
    explicit MemorySpreadsheet(std::vector<Sheet> sheets);

    void addSheet(Sheet sheet);

    size_t sheetCount() const override;
    const Sheet& sheet(size_t index) const override;

private:
    std::vector<Sheet> sheets_;
};

/// Display text of a value; nullopt for blank cells and empty text.
/// Integral numbers print without a decimal point, other numbers in the
/// shortest form that reads back to the same double.
std::optional<std::string> formatCellValue(const CellValue& value);

/// 0 -> "A", 25 -> "Z", 26 -> "AA"
std::string columnName(int column);

/// (0, 0) -> "A1"
std::string cellReference(int row, int column);

/// Writes the contents of each non-empty sheet: a summary, every cell
/// value with its reference, comments and shape texts.
class SheetPrinter {
public:
    /// Lines describing one sheet, in output order
    static std::vector<std::string> sheetLines(const Sheet& sheet);

    /// Lay out each non-empty sheet, one sheet per page run.
    /// Returns the number of sheets printed.
    static int print(const SpreadsheetSource& source, LayoutEngine& layout);

    /// Same lines as plain text; each sheet ends with "--------".
    /// Throws SinkFailure if the stream fails.
    static int dump(const SpreadsheetSource& source, std::ostream& out);
};

struct SourceOptions {
    std::optional<std::string> password;   // For protected workbooks
};

/// Open a source by file extension (.csv, .tsv).
/// Throws LookupFailure for unsupported formats or unreadable files.
std::unique_ptr<SpreadsheetSource> openSpreadsheet(const std::string& path,
                                                   const SourceOptions& options = SourceOptions());

} // namespace docpress
