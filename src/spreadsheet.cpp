#include "docpress/spreadsheet.h"
#include "docpress/csv_source.h"
#include "docpress/errors.h"
#include "docpress/log.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <utility>

namespace docpress {

namespace {

const char* const kSheetSeparator = "--------";

std::string formatNumber(double value) {
    char buf[64];
    if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 1e15) {
        std::snprintf(buf, sizeof(buf), "%.0f", value);
        // "-0" reads as plain zero
        return std::string(buf) == "-0" ? "0" : buf;
    }
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (std::strtod(buf, nullptr) == value) break;
    }
    return buf;
}

std::string lowercaseExtension(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    size_t dot = path.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Model
// ---------------------------------------------------------------------------

int Row::lastCellNum() const {
    int last = 0;
    for (const auto& cell : cells) {
        last = std::max(last, cell.column + 1);
    }
    return last;
}

bool MergedRegion::contains(int row, int column) const {
    return row >= firstRow && row <= lastRow &&
           column >= firstColumn && column <= lastColumn;
}

std::string MergedRegion::reference() const {
    return cellReference(firstRow, firstColumn) + ":" + cellReference(lastRow, lastColumn);
}

int Sheet::lastRowIndex() const {
    int last = -1;
    for (const auto& row : rows) {
        last = std::max(last, row.index);
    }
    return last;
}

int Sheet::maxColumnCount() const {
    int count = 0;
    for (const auto& row : rows) {
        count = std::max(count, row.lastCellNum());
    }
    return count;
}

const MergedRegion* Sheet::regionAt(int row, int column) const {
    for (const auto& region : mergedRegions) {
        if (region.contains(row, column)) return &region;
    }
    return nullptr;
}

MemorySpreadsheet::MemorySpreadsheet(std::vector<Sheet> sheets)
    : sheets_(std::move(sheets)) {}

void MemorySpreadsheet::addSheet(Sheet sheet) {
    sheets_.push_back(std::move(sheet));
}

size_t MemorySpreadsheet::sheetCount() const {
    return sheets_.size();
}

const Sheet& MemorySpreadsheet::sheet(size_t index) const {
    return sheets_.at(index);
}

// ---------------------------------------------------------------------------
// Formatting
// ---------------------------------------------------------------------------

std::optional<std::string> formatCellValue(const CellValue& value) {
    if (auto text = std::get_if<std::string>(&value)) {
        if (text->empty()) return std::nullopt;
        return *text;
    }
    if (auto number = std::get_if<double>(&value)) {
        return formatNumber(*number);
    }
    if (auto flag = std::get_if<bool>(&value)) {
        return std::string(*flag ? "TRUE" : "FALSE");
    }
    return std::nullopt;
}

std::string columnName(int column) {
    std::string name;
    for (int n = column + 1; n > 0; n = (n - 1) / 26) {
        name.insert(name.begin(), static_cast<char>('A' + (n - 1) % 26));
    }
    return name;
}

std::string cellReference(int row, int column) {
    return columnName(column) + std::to_string(row + 1);
}

// ---------------------------------------------------------------------------
// SheetPrinter
// ---------------------------------------------------------------------------

std::vector<std::string> SheetPrinter::sheetLines(const Sheet& sheet) {
    std::vector<std::string> lines;
    lines.push_back("sheet name: " + sheet.name);
    lines.push_back("max row index: " + std::to_string(sheet.lastRowIndex()));
    lines.push_back("max column index: " + std::to_string(sheet.maxColumnCount()));

    for (const auto& row : sheet.rows) {
        for (const auto& cell : row.cells) {
            std::string reference;
            if (const auto* region = sheet.regionAt(cell.row, cell.column)) {
                // Only the top-left cell speaks for a merged region
                if (cell.row != region->firstRow || cell.column != region->firstColumn) continue;
                reference = region->reference();
            } else {
                reference = cellReference(cell.row, cell.column);
            }
            if (auto text = formatCellValue(cell.value)) {
                lines.push_back("[" + reference + "] " + *text);
            }
        }
    }

    for (const auto& row : sheet.rows) {
        for (const auto& cell : row.cells) {
            if (cell.comment) {
                lines.push_back("[comment " + cellReference(cell.row, cell.column) + "] " +
                                *cell.comment);
            }
        }
    }

    for (const auto& shape : sheet.shapeTexts) {
        lines.push_back("[shape text] " + shape);
    }
    return lines;
}

int SheetPrinter::print(const SpreadsheetSource& source, LayoutEngine& layout) {
    int printed = 0;
    for (size_t i = 0; i < source.sheetCount(); ++i) {
        const Sheet& sheet = source.sheet(i);
        if (sheet.rows.empty()) {
            DP_LOGI("sheet '%s': empty", sheet.name.c_str());
            continue;
        }
        DP_LOGI("sheet '%s': %zu rows", sheet.name.c_str(), sheet.rows.size());
        for (const auto& line : sheetLines(sheet)) {
            layout.println(line);
        }
        layout.newPage();
        ++printed;
    }
    return printed;
}

int SheetPrinter::dump(const SpreadsheetSource& source, std::ostream& out) {
    int printed = 0;
    for (size_t i = 0; i < source.sheetCount(); ++i) {
        const Sheet& sheet = source.sheet(i);
        if (sheet.rows.empty()) {
            DP_LOGI("sheet '%s': empty", sheet.name.c_str());
            continue;
        }
        for (const auto& line : sheetLines(sheet)) {
            out << line << '\n';
        }
        out << kSheetSeparator << '\n';
        if (!out) {
            throw SinkFailure("sheet dump: output stream failed");
        }
        ++printed;
    }
    out.flush();
    if (!out) {
        throw SinkFailure("sheet dump: output stream failed");
    }
    return printed;
}

// ---------------------------------------------------------------------------
// Sources
// ---------------------------------------------------------------------------

std::unique_ptr<SpreadsheetSource> openSpreadsheet(const std::string& path,
                                                   const SourceOptions& options) {
    std::string ext = lowercaseExtension(path);
    char delimiter = 0;
    if (ext == ".csv") {
        delimiter = ',';
    } else if (ext == ".tsv") {
        delimiter = '\t';
    } else {
        throw LookupFailure("unsupported spreadsheet format '" + ext + "': " + path);
    }

    if (options.password) {
        DP_LOGW("'%s': delimited text has no protection, password ignored", path.c_str());
    }
    return CsvSource::open(path, delimiter);
}

} // namespace docpress
