#include <gtest/gtest.h>
#include "docpress/csv_source.h"
#include "docpress/errors.h"
#include "docpress/page_collector.h"
#include "docpress/spreadsheet.h"
#include "test_support.h"
#include <memory>
#include <sstream>

using namespace docpress;
using docpress::test::MockMetrics;
using docpress::test::testdataDir;

namespace {

Cell makeCell(int row, int column, CellValue value) {
    Cell cell;
    cell.row = row;
    cell.column = column;
    cell.value = std::move(value);
    return cell;
}

/// Sheet with a merged title, a comment and a shape
Sheet summarySheet() {
    Sheet sheet;
    sheet.name = "Summary";

    Row title;
    title.index = 0;
    title.cells.push_back(makeCell(0, 0, std::string("Title")));
    title.cells.push_back(makeCell(0, 1, std::string("hidden by merge")));
    sheet.rows.push_back(title);

    Row values;
    values.index = 2;
    Cell answer = makeCell(2, 0, 42.0);
    answer.comment = "check";
    values.cells.push_back(answer);
    values.cells.push_back(makeCell(2, 2, true));
    sheet.rows.push_back(values);

    sheet.mergedRegions.push_back(MergedRegion{0, 0, 0, 1});
    sheet.shapeTexts.push_back("Arrow label");
    return sheet;
}

Sheet emptySheet(const std::string& name) {
    Sheet sheet;
    sheet.name = name;
    return sheet;
}

} // anonymous namespace

// MARK: - References

TEST(SpreadsheetTest, ColumnNames) {
    EXPECT_EQ(columnName(0), "A");
    EXPECT_EQ(columnName(25), "Z");
    EXPECT_EQ(columnName(26), "AA");
    EXPECT_EQ(columnName(51), "AZ");
    EXPECT_EQ(columnName(52), "BA");
    EXPECT_EQ(columnName(701), "ZZ");
    EXPECT_EQ(columnName(702), "AAA");
}

TEST(SpreadsheetTest, CellAndRegionReferences) {
    EXPECT_EQ(cellReference(0, 0), "A1");
    EXPECT_EQ(cellReference(9, 27), "AB10");
    MergedRegion region{0, 1, 0, 1};
    EXPECT_EQ(region.reference(), "A1:B2");
    EXPECT_TRUE(region.contains(1, 1));
    EXPECT_FALSE(region.contains(2, 0));
}

// MARK: - Value formatting

TEST(SpreadsheetTest, FormatCellValues) {
    EXPECT_FALSE(formatCellValue(std::monostate{}).has_value());
    EXPECT_FALSE(formatCellValue(std::string()).has_value());
    EXPECT_EQ(formatCellValue(std::string("text")), "text");
    EXPECT_EQ(formatCellValue(3.0), "3");
    EXPECT_EQ(formatCellValue(-12.0), "-12");
    EXPECT_EQ(formatCellValue(-0.0), "0");
    EXPECT_EQ(formatCellValue(2.5), "2.5");
    EXPECT_EQ(formatCellValue(0.1), "0.1");
    EXPECT_EQ(formatCellValue(1e20), "1e+20");
    EXPECT_EQ(formatCellValue(true), "TRUE");
    EXPECT_EQ(formatCellValue(false), "FALSE");
}

// MARK: - SheetPrinter

TEST(SheetPrinterTest, SheetLinesCoverCellsCommentsAndShapes) {
    std::vector<std::string> expected = {
        "sheet name: Summary",
        "max row index: 2",
        "max column index: 3",
        "[A1:B1] Title",
        "[A3] 42",
        "[C3] TRUE",
        "[comment A3] check",
        "[shape text] Arrow label",
    };
    EXPECT_EQ(SheetPrinter::sheetLines(summarySheet()), expected);
}

TEST(SheetPrinterTest, DumpSkipsEmptySheets) {
    MemorySpreadsheet book;
    book.addSheet(emptySheet("Blank"));
    book.addSheet(summarySheet());

    std::ostringstream out;
    EXPECT_EQ(SheetPrinter::dump(book, out), 1);
    std::string text = out.str();
    EXPECT_EQ(text.find("Blank"), std::string::npos);
    EXPECT_EQ(text.compare(0, 20, "sheet name: Summary\n"), 0);
    EXPECT_EQ(text.substr(text.size() - 9), "--------\n");
}

TEST(SheetPrinterTest, DumpReportsFailedStream) {
    MemorySpreadsheet book;
    book.addSheet(summarySheet());
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    EXPECT_THROW(SheetPrinter::dump(book, out), SinkFailure);
}

TEST(SheetPrinterTest, PrintStartsEachSheetOnNewPage) {
    MemorySpreadsheet book;
    book.addSheet(summarySheet());
    book.addSheet(emptySheet("Blank"));
    Sheet second = summarySheet();
    second.name = "Copy";
    book.addSheet(second);

    auto metrics = std::make_shared<MockMetrics>();
    PageCollector collector;
    LayoutEngine layout(metrics, collector, Style::spreadsheetProfile());
    EXPECT_EQ(SheetPrinter::print(book, layout), 2);
    layout.close();

    ASSERT_EQ(collector.pages().size(), 2u);
    auto first = collector.pages()[0].lineTexts();
    auto last = collector.pages()[1].lineTexts();
    ASSERT_EQ(first.size(), 8u);
    EXPECT_EQ(first[0], "sheet name: Summary");
    EXPECT_EQ(last[0], "sheet name: Copy");
    EXPECT_FLOAT_EQ(collector.pages()[0].runs[0].x, 15);
}

// MARK: - CSV source

TEST(CsvSourceTest, ParsesQuotedFieldsAndTypes) {
    CsvSource source("data", "a,\"b,c\",\"say \"\"hi\"\"\"\n1.5,TRUE,\n");
    ASSERT_EQ(source.sheetCount(), 1u);
    const Sheet& sheet = source.sheet(0);
    EXPECT_EQ(sheet.name, "data");
    ASSERT_EQ(sheet.rows.size(), 2u);
    ASSERT_EQ(sheet.rows[0].cells.size(), 3u);
    EXPECT_EQ(std::get<std::string>(sheet.rows[0].cells[1].value), "b,c");
    EXPECT_EQ(std::get<std::string>(sheet.rows[0].cells[2].value), "say \"hi\"");
    ASSERT_EQ(sheet.rows[1].cells.size(), 3u);
    EXPECT_DOUBLE_EQ(std::get<double>(sheet.rows[1].cells[0].value), 1.5);
    EXPECT_TRUE(std::get<bool>(sheet.rows[1].cells[1].value));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(sheet.rows[1].cells[2].value));
}

TEST(CsvSourceTest, QuotedNumbersStayText) {
    CsvSource source("data", "\"007\",007\n");
    const auto& cells = source.sheet(0).rows[0].cells;
    EXPECT_EQ(std::get<std::string>(cells[0].value), "007");
    EXPECT_DOUBLE_EQ(std::get<double>(cells[1].value), 7);
}

TEST(CsvSourceTest, QuotedLineBreaksAndBom) {
    CsvSource source("data", "\xEF\xBB\xBF\"two\nlines\",x\r\ny,z");
    const Sheet& sheet = source.sheet(0);
    ASSERT_EQ(sheet.rows.size(), 2u);
    EXPECT_EQ(std::get<std::string>(sheet.rows[0].cells[0].value), "two\nlines");
    EXPECT_EQ(std::get<std::string>(sheet.rows[1].cells[1].value), "z");
    EXPECT_EQ(sheet.rows[1].index, 1);
}

TEST(CsvSourceTest, UnterminatedQuoteThrows) {
    EXPECT_THROW(CsvSource("data", "a,\"never closed\nb,c\n"), ParseFailure);
}

TEST(CsvSourceTest, SheetIndexOutOfRangeThrows) {
    CsvSource source("data", "a\n");
    EXPECT_THROW(source.sheet(1), std::out_of_range);
}

TEST(CsvSourceTest, SampleFileDump) {
    auto source = openSpreadsheet(testdataDir() + "/sample.csv");
    std::ostringstream out;
    EXPECT_EQ(SheetPrinter::dump(*source, out), 1);
    std::string expected =
        "sheet name: sample\n"
        "max row index: 5\n"
        "max column index: 4\n"
        "[A1] name\n"
        "[B1] qty\n"
        "[C1] price\n"
        "[D1] active\n"
        "[A2] Widget, large\n"
        "[B2] 3\n"
        "[C2] 2.5\n"
        "[D2] TRUE\n"
        "[A3] Gadget\n"
        "[B3] 10\n"
        "[C3] 0.125\n"
        "[D3] FALSE\n"
        "[A4] Quote \"inside\"\n"
        "[C4] 7\n"
        "[A6] multi\nline\n"
        "[B6] 1000\n"
        "[C6] -4\n"
        "[D6] true\n"
        "--------\n";
    EXPECT_EQ(out.str(), expected);
}

TEST(CsvSourceTest, BlankLinesKeepRowNumbering) {
    CsvSource source("gaps", "first\n\n\nfourth\n");
    const Sheet& sheet = source.sheet(0);
    ASSERT_EQ(sheet.rows.size(), 2u);
    EXPECT_EQ(sheet.rows[1].index, 3);
    EXPECT_EQ(cellReference(sheet.rows[1].cells[0].row, sheet.rows[1].cells[0].column), "A4");
    EXPECT_EQ(sheet.lastRowIndex(), 3);
}

TEST(CsvSourceTest, TabSeparatedFile) {
    SourceOptions options;
    options.password = "secret";   // Ignored for delimited text
    auto source = openSpreadsheet(testdataDir() + "/cities.tsv", options);
    const Sheet& sheet = source->sheet(0);
    EXPECT_EQ(sheet.name, "cities");
    ASSERT_EQ(sheet.rows.size(), 3u);
    EXPECT_DOUBLE_EQ(std::get<double>(sheet.rows[1].cells[1].value), 2.7e6);
    EXPECT_EQ(formatCellValue(sheet.rows[2].cells[1].value), "1463723");
}

TEST(CsvSourceTest, UnsupportedFormatsAndMissingFiles) {
    EXPECT_THROW(openSpreadsheet("book.xlsx"), LookupFailure);
    EXPECT_THROW(openSpreadsheet("noextension"), LookupFailure);
    EXPECT_THROW(openSpreadsheet(testdataDir() + "/does-not-exist.csv"), LookupFailure);
}
