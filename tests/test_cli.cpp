#include <gtest/gtest.h>
#include "cli.h"
#include "test_support.h"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace docpress;
using docpress::test::readFile;

namespace {

std::string scratchPath(const std::string& name) {
    return (std::filesystem::path(::testing::TempDir()) / name).string();
}

void writeText(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

} // anonymous namespace

// MARK: - Paths

TEST(CliTest, TrimQuotes) {
    EXPECT_EQ(cli::trimQuotes("\"report.txt\""), "report.txt");
    EXPECT_EQ(cli::trimQuotes("report.txt"), "report.txt");
    EXPECT_EQ(cli::trimQuotes("\""), "\"");
}

TEST(CliTest, OutputPathReplacesExtension) {
    EXPECT_EQ(cli::outputPath("dir/report.txt", ".pages.txt"), "dir/report.pages.txt");
    EXPECT_EQ(cli::outputPath("dir/book.csv", ".txt"), "dir/book.txt");
    EXPECT_EQ(cli::outputPath("dir.d/notes", ".pages.txt"), "dir.d/notes.pages.txt");
    EXPECT_EQ(cli::outputPath(".hidden", ".txt"), ".hidden.txt");
}

// MARK: - Arguments

TEST(CliTest, OptionsBeforeMode) {
    cli::Options options;
    ASSERT_TRUE(cli::parseArguments({"-s", "12", "-m", "sheet", "\"a.csv\""}, options));
    EXPECT_EQ(options.mode, cli::Mode::Sheet);
    ASSERT_TRUE(options.fontSize.has_value());
    EXPECT_FLOAT_EQ(*options.fontSize, 12);
    EXPECT_TRUE(options.drawMarginLine);
    ASSERT_EQ(options.files.size(), 1u);
    EXPECT_EQ(options.files[0], "a.csv");
}

TEST(CliTest, OptionsAfterModeAreNotFiles) {
    cli::Options options;
    ASSERT_TRUE(cli::parseArguments({"markup", "-v", "debug", "a.txt", "-d"}, options));
    ASSERT_TRUE(options.logLevel.has_value());
    EXPECT_EQ(*options.logLevel, LogLevel::Debug);
    EXPECT_TRUE(options.drawDebugPoints);
    ASSERT_EQ(options.files.size(), 1u);
    EXPECT_EQ(options.files[0], "a.txt");
}

TEST(CliTest, UsageErrors) {
    cli::Options options;
    EXPECT_FALSE(cli::parseArguments({}, options));
    EXPECT_FALSE(cli::parseArguments({"markup"}, options));
    EXPECT_FALSE(cli::parseArguments({"render", "a.txt"}, options));
    EXPECT_FALSE(cli::parseArguments({"markup", "-x", "a.txt"}, options));
    EXPECT_FALSE(cli::parseArguments({"markup", "a.txt", "-s"}, options));
    EXPECT_FALSE(cli::parseArguments({"-s", "0", "markup", "a.txt"}, options));
    EXPECT_FALSE(cli::parseArguments({"-v", "loud", "markup", "a.txt"}, options));
}

// MARK: - Exit policy

TEST(CliTest, FailedFileDoesNotStopTheRest) {
    std::string good = scratchPath("cli_good.txt");
    std::string missing = scratchPath("cli_missing.txt");
    std::filesystem::remove(missing);
    std::filesystem::remove(scratchPath("cli_good.pages.txt"));
    writeText(good, ":center heading\nbody\n");

    cli::Options options;
    options.files = {missing, good};
    EXPECT_EQ(cli::run(options), cli::kExitFailed);

    std::string dump = readFile(scratchPath("cli_good.pages.txt"));
    EXPECT_EQ(dump.compare(0, 7, "page 1 "), 0);
    EXPECT_NE(dump.find("\"heading\""), std::string::npos);
    EXPECT_NE(dump.find("end page 1"), std::string::npos);
}

TEST(CliTest, AllFilesConvertedExitsOk) {
    std::string first = scratchPath("cli_first.txt");
    std::string second = scratchPath("cli_second.txt");
    writeText(first, "one\n");
    writeText(second, "two\n");

    cli::Options options;
    options.files = {first, second};
    EXPECT_EQ(cli::run(options), cli::kExitOk);
    EXPECT_FALSE(readFile(scratchPath("cli_first.pages.txt")).empty());
    EXPECT_FALSE(readFile(scratchPath("cli_second.pages.txt")).empty());
}

TEST(CliTest, SheetWritesPagesAndPlainDump) {
    std::string book = scratchPath("cli_book.csv");
    writeText(book, "name,qty\nbolt,4\n");

    cli::Options options;
    options.mode = cli::Mode::Sheet;
    options.files = {book};
    EXPECT_EQ(cli::run(options), cli::kExitOk);
    EXPECT_NE(readFile(scratchPath("cli_book.pages.txt")).find("\"[B2] 4\""), std::string::npos);
    EXPECT_EQ(readFile(scratchPath("cli_book.txt")).rfind("sheet name: cli_book\n", 0), 0u);
}

TEST(CliTest, MainReportsUsageAndFailure) {
    std::string missing = scratchPath("cli_absent.txt");
    std::filesystem::remove(missing);

    std::vector<std::string> bad = {"docpress", "markup", "--bogus", "a.txt"};
    std::vector<std::string> failing = {"docpress", "-v", "off", "markup", missing};
    auto callMain = [](std::vector<std::string>& args) {
        std::vector<char*> argv;
        for (auto& arg : args) argv.push_back(&arg[0]);
        argv.push_back(nullptr);
        return cli::main(static_cast<int>(args.size()), argv.data());
    };
    EXPECT_EQ(callMain(bad), cli::kExitUsage);
    EXPECT_EQ(callMain(failing), cli::kExitFailed);
    setLogLevel(LogLevel::Warn);
}
