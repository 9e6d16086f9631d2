#include <gtest/gtest.h>
#include "../pdfslim_cli/src/cli/cli_parser.hpp"
#include "../pdfslim_cli/src/report/report_generator.hpp"
#include "../pdfslim_cli/src/utils/file_log_sink.hpp"
#include <CLI/CLI.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("pdfslim_cli_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        for (const char* name : {"a.pdf", "b.pdf"}) {
            std::ofstream(dir_ / name) << "%PDF-1.7\n";
        }
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void parse(const std::string& args) {
        setup_cli_parser(app_, settings_);
        app_.parse(args, false);
    }

    std::string file(const char* name) const { return (dir_ / name).string(); }

    fs::path dir_;
    CLI::App app_{"pdfslim"};
    Settings settings_;
};

} // namespace

TEST_F(CliTest, Defaults) {
    parse(file("a.pdf"));
    EXPECT_EQ(settings_.quality, 75);
    EXPECT_EQ(settings_.level, pdfslim::CompressionLevel::Medium);
    EXPECT_FALSE(settings_.preserve_quality);
    EXPECT_EQ(settings_.suffix, "-compressed");
    ASSERT_EQ(settings_.inputs.size(), 1u);
    const auto options = settings_.compression_options();
    EXPECT_EQ(options.quality, 75);
}

TEST_F(CliTest, CompressionFlags) {
    parse("-q 30 --level HIGH --preserve-quality " + file("a.pdf") + " " + file("b.pdf"));
    EXPECT_EQ(settings_.quality, 30);
    EXPECT_EQ(settings_.level, pdfslim::CompressionLevel::High);
    EXPECT_TRUE(settings_.preserve_quality);
    EXPECT_EQ(settings_.inputs.size(), 2u);
}

TEST_F(CliTest, RejectsOutOfRangeQuality) {
    EXPECT_THROW(parse("-q 101 " + file("a.pdf")), CLI::ValidationError);
}

TEST_F(CliTest, RejectsUnknownLevel) {
    EXPECT_THROW(parse("-l extreme " + file("a.pdf")), CLI::ValidationError);
}

TEST_F(CliTest, LevelIsCaseInsensitive) {
    parse("-l Low " + file("a.pdf"));
    EXPECT_EQ(settings_.level, pdfslim::CompressionLevel::Low);
}

TEST_F(CliTest, FileLogSinkWritesTimestampedLines) {
    const fs::path log = dir_ / "pdfslim.log";
    {
        FileLogSink sink(log, false);
        ASSERT_TRUE(sink.is_open());
        sink.log(LogLevel::Info, "Compressing a.pdf (9 bytes)", "main");
        sink.log(LogLevel::Error, "untagged", "");
    }
    std::ifstream in(log);
    std::string first;
    std::string second;
    ASSERT_TRUE(std::getline(in, first));
    ASSERT_TRUE(std::getline(in, second));

    // "YYYY-MM-DD HH:MM:SS " prefix
    ASSERT_GT(first.size(), 20u);
    EXPECT_EQ(first[4], '-');
    EXPECT_EQ(first[13], ':');
    EXPECT_NE(first.find("[INFO][main] Compressing a.pdf (9 bytes)"), std::string::npos);
    EXPECT_NE(second.find("[ERROR] untagged"), std::string::npos);
}

TEST_F(CliTest, RejectsMissingInput) {
    EXPECT_THROW(parse(file("missing.pdf")), CLI::ValidationError);
}

TEST_F(CliTest, SeveralInputsNeedOutputDirectory) {
    EXPECT_THROW(parse("-o " + file("out.pdf") + " " + file("a.pdf") + " " + file("b.pdf")), CLI::ValidationError);
}

TEST_F(CliTest, SeveralInputsIntoDirectory) {
    parse("-o " + dir_.string() + " " + file("a.pdf") + " " + file("b.pdf"));
    EXPECT_EQ(settings_.output_path, dir_);
}

TEST_F(CliTest, CsvReportRows) {
    std::vector<Result> results(2);
    results[0].path = "a.pdf";
    results[0].output_path = "a-compressed.pdf";
    results[0].size_before = 1000;
    results[0].size_after = 400;
    results[0].ratio = 0.6;
    results[0].success = true;
    results[1].path = "b, with comma.pdf";
    results[1].size_before = 10;
    results[1].error_msg = "Failed to load PDF: no trailer";

    const fs::path csv = dir_ / "report.csv";
    ASSERT_TRUE(export_csv_report(results, pdfslim::make_options(40, pdfslim::CompressionLevel::High, false), csv, 1.5));

    std::ifstream in(csv);
    std::stringstream buffer;
    buffer << in.rdbuf();
    const std::string text = buffer.str();
    EXPECT_NE(text.find("a.pdf,a-compressed.pdf,1000,400,60.00,"), std::string::npos);
    EXPECT_NE(text.find("\"b, with comma.pdf\",,10,,,"), std::string::npos);
    EXPECT_NE(text.find("FAIL,Failed to load PDF: no trailer"), std::string::npos);
    EXPECT_NE(text.find("1.50 seconds,\"high, quality 40\""), std::string::npos);
}
