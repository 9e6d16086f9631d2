#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../libpdfslim/include/file_utils.hpp"
#include <filesystem>
#include <stdexcept>

using namespace pdfslim;
namespace fs = std::filesystem;

namespace {

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("pdfslim_file_utils_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    test::ScopedLogCapture capture_;
};

} // namespace

TEST_F(FileUtilsTest, WriteThenReadBack) {
    const std::vector<unsigned char> data = {'%', 'P', 'D', 'F', 0, 255, 10};
    const fs::path path = dir_ / "out.pdf";
    write_file_bytes(path, data);
    EXPECT_EQ(read_file_bytes(path), data);
    EXPECT_FALSE(fs::exists(dir_ / "out.pdf.tmp"));
}

TEST_F(FileUtilsTest, WriteReplacesExistingFile) {
    const fs::path path = dir_ / "out.pdf";
    write_file_bytes(path, std::vector<unsigned char>(1000, 'a'));
    write_file_bytes(path, std::vector<unsigned char>(3, 'b'));
    EXPECT_EQ(fs::file_size(path), 3u);
}

TEST_F(FileUtilsTest, ReadMissingFileThrows) {
    EXPECT_THROW(read_file_bytes(dir_ / "missing.pdf"), std::runtime_error);
}

TEST_F(FileUtilsTest, WriteIntoMissingDirectoryThrows) {
    const std::vector<unsigned char> data = {1, 2, 3};
    EXPECT_THROW(write_file_bytes(dir_ / "nope" / "out.pdf", data), std::runtime_error);
}

TEST_F(FileUtilsTest, OutputPathRules) {
    const fs::path input = dir_ / "report.final.pdf";
    EXPECT_EQ(output_path_for(input, {}, "-compressed"), dir_ / "report.final-compressed.pdf");
    EXPECT_EQ(output_path_for(input, dir_, "-small"), dir_ / "report.final-small.pdf");
    EXPECT_EQ(output_path_for(input, dir_ / "explicit.pdf", "-compressed"), dir_ / "explicit.pdf");
}
