#ifndef PDFSLIM_REPORT_GENERATOR_HPP
#define PDFSLIM_REPORT_GENERATOR_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "../../../libpdfslim/include/compression_options.hpp"

/**
 * @brief Outcome of one input file, as shown in the reports.
 */
struct Result {
    std::filesystem::path path;
    std::filesystem::path output_path;
    std::uintmax_t size_before = 0;
    std::uintmax_t size_after = 0;
    double ratio = 0.0;   ///< As computed by the core, negative when the file grew
    double seconds = 0.0;
    bool success = false;
    std::string error_msg;
};

unsigned get_terminal_width();

/**
 * @brief Prints a table with one row per file plus totals to stderr.
 */
void print_console_report(const std::vector<Result>& results,
                          const pdfslim::CompressionOptions& options,
                          double total_seconds);

/**
 * @brief Writes the same rows as a CSV file.
 * @return false if the file could not be opened.
 */
bool export_csv_report(const std::vector<Result>& results,
                       const pdfslim::CompressionOptions& options,
                       const std::filesystem::path& output_path,
                       double total_seconds);

#endif // PDFSLIM_REPORT_GENERATOR_HPP
