#ifndef PDFSLIM_CLI_PARSER_HPP
#define PDFSLIM_CLI_PARSER_HPP

#include <string>
#include <vector>
#include <filesystem>
#include "../../../libpdfslim/include/compression_options.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    int quality = 75;
    pdfslim::CompressionLevel level = pdfslim::CompressionLevel::Medium;
    bool preserve_quality = false;
    bool estimate_only = false;
    bool quiet = false;

    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path output_path;
    std::filesystem::path report_path;
    std::string suffix = "-compressed";

    std::vector<std::filesystem::path> inputs;

    /**
     * @brief Validated core options built from the flags.
     * @throws std::invalid_argument if quality is out of range.
     */
    [[nodiscard]] pdfslim::CompressionOptions compression_options() const {
        return pdfslim::make_options(quality, level, preserve_quality);
    }
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // PDFSLIM_CLI_PARSER_HPP
