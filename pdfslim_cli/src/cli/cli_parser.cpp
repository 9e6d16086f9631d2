#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <string>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Compression options ---
    app.add_option("-q,--quality", settings.quality,
                   "Image quality, 0-100. Lower values shrink images more.")
                   ->default_val(settings.quality)
                   ->check(CLI::Range(pdfslim::kMinQuality, pdfslim::kMaxQuality));

    app.add_option_function<std::string>("-l,--level",
        [&settings](const std::string& value) {
            settings.level = pdfslim::compression_level_from_string(value).value_or(settings.level);
        }, "Compression level: low, medium (default) or high.")
        ->check(CLI::Validator([](std::string& value) -> std::string {
            if (pdfslim::compression_level_from_string(value)) return {};
            return "unknown compression level '" + value + "'";
        }, "LEVEL"));

    app.add_flag("--preserve-quality", settings.preserve_quality,
                 "Keep annotations and store re-sampled Flate images losslessly.");

    app.add_flag("--estimate", settings.estimate_only,
                 "Print the estimated compressed size and exit without compressing.");

    // --- Output ---
    app.add_option("-o,--output", settings.output_path,
                   "Write the compressed file to PATH (a file for one input, or an existing directory).");

    app.add_option("--suffix", settings.suffix,
                   "Suffix appended to the input stem when naming outputs.")
                   ->default_val(settings.suffix);

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    app.add_flag("--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One or more PDF files")
        ->required()
        ->check(CLI::ExistingFile);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.inputs.size() > 1 && !settings.output_path.empty() &&
            !std::filesystem::is_directory(settings.output_path)) {
            throw CLI::ValidationError("Option '-o, --output' must be an existing directory when compressing several files.");
        }
        if (settings.suffix.empty() && settings.output_path.empty()) {
            throw CLI::ValidationError("An empty --suffix without -o, --output would overwrite the input.");
        }
    });
}
