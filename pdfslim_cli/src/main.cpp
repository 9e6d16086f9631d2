#include <iostream>
#include <filesystem>
#include <csignal>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <clocale>
#include <iomanip>
#include <memory>
#include <thread>
#include <variant>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "../../libpdfslim/include/compression_job.hpp"
#include "../../libpdfslim/include/event_bus.hpp"
#include "../../libpdfslim/include/events.hpp"
#include "../../libpdfslim/include/file_utils.hpp"
#include "../../libpdfslim/include/logger.hpp"
#include "../../libpdfslim/include/size_estimator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"

// simple progress bar printer
inline void print_progress_bar(const std::string& name, const int percent, const std::string& message,
                               const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 70u ? term_width - 70u : 10u);
    const unsigned pos = static_cast<unsigned>(bar_width * std::clamp(percent, 0, 100) / 100);

    std::cerr << "\r" << std::left << std::setw(20) << name.substr(0, 19) << " [";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && percent < 100) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] " << std::right << std::setw(3) << percent << "%"
              << " " << std::left << std::setw(34) << message.substr(0, 33)
              << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace pdfslim;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};

// handle ctrl+c or termination signals; the running job is cancelled by the watcher thread
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

// helper: drains one job, publishing its messages on the bus
static void compress_file(const fs::path& input, const Settings& settings,
                          const CompressionOptions& options, EventBus& bus) {
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    };

    std::vector<unsigned char> bytes;
    try {
        bytes = read_file_bytes(input);
    } catch (const std::exception& e) {
        bus.publish(CompressionErrorEvent{input, e.what(), elapsed()});
        return;
    }
    bus.publish(CompressionStartEvent{input, bytes.size()});

    CompressionJob job(CompressionRequest{std::move(bytes), options});

    // cancels the job as soon as a signal is seen
    std::jthread watcher([&job](const std::stop_token& st) {
        while (!st.stop_requested()) {
            if (interrupted.load()) {
                job.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    const CompressionOutcome outcome = job.wait([&](const ProgressUpdate& update) {
        bus.publish(CompressionProgressEvent{input, update.percent, update.message});
    });
    watcher.request_stop();

    if (const auto* failure = std::get_if<CompressionFailure>(&outcome)) {
        bus.publish(CompressionErrorEvent{input, failure->error_message, elapsed()});
        return;
    }

    const auto& result = std::get<CompressionResult>(outcome);
    const fs::path output = output_path_for(input, settings.output_path, settings.suffix);
    try {
        write_file_bytes(output, result.output);
    } catch (const std::exception& e) {
        bus.publish(CompressionErrorEvent{input, e.what(), elapsed()});
        return;
    }
    bus.publish(CompressionCompleteEvent{input, output, result.original_size, result.output_size,
                                         result.ratio, elapsed()});
}

int main(int argc, char* argv[]) {

    CLI::App app{"pdfslim: shrink PDF documents by pruning metadata and re-sampling images."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
            return 1;
        }
        Logger::add_sink(std::move(fileSink));
    }

    if (!settings.quiet) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }

    init_utf8_locale();

    CompressionOptions options;
    try {
        options = settings.compression_options();
    } catch (const std::invalid_argument& e) {
        std::cerr << RED << e.what() << RESET << std::endl;
        return 1;
    }

    if (settings.estimate_only) {
        for (const auto& input : settings.inputs) {
            std::error_code ec;
            const auto size = fs::file_size(input, ec);
            if (ec) {
                std::cerr << RED << input.string() << ": " << ec.message() << RESET << std::endl;
                continue;
            }
            std::cout << input.string() << ": " << size << " -> ~"
                      << estimate_compressed_size(size, options) << " bytes" << std::endl;
        }
        return 0;
    }

    EventBus bus;
    std::vector<Result> results;
    auto start_total = std::chrono::steady_clock::now();

    bus.subscribe<CompressionStartEvent>([](const CompressionStartEvent& e) {
        Logger::log(LogLevel::Info,
                    "Compressing " + e.path.filename().string() + " (" + std::to_string(e.original_size) + " bytes)",
                    "main");
    });

    bus.subscribe<CompressionProgressEvent>([&](const CompressionProgressEvent& e) {
        if (!settings.quiet) {
            const double elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - start_total).count();
            print_progress_bar(e.path.filename().string(), e.percent, e.message, elapsed);
        }
    });

    bus.subscribe<CompressionCompleteEvent>([&](const CompressionCompleteEvent& e) {
        if (!settings.quiet) {
            std::cerr
                << (e.ratio >= 0.0 ? GREEN : YELLOW)
                << "\n[DONE] " << e.path.filename().string()
                << " (" << e.original_size << " -> " << e.output_size << " bytes, "
                << std::fixed << std::setprecision(2) << (e.ratio * 100.0) << "%)"
                << " -> " << e.output_path.string()
                << RESET << std::endl;
        }
        Result r;
        r.path = e.path;
        r.output_path = e.output_path;
        r.size_before = e.original_size;
        r.size_after = e.output_size;
        r.ratio = e.ratio;
        r.success = true;
        r.seconds = static_cast<double>(e.duration.count()) / 1000.0;
        results.push_back(std::move(r));
    });

    bus.subscribe<CompressionErrorEvent>([&](const CompressionErrorEvent& e) {
        Logger::log(LogLevel::Error, e.path.filename().string() + " " + e.error_message, "main");

        Result r;
        r.path = e.path;
        std::error_code ec;
        r.size_before = fs::file_size(e.path, ec);
        if (ec) r.size_before = 0;
        r.success = false;
        r.error_msg = e.error_message;
        r.seconds = static_cast<double>(e.duration.count()) / 1000.0;
        results.push_back(std::move(r));
    });

    for (const auto& input : settings.inputs) {
        if (interrupted.load()) {
            break;
        }
        compress_file(input, settings, options, bus);
    }

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    if (!settings.quiet) {
        print_console_report(results, options, total_seconds);
    }

    if (!settings.report_path.empty() &&
        !export_csv_report(results, options, settings.report_path, total_seconds)) {
        Logger::log(LogLevel::Error, "Cannot write report: " + settings.report_path.string(), "main");
    }

    if (interrupted.load()) {
        std::cerr << CYAN << "\n[INTERRUPT] Compression canceled." << RESET << std::endl;
        return 130; // standard exit code for SIGINT
    }
    const bool all_ok = std::ranges::all_of(results, [](const Result& r) { return r.success; });
    return all_ok ? 0 : 1;
}
