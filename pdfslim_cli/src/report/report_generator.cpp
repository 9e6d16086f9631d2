#include "report_generator.hpp"
#include <iostream>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <regex>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_ERROR_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

static std::string strip_ansi(const std::string& s) {
    static const std::regex ansi_pattern("\033\\[[0-9;]*m");
    return std::regex_replace(s, ansi_pattern, "");
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string fixed2(const double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

static std::string outcome_label(const Result& r, const bool use_colors) {
    if (!r.success) {
        return use_colors ? "\033[1;31mFAIL\033[0m" : "FAIL";
    }
    if (r.ratio < 0.0) {
        return use_colors ? "\033[1;33mOK (grew)\033[0m" : "OK (grew)";
    }
    return use_colors ? "\033[1;32mOK\033[0m" : "OK";
}

static std::string options_label(const pdfslim::CompressionOptions& options) {
    return std::string(pdfslim::to_string(options.level)) + ", quality " + std::to_string(options.quality) +
           (options.preserve_quality ? ", preserve-quality" : "");
}

void print_console_report(const std::vector<Result>& results,
                          const pdfslim::CompressionOptions& options,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    size_t max_before = 12;
    size_t max_after = 12;
    size_t max_delta = 10;
    size_t max_time = 10;
    size_t max_result = 10;
    size_t max_error = 5;
    for (const auto& r : results) {
        max_before = std::max(max_before, std::to_string(r.size_before / 1024).size() + 2);
        max_after  = std::max(max_after,  std::to_string(r.size_after / 1024).size() + 2);
        max_delta  = std::max(max_delta,  fixed2(r.ratio * 100.0).size() + 3);
        max_time   = std::max(max_time,   fixed2(r.seconds).size() + 2);
        max_result = std::max(max_result, strip_ansi(outcome_label(r, use_colors)).size() + 2);
        max_error  = std::max(max_error,  r.error_msg.size());
    }

    const size_t fixed_cols_width = max_before + max_after + max_delta + max_time + max_result + max_error + 6;
    const size_t file_col_width = term_width > fixed_cols_width + 10 ? term_width - fixed_cols_width : 20;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(file_col_width)) << "File"
              << std::setw(static_cast<int>(max_before)) << "Before(KB)"
              << std::setw(static_cast<int>(max_after))  << "After(KB)"
              << std::setw(static_cast<int>(max_delta))  << "Ratio(%)"
              << std::setw(static_cast<int>(max_time))   << "Time(s)"
              << std::setw(static_cast<int>(max_result)) << "Result"
              << "Error"
              << "\n";

    std::uintmax_t total_original = 0;
    std::uintmax_t total_output = 0;
    auto sorted = results;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.path < b.path;
    });

    for (const auto& r : sorted) {
        const std::string delta = r.success ? fixed2(r.ratio * 100.0) + "%" : "-";
        const std::string outcome = outcome_label(r, use_colors);
        // pad on the visible width, the escape sequences take no columns
        const size_t padding = max_result - std::min(max_result, strip_ansi(outcome).size());
        if (r.success) {
            total_original += r.size_before;
            total_output += r.size_after;
        }

        std::cerr << std::left << std::setw(static_cast<int>(file_col_width))
                  << truncate(r.path.filename().string(), file_col_width - 1)
                  << std::setw(static_cast<int>(max_before)) << (r.size_before / 1024)
                  << std::setw(static_cast<int>(max_after))  << (r.success ? std::to_string(r.size_after / 1024) : "-")
                  << std::setw(static_cast<int>(max_delta))  << delta
                  << std::setw(static_cast<int>(max_time))   << fixed2(r.seconds)
                  << outcome << std::string(padding, ' ')
                  << r.error_msg
                  << "\n";
    }

    std::cerr << "\nSettings: " << options_label(options) << "\n";
    if (total_original > 0) {
        const auto saved = static_cast<double>(total_original) - static_cast<double>(total_output);
        std::cerr << "Total saved space: " << fixed2(saved / 1024.0) << " KB\n";
        std::cerr << "Total reduction: " << fixed2(100.0 * saved / static_cast<double>(total_original)) << "%\n";
    }
    std::cerr << "Total time: " << fixed2(total_seconds) << " s\n";
}

bool export_csv_report(const std::vector<Result>& results,
                       const pdfslim::CompressionOptions& options,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "File,Output,Before(bytes),After(bytes),Ratio(%),Time(s),Result,Error\n";

    for (const auto& r : results) {
        out << csv_escape(r.path.string()) << ","
            << csv_escape(r.success ? r.output_path.string() : "") << ","
            << r.size_before << ","
            << (r.success ? std::to_string(r.size_after) : "") << ","
            << (r.success ? fixed2(r.ratio * 100.0) : "") << ","
            << fixed2(r.seconds) << ","
            << csv_escape(outcome_label(r, false)) << ","
            << csv_escape(r.error_msg) << "\n";
    }

    out << "\n\nTotal amount of time,Settings\n";
    out << fixed2(total_seconds) << " seconds," << csv_escape(options_label(options)) << "\n";
    return static_cast<bool>(out);
}
