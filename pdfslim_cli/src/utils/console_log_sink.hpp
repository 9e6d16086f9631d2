#ifndef PDFSLIM_CONSOLE_LOG_SINK_HPP
#define PDFSLIM_CONSOLE_LOG_SINK_HPP

#include "../../../libpdfslim/include/log_sink.hpp"
#include "../../../libpdfslim/include/logger.hpp"
#include "color.hpp"
#include <iostream>
#include <optional>

/**
 * @brief Writes log lines to stderr, colored by severity.
 *
 * Messages below log_level are dropped; an empty log_level ("NONE")
 * silences the sink.
 */
class ConsoleLogSink final : public ILogSink {
public:
    std::optional<LogLevel> log_level = LogLevel::Error;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!log_level || level < *log_level) return;

        const char* color = RESET;
        switch (level) {
            case LogLevel::Debug:   color = GRAY; break;
            case LogLevel::Info:    color = RESET; break;
            case LogLevel::Warning: color = YELLOW; break;
            case LogLevel::Error:   color = RED; break;
        }
        std::cerr << "\n" << color << "[" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) std::cerr << "[" << tag << "]";
        std::cerr << " " << message << RESET << std::endl;
    }
};

#endif // PDFSLIM_CONSOLE_LOG_SINK_HPP
