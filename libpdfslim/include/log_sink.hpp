/**
 * @file log_sink.hpp
 * @brief Log severity levels and the sink interface used by Logger.
 */

#ifndef PDFSLIM_LOG_SINK_HPP
#define PDFSLIM_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information (per object, per image)
    Info,    ///< Stage transitions and per-request summaries
    Warning, ///< Recovered failures (stage errors, qpdf warnings)
    Error    ///< Fatal request failures (load or save)
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations define where log messages go (console, file, test
 * capture). Logger fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // PDFSLIM_LOG_SINK_HPP
