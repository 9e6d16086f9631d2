/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * Logger is the single entry point for logging within the library. Worker
 * threads of concurrent compression jobs log through it, so every call is
 * serialized by a mutex before reaching the registered ILogSink instances.
 */

#ifndef PDFSLIM_LOGGER_HPP
#define PDFSLIM_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "pdfslim").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "pdfslim");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Converts a level name to its LogLevel.
     *
     * Accepts "DEBUG", "INFO", "WARNING" (or "WARN") and "ERROR".
     * @return std::nullopt for "NONE" or any unknown name.
     */
    static std::optional<LogLevel> string_to_level(const std::string& level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

#endif // PDFSLIM_LOGGER_HPP
