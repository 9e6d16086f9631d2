#ifndef PDFSLIM_EVENTS_HPP
#define PDFSLIM_EVENTS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace pdfslim {

/**
 * @brief Events published by hosts while they drain compression jobs.
 *
 * Plain data carriers for EventBus; one start event, any number of
 * progress events and exactly one complete or error event per input.
 */

/**
 * @brief Emitted when a document has been read and its job submitted.
 */
struct CompressionStartEvent {
    std::filesystem::path path; ///< Input document
    std::uintmax_t original_size = 0;
};

/**
 * @brief Emitted for every progress message received from a job.
 */
struct CompressionProgressEvent {
    std::filesystem::path path;
    int percent = 0;     ///< 0-100, non-decreasing per job
    std::string message; ///< Stage label, may be empty
};

/**
 * @brief Emitted when a job finished successfully and its output was written.
 */
struct CompressionCompleteEvent {
    std::filesystem::path path;        ///< Input document
    std::filesystem::path output_path; ///< Written document
    std::uintmax_t original_size = 0;
    std::uintmax_t output_size = 0;
    double ratio = 0.0;                ///< May be negative
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when a job failed or its output could not be written.
 */
struct CompressionErrorEvent {
    std::filesystem::path path;
    std::string error_message;
    std::chrono::milliseconds duration{0};
};

} // namespace pdfslim

#endif // PDFSLIM_EVENTS_HPP
