/**
 * @file compression_types.hpp
 * @brief Request, progress and outcome values exchanged with a compression job.
 */

#ifndef PDFSLIM_COMPRESSION_TYPES_HPP
#define PDFSLIM_COMPRESSION_TYPES_HPP

#include "compression_options.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace pdfslim {

/**
 * @brief Document bytes plus the options to compress them with.
 */
struct CompressionRequest {
    std::vector<unsigned char> document;
    CompressionOptions options;
};

/**
 * @brief Progress message; percent never decreases within one request.
 */
struct ProgressUpdate {
    int percent = 0;
    std::string message;
};

/**
 * @brief Terminal success message.
 */
struct CompressionResult {
    std::vector<unsigned char> output;
    std::uintmax_t original_size = 0;
    std::uintmax_t output_size = 0;
    double ratio = 0.0; ///< (original - output) / original, negative when the output grew
};

/**
 * @brief Terminal error message.
 */
struct CompressionFailure {
    std::string error_message;
};

/// Exactly one per request.
using CompressionOutcome = std::variant<CompressionResult, CompressionFailure>;

using ProgressCallback = std::function<void(const ProgressUpdate&)>;

} // namespace pdfslim

#endif // PDFSLIM_COMPRESSION_TYPES_HPP
