/**
 * @file result_packager.hpp
 * @brief Builds the terminal outcome of a request.
 */

#ifndef PDFSLIM_RESULT_PACKAGER_HPP
#define PDFSLIM_RESULT_PACKAGER_HPP

#include "compression_types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace pdfslim {

/**
 * @brief (original - output) / original.
 *
 * Negative when the output is larger; never clamped. An empty original
 * yields 0.0.
 */
[[nodiscard]] double compute_ratio(std::uintmax_t original_size, std::uintmax_t output_size) noexcept;

CompressionOutcome package_success(std::vector<unsigned char> output, std::uintmax_t original_size);

CompressionOutcome package_failure(std::string message);

} // namespace pdfslim

#endif // PDFSLIM_RESULT_PACKAGER_HPP
