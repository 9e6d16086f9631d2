/**
 * @file size_estimator.hpp
 * @brief Rough prediction of the compressed size, shown before compressing.
 */

#ifndef PDFSLIM_SIZE_ESTIMATOR_HPP
#define PDFSLIM_SIZE_ESTIMATOR_HPP

#include "compression_options.hpp"
#include <cstdint>

namespace pdfslim {

/**
 * @brief Heuristic estimate of the output size.
 *
 * Level factor (low 0.85, medium 0.65, high 0.5 with preserve-quality or
 * 0.3 without) times 1 - (100 - quality) / 200, floored.
 */
[[nodiscard]] std::uintmax_t estimate_compressed_size(std::uintmax_t original_size,
                                                      const CompressionOptions& options) noexcept;

} // namespace pdfslim

#endif // PDFSLIM_SIZE_ESTIMATOR_HPP
