/**
 * @file compression_options.hpp
 * @brief User-facing knobs of a compression request.
 */

#ifndef PDFSLIM_COMPRESSION_OPTIONS_HPP
#define PDFSLIM_COMPRESSION_OPTIONS_HPP

#include <optional>
#include <string_view>

namespace pdfslim {

/**
 * @brief Coarse policy knob. Enumerators are ordered: Low < Medium < High.
 */
enum class CompressionLevel {
    Low,
    Medium,
    High
};

/**
 * @brief Immutable options of one compression request.
 */
struct CompressionOptions {
    int quality = 75;                                 ///< 0-100, higher keeps more image detail
    CompressionLevel level = CompressionLevel::Medium;
    bool preserve_quality = false;                    ///< Keep annotations, ProcSet and lossless image data
};

inline constexpr int kMinQuality = 0;
inline constexpr int kMaxQuality = 100;

/**
 * @brief Builds validated options.
 * @throws std::invalid_argument if quality is outside [0, 100].
 */
CompressionOptions make_options(int quality, CompressionLevel level, bool preserve_quality);

/**
 * @brief Parses "low", "medium" or "high" (case-insensitive).
 */
std::optional<CompressionLevel> compression_level_from_string(std::string_view name);

std::string_view to_string(CompressionLevel level) noexcept;

/**
 * @brief libjpeg quality used when re-encoding images.
 */
[[nodiscard]] int jpeg_quality(const CompressionOptions& options) noexcept;

/**
 * @brief Zopfli iteration count for content streams, 0 when re-deflating is disabled.
 */
[[nodiscard]] int zopfli_iterations(const CompressionOptions& options) noexcept;

} // namespace pdfslim

#endif // PDFSLIM_COMPRESSION_OPTIONS_HPP
