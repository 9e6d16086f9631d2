/**
 * @file image_policy.hpp
 * @brief Decides how aggressively each embedded image is downsampled.
 */

#ifndef PDFSLIM_IMAGE_POLICY_HPP
#define PDFSLIM_IMAGE_POLICY_HPP

#include "compression_options.hpp"
#include <qpdf/QPDFObjectHandle.hh>
#include <cstdint>

namespace pdfslim {

/**
 * @brief Encoding of an image stream, derived from its /Filter.
 */
enum class ImageCodec {
    Raw,   ///< No filter
    Flate, ///< Lossless filters only (Flate, LZW, RunLength, ASCII85, ASCIIHex), alone or chained
    Dct,   ///< /DCTDecode (JPEG), possibly after lossless filters
    Jpx,   ///< A lone /JPXDecode (JPEG2000)
    Other  ///< Anything else (CCITT, JBIG2, Crypt, chained /JPXDecode)
};

/**
 * @brief What the policy needs to know about an image.
 */
struct ImageDescriptor {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    ImageCodec codec = ImageCodec::Raw;
};

/**
 * @brief Result of the policy for one image.
 */
struct ImageTransformDecision {
    enum class Action {
        Skip,    ///< Leave the image byte-identical
        Resample ///< Re-encode at target_width x target_height
    };

    Action action = Action::Skip;
    double scale_factor = 1.0; ///< In (0, 1]; 1.0 whenever action is Skip
    std::uint32_t target_width = 0;
    std::uint32_t target_height = 0;

    [[nodiscard]] bool should_resample() const noexcept { return action == Action::Resample; }
};

/// Images narrower or shorter than this are never transformed.
inline constexpr std::uint32_t kMinImageDimension = 100;
/// Images wider or taller than this get the large-image modifier.
inline constexpr std::uint32_t kLargeImageDimension = 1000;

/**
 * @brief Scale factor for an image, before eligibility and codec checks.
 *
 * Base factor by (level, quality), times 0.8 for images above 1000 pixels
 * in either dimension, times 0.7 at level high with quality below 30.
 */
[[nodiscard]] double scale_factor_for(const ImageDescriptor& image, const CompressionOptions& options) noexcept;

/**
 * @brief Deterministic transform decision for one image.
 *
 * Skips images below 100x100, images whose factor is 1.0, JPEG2000 images
 * below level high and codecs that cannot be re-encoded.
 */
[[nodiscard]] ImageTransformDecision decide_image_transform(const ImageDescriptor& image,
                                                            const CompressionOptions& options) noexcept;

/**
 * @brief Classifies a stream's /Filter value (a name or an array of names).
 */
[[nodiscard]] ImageCodec classify_filter(QPDFObjectHandle filter);

} // namespace pdfslim

#endif // PDFSLIM_IMAGE_POLICY_HPP
