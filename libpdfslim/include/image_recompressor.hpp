/**
 * @file image_recompressor.hpp
 * @brief Applies an image transform decision to one image XObject stream.
 */

#ifndef PDFSLIM_IMAGE_RECOMPRESSOR_HPP
#define PDFSLIM_IMAGE_RECOMPRESSOR_HPP

#include "compression_options.hpp"
#include "image_policy.hpp"
#include <qpdf/QPDFObjectHandle.hh>
#include <optional>

namespace pdfslim {

enum class RecompressStatus {
    Replaced,     ///< Stream data and dictionary were rewritten
    KeptOriginal, ///< Nothing to do, or the re-encoded data was not smaller
    Unsupported   ///< Pixel layout the codecs cannot round-trip
};

/**
 * @brief Decodes, downsamples and re-encodes image XObjects.
 *
 * @details Only 8-bit gray and RGB images are handled (DeviceGray,
 * DeviceRGB, or ICCBased with one or three components; JPEG2000 images
 * carry their colour space in the codestream). Image masks, /Decode
 * arrays, colour-key masks and indexed colour spaces are reported as
 * Unsupported and left untouched.
 *
 * The output is JPEG at jpeg_quality(options), except for Flate and
 * unfiltered sources with preserve_quality set, which stay lossless.
 */
class ImageRecompressor {
public:
    /**
     * @brief Reads dimensions and codec from an image stream's dictionary.
     * @return std::nullopt if /Width or /Height is missing or not a positive integer.
     */
    [[nodiscard]] static std::optional<ImageDescriptor> describe(QPDFObjectHandle image);

    /**
     * @brief Rewrites @p image according to @p decision.
     * @throws std::runtime_error if the image data cannot be decoded.
     */
    static RecompressStatus recompress(QPDFObjectHandle& image,
                                       const ImageTransformDecision& decision,
                                       const CompressionOptions& options);
};

} // namespace pdfslim

#endif // PDFSLIM_IMAGE_RECOMPRESSOR_HPP
