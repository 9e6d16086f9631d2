/**
 * @file image_codec.hpp
 * @brief Pixel-level decode, resample and encode of embedded images.
 *
 * Thin wrappers over libjpeg and OpenJPEG working on memory buffers.
 * Every codec failure is reported as std::runtime_error.
 */

#ifndef PDFSLIM_IMAGE_CODEC_HPP
#define PDFSLIM_IMAGE_CODEC_HPP

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace pdfslim {

/**
 * @brief 8-bit interleaved raster, 1 (gray), 3 (RGB) or 4 (CMYK) components.
 */
struct RasterImage {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    int components = 0;
    std::vector<unsigned char> pixels; ///< width * height * components bytes, row-major
    bool inverted_cmyk = false;        ///< CMYK from an Adobe-marked JPEG (stored inverted)

    [[nodiscard]] std::size_t expected_size() const noexcept {
        return static_cast<std::size_t>(width) * height * static_cast<std::size_t>(components);
    }
};

namespace codec {

/**
 * @brief Decodes a baseline or progressive JPEG to gray, RGB or CMYK.
 *
 * YCCK is converted to CMYK; CMYK values are returned as stored.
 * @throws std::runtime_error for corrupt data or unknown colour spaces.
 */
RasterImage decode_jpeg(std::span<const unsigned char> data);

/**
 * @brief Encodes a raster as an optimized-Huffman JPEG.
 *
 * Four-component rasters are written as plain CMYK, with an Adobe marker
 * only when RasterImage::inverted_cmyk is set.
 * @param quality libjpeg quality, 1-100.
 */
std::string encode_jpeg(const RasterImage& image, int quality);

/**
 * @brief Decodes a JP2 or raw J2K codestream to gray or RGB.
 *
 * Alpha components are dropped; precisions above 8 bits are reduced.
 * @throws std::runtime_error for undecodable data, unsupported colour spaces
 * or component precisions outside 1-16 bits.
 */
RasterImage decode_jpx(std::span<const unsigned char> data);

/**
 * @brief Area-averaging resample to the given size.
 * @throws std::invalid_argument for empty images or zero target dimensions.
 */
RasterImage resample_area(const RasterImage& image, std::uint32_t target_width, std::uint32_t target_height);

} // namespace codec
} // namespace pdfslim

#endif // PDFSLIM_IMAGE_CODEC_HPP
