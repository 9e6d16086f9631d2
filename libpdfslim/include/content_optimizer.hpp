/**
 * @file content_optimizer.hpp
 * @brief Re-deflates Flate streams with Zopfli.
 */

#ifndef PDFSLIM_CONTENT_OPTIMIZER_HPP
#define PDFSLIM_CONTENT_OPTIMIZER_HPP

#include <qpdf/QPDFObjectHandle.hh>
#include <span>
#include <vector>

namespace pdfslim {

/**
 * @brief Zopfli recompression of page content and form XObject streams.
 *
 * @details The writer keeps Flate streams as they are, so a stream
 * replaced here reaches the output with Zopfli's encoding. Streams with
 * predictors (/DecodeParms) or filter chains are never touched.
 */
class ContentOptimizer {
public:
    /**
     * @brief True if @p stream's only filter is /FlateDecode and it has no /DecodeParms.
     */
    [[nodiscard]] static bool is_plain_flate(QPDFObjectHandle stream);

    /**
     * @brief Replaces a plain Flate stream's data with a Zopfli encoding of
     * the same content, if that encoding is smaller.
     * @param stream Stream object, modified in place.
     * @param iterations Zopfli iteration count; 0 or less disables the call.
     * @return true if the stream data was replaced.
     * @throws std::runtime_error (qpdf) if the stream cannot be decoded.
     */
    static bool reflate(QPDFObjectHandle& stream, int iterations);

    /**
     * @brief Compresses @p input into a zlib container with Zopfli.
     */
    [[nodiscard]] static std::vector<unsigned char> zopfli_zlib(std::span<const unsigned char> input, int iterations);
};

} // namespace pdfslim

#endif // PDFSLIM_CONTENT_OPTIMIZER_HPP
