#include "../../include/image_recompressor.hpp"
#include "../../include/image_codec.hpp"
#include "../../include/logger.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/Constants.h>
#include <zlib.h>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace pdfslim {

namespace {

// helper: 1, 3 or 4 for gray/RGB/CMYK colour spaces, 0 for anything else
int colour_components(QPDFObjectHandle cs) {
    if (cs.isName()) {
        const std::string name = cs.getName();
        if (name == "/DeviceGray") return 1;
        if (name == "/DeviceRGB") return 3;
        if (name == "/DeviceCMYK") return 4;
        return 0;
    }
    if (cs.isArray() && cs.getArrayNItems() == 2) {
        const QPDFObjectHandle family = cs.getArrayItem(0);
        QPDFObjectHandle profile = cs.getArrayItem(1);
        if (family.isName() && family.getName() == "/ICCBased" && profile.isStream()) {
            const QPDFObjectHandle n = profile.getDict().getKey("/N");
            if (n.isInteger()) {
                const int components = n.getIntValueAsInt();
                if (components == 1 || components == 3 || components == 4) return components;
            }
        }
    }
    return 0;
}

int bits_per_component(QPDFObjectHandle dict) {
    const QPDFObjectHandle bpc = dict.getKey("/BitsPerComponent");
    return bpc.isInteger() ? bpc.getIntValueAsInt() : 0;
}

bool is_true(QPDFObjectHandle value) {
    return value.isBool() && value.getBoolValue();
}

// a lone /DCTDecode, as opposed to one behind lossless filters
bool is_single_filter(QPDFObjectHandle filter) {
    return filter.isName() || (filter.isArray() && filter.getArrayNItems() == 1);
}

// alpha that lives with the parent's pixels: JPX SMaskInData, or a soft mask premultiplied by /Matte
bool has_bound_alpha(QPDFObjectHandle dict) {
    const QPDFObjectHandle smask_in_data = dict.getKey("/SMaskInData");
    if (smask_in_data.isInteger() && smask_in_data.getIntValue() != 0) {
        return true;
    }
    const QPDFObjectHandle smask = dict.getKey("/SMask");
    return smask.isStream() && smask.getDict().hasKey("/Matte");
}

std::vector<unsigned char> unpack_pixels(const std::shared_ptr<Buffer>& decoded, const std::size_t size) {
    return {decoded->getBuffer(), decoded->getBuffer() + size};
}

std::span<const unsigned char> as_span(const std::shared_ptr<Buffer>& buf) {
    return {buf->getBuffer(), buf->getSize()};
}

std::string deflate_pixels(const std::vector<unsigned char>& pixels) {
    uLongf size = compressBound(static_cast<uLong>(pixels.size()));
    std::string out(size, '\0');
    if (compress2(reinterpret_cast<Bytef*>(out.data()), &size,
                  pixels.data(), static_cast<uLong>(pixels.size()), Z_BEST_COMPRESSION) != Z_OK) {
        throw std::runtime_error("zlib: compress2 failed");
    }
    out.resize(size);
    return out;
}

std::string object_label(QPDFObjectHandle& image) {
    return image.isIndirect() ? "image " + image.getObjGen().unparse(' ') : std::string("inline image");
}

} // namespace

std::optional<ImageDescriptor> ImageRecompressor::describe(QPDFObjectHandle image) {
    if (!image.isStream()) return std::nullopt;
    const QPDFObjectHandle dict = image.getDict();
    const QPDFObjectHandle width = dict.getKey("/Width");
    const QPDFObjectHandle height = dict.getKey("/Height");
    if (!width.isInteger() || !height.isInteger() ||
        width.getIntValue() <= 0 || height.getIntValue() <= 0) {
        return std::nullopt;
    }
    ImageDescriptor descriptor;
    descriptor.width = width.getUIntValueAsUInt();
    descriptor.height = height.getUIntValueAsUInt();
    descriptor.codec = classify_filter(dict.getKey("/Filter"));
    return descriptor;
}

RecompressStatus ImageRecompressor::recompress(QPDFObjectHandle& image,
                                               const ImageTransformDecision& decision,
                                               const CompressionOptions& options) {
    if (!decision.should_resample()) {
        return RecompressStatus::KeptOriginal;
    }
    const auto descriptor = describe(image);
    if (!descriptor) {
        return RecompressStatus::Unsupported;
    }

    QPDFObjectHandle dict = image.getDict();
    if (is_true(dict.getKey("/ImageMask")) || dict.hasKey("/Decode") || dict.getKey("/Mask").isArray()) {
        return RecompressStatus::Unsupported;
    }
    if (has_bound_alpha(dict)) {
        Logger::log(LogLevel::Debug, object_label(image) + ": alpha is bound to the pixel data", "image_recompressor");
        return RecompressStatus::Unsupported;
    }

    const QPDFObjectHandle colour_space = dict.getKey("/ColorSpace");
    const int declared = colour_components(colour_space);
    const std::shared_ptr<Buffer> raw = image.getRawStreamData();

    RasterImage pixels;
    switch (descriptor->codec) {
        case ImageCodec::Dct:
        case ImageCodec::Flate:
        case ImageCodec::Raw: {
            if (declared == 0 || bits_per_component(dict) != 8) {
                return RecompressStatus::Unsupported;
            }
            if (descriptor->codec == ImageCodec::Dct && is_single_filter(dict.getKey("/Filter"))) {
                pixels = codec::decode_jpeg(as_span(raw));
                break;
            }
            if (descriptor->codec == ImageCodec::Dct && declared == 4) {
                // qpdf does not report the Adobe marker, so the CMYK inversion convention is unknown
                return RecompressStatus::Unsupported;
            }
            // lossless chains decode at specialized; a chain ending in /DCTDecode needs qpdf's own JPEG decoder
            const std::shared_ptr<Buffer> decoded = image.getStreamData(
                descriptor->codec == ImageCodec::Dct ? qpdf_dl_all : qpdf_dl_specialized);
            pixels.width = descriptor->width;
            pixels.height = descriptor->height;
            pixels.components = declared;
            if (decoded->getSize() < pixels.expected_size()) {
                Logger::log(LogLevel::Debug, object_label(image) + ": truncated pixel data", "image_recompressor");
                return RecompressStatus::Unsupported;
            }
            pixels.pixels = unpack_pixels(decoded, pixels.expected_size());
            break;
        }
        case ImageCodec::Jpx: {
            if (!colour_space.isNull() && declared == 0) {
                return RecompressStatus::Unsupported;
            }
            pixels = codec::decode_jpx(as_span(raw));
            break;
        }
        case ImageCodec::Other:
            return RecompressStatus::Unsupported;
    }

    if (declared != 0 && pixels.components != declared) {
        Logger::log(LogLevel::Debug,
                    object_label(image) + ": decoded component count does not match /ColorSpace",
                    "image_recompressor");
        return RecompressStatus::Unsupported;
    }

    const RasterImage resampled = codec::resample_area(pixels, decision.target_width, decision.target_height);

    const bool lossless = options.preserve_quality && descriptor->codec != ImageCodec::Dct &&
                          descriptor->codec != ImageCodec::Jpx;
    const std::string data = lossless ? deflate_pixels(resampled.pixels)
                                      : codec::encode_jpeg(resampled, jpeg_quality(options));

    if (data.size() >= raw->getSize()) {
        Logger::log(LogLevel::Debug,
                    object_label(image) + ": re-encoded data is not smaller (" + std::to_string(data.size()) +
                    " >= " + std::to_string(raw->getSize()) + "), keeping original",
                    "image_recompressor");
        return RecompressStatus::KeptOriginal;
    }

    image.replaceStreamData(data,
                            QPDFObjectHandle::newName(lossless ? "/FlateDecode" : "/DCTDecode"),
                            QPDFObjectHandle::newNull());
    dict.replaceKey("/Width", QPDFObjectHandle::newInteger(resampled.width));
    dict.replaceKey("/Height", QPDFObjectHandle::newInteger(resampled.height));
    dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));
    if (descriptor->codec == ImageCodec::Jpx) {
        if (colour_space.isNull()) {
            dict.replaceKey("/ColorSpace",
                            QPDFObjectHandle::newName(resampled.components == 1 ? "/DeviceGray" : "/DeviceRGB"));
        }
        // only meaningful under /JPXDecode, and zero by the check above
        dict.removeKey("/SMaskInData");
    }

    Logger::log(LogLevel::Debug,
                object_label(image) + ": " + std::to_string(descriptor->width) + "x" +
                std::to_string(descriptor->height) + " -> " + std::to_string(resampled.width) + "x" +
                std::to_string(resampled.height) + ", " + std::to_string(raw->getSize()) + " -> " +
                std::to_string(data.size()) + " bytes",
                "image_recompressor");
    return RecompressStatus::Replaced;
}

} // namespace pdfslim
