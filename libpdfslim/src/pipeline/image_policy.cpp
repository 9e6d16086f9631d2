#include "../../include/image_policy.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace pdfslim {

namespace {

double base_factor(const CompressionOptions& options) noexcept {
    switch (options.level) {
        case CompressionLevel::Low:    return options.quality > 80 ? 1.0 : 0.9;
        case CompressionLevel::Medium: return options.quality > 60 ? 0.8 : 0.7;
        case CompressionLevel::High:   return options.quality > 40 ? 0.6 : 0.5;
    }
    return 1.0;
}

std::uint32_t scaled(const std::uint32_t dimension, const double factor) noexcept {
    const auto value = static_cast<std::uint32_t>(std::lround(static_cast<double>(dimension) * factor));
    return std::max<std::uint32_t>(1, value);
}

} // namespace

double scale_factor_for(const ImageDescriptor& image, const CompressionOptions& options) noexcept {
    double factor = base_factor(options);
    if (image.width > kLargeImageDimension || image.height > kLargeImageDimension) {
        factor *= 0.8;
    }
    if (options.level == CompressionLevel::High && options.quality < 30) {
        factor *= 0.7;
    }
    return factor;
}

ImageTransformDecision decide_image_transform(const ImageDescriptor& image,
                                              const CompressionOptions& options) noexcept {
    ImageTransformDecision decision;
    if (image.width < kMinImageDimension || image.height < kMinImageDimension) {
        return decision;
    }
    if (image.codec == ImageCodec::Other) {
        return decision;
    }
    // JPEG2000 is re-encoded at level high only
    if (image.codec == ImageCodec::Jpx && options.level != CompressionLevel::High) {
        return decision;
    }

    const double factor = scale_factor_for(image, options);
    if (factor >= 1.0) {
        return decision;
    }

    decision.action = ImageTransformDecision::Action::Resample;
    decision.scale_factor = factor;
    decision.target_width = scaled(image.width, factor);
    decision.target_height = scaled(image.height, factor);
    return decision;
}

namespace {

// lossless filters qpdf decodes at qpdf_dl_specialized
bool is_lossless_filter(const std::string& name) {
    return name == "/FlateDecode" || name == "/LZWDecode" || name == "/RunLengthDecode" ||
           name == "/ASCII85Decode" || name == "/ASCIIHexDecode";
}

} // namespace

ImageCodec classify_filter(QPDFObjectHandle filter) {
    if (filter.isNull()) return ImageCodec::Raw;
    if (filter.isName()) {
        filter = QPDFObjectHandle::newArray(std::vector<QPDFObjectHandle>{filter});
    }
    if (!filter.isArray()) return ImageCodec::Other;

    const int count = filter.getArrayNItems();
    if (count == 0) return ImageCodec::Raw;
    for (int i = 0; i < count; ++i) {
        if (!filter.getArrayItem(i).isName()) return ImageCodec::Other;
    }
    for (int i = 0; i + 1 < count; ++i) {
        if (!is_lossless_filter(filter.getArrayItem(i).getName())) return ImageCodec::Other;
    }

    const std::string last = filter.getArrayItem(count - 1).getName();
    if (is_lossless_filter(last)) return ImageCodec::Flate;
    if (last == "/DCTDecode") return ImageCodec::Dct;
    // openjpeg needs the bare codestream
    if (last == "/JPXDecode" && count == 1) return ImageCodec::Jpx;
    return ImageCodec::Other;
}

} // namespace pdfslim
