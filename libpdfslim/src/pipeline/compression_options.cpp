#include "../../include/compression_options.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace pdfslim {

CompressionOptions make_options(const int quality, const CompressionLevel level, const bool preserve_quality) {
    if (quality < kMinQuality || quality > kMaxQuality) {
        throw std::invalid_argument("quality must be between 0 and 100, got " + std::to_string(quality));
    }
    return CompressionOptions{quality, level, preserve_quality};
}

std::optional<CompressionLevel> compression_level_from_string(const std::string_view name) {
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "low") return CompressionLevel::Low;
    if (lower == "medium") return CompressionLevel::Medium;
    if (lower == "high") return CompressionLevel::High;
    return std::nullopt;
}

std::string_view to_string(const CompressionLevel level) noexcept {
    switch (level) {
        case CompressionLevel::Low:    return "low";
        case CompressionLevel::Medium: return "medium";
        case CompressionLevel::High:   return "high";
    }
    return "";
}

int jpeg_quality(const CompressionOptions& options) noexcept {
    return std::clamp(options.quality, 5, 95);
}

int zopfli_iterations(const CompressionOptions& options) noexcept {
    return options.level == CompressionLevel::High ? 15 : 0;
}

} // namespace pdfslim
