#include "../../include/size_estimator.hpp"
#include <cmath>

namespace pdfslim {

std::uintmax_t estimate_compressed_size(const std::uintmax_t original_size, const CompressionOptions& options) noexcept {
    double factor = 0.65;
    switch (options.level) {
        case CompressionLevel::Low:    factor = 0.85; break;
        case CompressionLevel::Medium: factor = 0.65; break;
        case CompressionLevel::High:   factor = options.preserve_quality ? 0.5 : 0.3; break;
    }
    const double quality_factor = 1.0 - (100.0 - options.quality) / 200.0;
    return static_cast<std::uintmax_t>(std::floor(static_cast<double>(original_size) * factor * quality_factor));
}

} // namespace pdfslim
