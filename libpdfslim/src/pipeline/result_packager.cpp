#include "../../include/result_packager.hpp"
#include "../../include/logger.hpp"
#include <utility>

namespace pdfslim {

double compute_ratio(const std::uintmax_t original_size, const std::uintmax_t output_size) noexcept {
    if (original_size == 0) {
        return 0.0;
    }
    return (static_cast<double>(original_size) - static_cast<double>(output_size)) /
           static_cast<double>(original_size);
}

CompressionOutcome package_success(std::vector<unsigned char> output, const std::uintmax_t original_size) {
    CompressionResult result;
    result.original_size = original_size;
    result.output_size = output.size();
    result.ratio = compute_ratio(original_size, result.output_size);
    result.output = std::move(output);
    return result;
}

CompressionOutcome package_failure(std::string message) {
    Logger::log(LogLevel::Error, message, "result_packager");
    return CompressionFailure{std::move(message)};
}

} // namespace pdfslim
