/**
 * @file pipeline_stage.hpp
 * @brief Stages of the compression state machine and their result type.
 */

#ifndef PDFSLIM_PIPELINE_STAGE_HPP
#define PDFSLIM_PIPELINE_STAGE_HPP

#include "compression_errors.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace pdfslim {

/**
 * @brief Pipeline states in execution order.
 *
 * Load and Save are fatal; the four stages between them are isolated.
 */
enum class PipelineStage {
    Load,
    StripMetadata,
    OptimizeContentStreams,
    ProcessImages,
    OptimizeStructure,
    Save,
    Done
};

std::string_view to_string(PipelineStage stage) noexcept;

/**
 * @brief True for stages whose failure aborts the request.
 */
constexpr bool is_fatal_stage(const PipelineStage stage) noexcept {
    return stage == PipelineStage::Load || stage == PipelineStage::Save;
}

/**
 * @brief Outcome of one interior stage: success, or the error it recovered from.
 */
class StageResult {
public:
    static StageResult ok() { return StageResult{}; }

    static StageResult failure(const PipelineStage stage, std::string message) {
        StageResult r;
        r.error_ = StageError{stage, std::move(message)};
        return r;
    }

    [[nodiscard]] bool succeeded() const noexcept { return !error_.has_value(); }
    [[nodiscard]] const std::optional<StageError>& error() const noexcept { return error_; }

private:
    std::optional<StageError> error_;
};

} // namespace pdfslim

#endif // PDFSLIM_PIPELINE_STAGE_HPP
