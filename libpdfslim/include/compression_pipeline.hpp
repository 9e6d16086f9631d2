/**
 * @file compression_pipeline.hpp
 * @brief Runs one compression request through the ordered stage sequence.
 */

#ifndef PDFSLIM_COMPRESSION_PIPELINE_HPP
#define PDFSLIM_COMPRESSION_PIPELINE_HPP

#include "compression_options.hpp"
#include "compression_types.hpp"
#include "pipeline_stage.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace pdfslim {

class DocumentGraph;

/**
 * @brief Work counters of one run.
 */
struct PipelineReport {
    std::size_t keys_removed = 0;
    std::size_t streams_reflated = 0;
    std::size_t images_seen = 0;
    std::size_t images_resampled = 0;
    std::size_t images_kept = 0;
    std::size_t images_unsupported = 0;
    std::size_t images_failed = 0;
    std::vector<StageError> stage_failures;
};

/**
 * @brief Orchestrator of a single request.
 *
 * @details Stages run in the order
 * Load, StripMetadata, OptimizeContentStreams, ProcessImages,
 * OptimizeStructure, Save, Done. Load and Save failures end the request
 * with a CompressionFailure. The four interior stages are isolated: a
 * failing stage is logged and the next one runs on whatever state the
 * graph was left in.
 *
 * The pipeline owns its DocumentGraph for the duration of run() and
 * destroys it before returning.
 */
class CompressionPipeline {
public:
    /**
     * @brief Body of an interior stage.
     *
     * May throw; the exception is turned into a StageError at the stage
     * boundary.
     */
    using StageFunction = std::function<StageResult(DocumentGraph&, const CompressionOptions&, PipelineReport&)>;

    explicit CompressionPipeline(CompressionOptions options);

    /**
     * @brief Substitutes the body of an interior stage.
     * @throws std::invalid_argument for Load, Save and Done.
     */
    void replace_stage(PipelineStage stage, StageFunction body);

    /**
     * @brief Compresses @p document.
     *
     * @param document Input PDF bytes.
     * @param on_progress Receives every progress message, in order; may be empty.
     * @param stop Checked between stages.
     * @return The terminal outcome, or std::nullopt if a stop was requested
     * before it was produced.
     */
    std::optional<CompressionOutcome> run(std::span<const unsigned char> document,
                                          const ProgressCallback& on_progress = {},
                                          std::stop_token stop = {});

    [[nodiscard]] const PipelineReport& report() const noexcept { return report_; }
    [[nodiscard]] const CompressionOptions& options() const noexcept { return options_; }

    /**
     * @brief Progress percentage emitted on entry to @p stage.
     */
    static int progress_for(PipelineStage stage) noexcept;

private:
    StageResult run_stage(PipelineStage stage, DocumentGraph& graph);
    void emit(const ProgressCallback& on_progress, int percent, std::string message);

    CompressionOptions options_;
    std::map<PipelineStage, StageFunction> stages_;
    PipelineReport report_;
    int last_percent_ = 0;
};

/**
 * @brief Default bodies of the interior stages.
 */
namespace stages {

StageResult strip_metadata(DocumentGraph& graph, const CompressionOptions& options, PipelineReport& report);
StageResult optimize_content_streams(DocumentGraph& graph, const CompressionOptions& options, PipelineReport& report);
StageResult process_images(DocumentGraph& graph, const CompressionOptions& options, PipelineReport& report);
StageResult optimize_structure(DocumentGraph& graph, const CompressionOptions& options, PipelineReport& report);

} // namespace stages

} // namespace pdfslim

#endif // PDFSLIM_COMPRESSION_PIPELINE_HPP
