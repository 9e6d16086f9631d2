#include "../../include/compression_pipeline.hpp"
#include "../../include/compression_errors.hpp"
#include "../../include/content_optimizer.hpp"
#include "../../include/document_graph.hpp"
#include "../../include/graph_pruner.hpp"
#include "../../include/image_policy.hpp"
#include "../../include/image_recompressor.hpp"
#include "../../include/logger.hpp"
#include "../../include/resource_walker.hpp"
#include "../../include/result_packager.hpp"
#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>
#include <utility>

namespace pdfslim {

namespace {

constexpr std::array<PipelineStage, 4> kInteriorStages = {
    PipelineStage::StripMetadata,
    PipelineStage::OptimizeContentStreams,
    PipelineStage::ProcessImages,
    PipelineStage::OptimizeStructure
};

const char* progress_message(const PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Load:                   return "Loading PDF document...";
        case PipelineStage::StripMetadata:          return "Removing unnecessary metadata...";
        case PipelineStage::OptimizeContentStreams: return "Optimizing content streams...";
        case PipelineStage::ProcessImages:          return "Processing images...";
        case PipelineStage::OptimizeStructure:      return "Removing unnecessary objects...";
        case PipelineStage::Save:                   return "Finalizing compressed document...";
        case PipelineStage::Done:                   return "Compression complete!";
    }
    return "";
}

} // namespace

namespace stages {

StageResult strip_metadata(DocumentGraph& graph, const CompressionOptions&, PipelineReport& report) {
    QPDFObjectHandle trailer = graph.trailer();
    if (pruning::strip_document_info(trailer)) {
        ++report.keys_removed;
    }
    if (auto catalog = graph.catalog()) {
        report.keys_removed += pruning::strip_catalog_metadata(*catalog);
    }
    for (auto& page : graph.pages()) {
        if (pruning::strip_page_thumbnail(page)) {
            ++report.keys_removed;
        }
    }
    return StageResult::ok();
}

StageResult optimize_content_streams(DocumentGraph& graph, const CompressionOptions& options, PipelineReport& report) {
    auto pages = graph.pages();
    for (auto& page : pages) {
        report.keys_removed += pruning::prune_page(page, options);
    }
    for (auto& resources : collect_resource_dictionaries(graph, pages)) {
        report.keys_removed += pruning::prune_resources(resources, options);
    }

    const int iterations = zopfli_iterations(options);
    if (iterations <= 0) {
        return StageResult::ok();
    }
    for (auto& stream : collect_content_streams(graph, pages)) {
        try {
            if (ContentOptimizer::reflate(stream, iterations)) {
                ++report.streams_reflated;
            }
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Debug,
                        "Skipping content stream " + stream.getObjGen().unparse(' ') + ": " + e.what(),
                        "pipeline");
        }
    }
    return StageResult::ok();
}

StageResult process_images(DocumentGraph& graph, const CompressionOptions& options, PipelineReport& report) {
    for (auto& image : collect_images(graph, graph.pages())) {
        ++report.images_seen;
        try {
            const auto descriptor = ImageRecompressor::describe(image);
            if (!descriptor) {
                ++report.images_unsupported;
                continue;
            }
            const ImageTransformDecision decision = decide_image_transform(*descriptor, options);
            switch (ImageRecompressor::recompress(image, decision, options)) {
                case RecompressStatus::Replaced:     ++report.images_resampled; break;
                case RecompressStatus::KeptOriginal: ++report.images_kept; break;
                case RecompressStatus::Unsupported:  ++report.images_unsupported; break;
            }
        } catch (const std::exception& e) {
            ++report.images_failed;
            Logger::log(LogLevel::Warning,
                        "Image " + image.getObjGen().unparse(' ') + " left unchanged: " + e.what(),
                        "pipeline");
        }
    }
    return StageResult::ok();
}

StageResult optimize_structure(DocumentGraph& graph, const CompressionOptions& options, PipelineReport& report) {
    auto catalog = graph.catalog();
    if (!catalog) {
        return StageResult::failure(PipelineStage::OptimizeStructure, "catalog is not resolvable");
    }
    report.keys_removed += pruning::strip_structure(*catalog, options);
    if (pruning::strip_embedded_files(*catalog)) {
        ++report.keys_removed;
    }
    return StageResult::ok();
}

} // namespace stages

CompressionPipeline::CompressionPipeline(const CompressionOptions options)
    : options_(options),
      stages_{
          {PipelineStage::StripMetadata, stages::strip_metadata},
          {PipelineStage::OptimizeContentStreams, stages::optimize_content_streams},
          {PipelineStage::ProcessImages, stages::process_images},
          {PipelineStage::OptimizeStructure, stages::optimize_structure}
      } {}

void CompressionPipeline::replace_stage(const PipelineStage stage, StageFunction body) {
    if (is_fatal_stage(stage) || stage == PipelineStage::Done) {
        throw std::invalid_argument("Stage " + std::string(to_string(stage)) + " cannot be replaced");
    }
    if (!body) {
        throw std::invalid_argument("Stage body must not be empty");
    }
    stages_[stage] = std::move(body);
}

int CompressionPipeline::progress_for(const PipelineStage stage) noexcept {
    switch (stage) {
        case PipelineStage::Load:                   return 5;
        case PipelineStage::StripMetadata:          return 15;
        case PipelineStage::OptimizeContentStreams: return 25;
        case PipelineStage::ProcessImages:          return 40;
        case PipelineStage::OptimizeStructure:      return 70;
        case PipelineStage::Save:                   return 85;
        case PipelineStage::Done:                   return 100;
    }
    return 0;
}

void CompressionPipeline::emit(const ProgressCallback& on_progress, const int percent, std::string message) {
    last_percent_ = std::max(last_percent_, percent);
    if (on_progress) {
        on_progress(ProgressUpdate{last_percent_, std::move(message)});
    }
}

StageResult CompressionPipeline::run_stage(const PipelineStage stage, DocumentGraph& graph) {
    try {
        return stages_.at(stage)(graph, options_, report_);
    } catch (const std::exception& e) {
        return StageResult::failure(stage, e.what());
    }
}

std::optional<CompressionOutcome> CompressionPipeline::run(const std::span<const unsigned char> document,
                                                           const ProgressCallback& on_progress,
                                                           const std::stop_token stop) {
    report_ = PipelineReport{};
    last_percent_ = 0;
    const std::uintmax_t original_size = document.size();

    emit(on_progress, progress_for(PipelineStage::Load), progress_message(PipelineStage::Load));
    std::optional<DocumentGraph> graph;
    try {
        graph.emplace(DocumentGraph::parse(document));
    } catch (const LoadError& e) {
        return package_failure(std::string("Failed to load PDF: ") + e.what());
    }
    if (stop.stop_requested()) {
        return std::nullopt;
    }
    emit(on_progress, 10, "Analyzing document structure...");

    for (const PipelineStage stage : kInteriorStages) {
        if (stop.stop_requested()) {
            return std::nullopt;
        }
        emit(on_progress, progress_for(stage), progress_message(stage));
        const StageResult result = run_stage(stage, *graph);
        if (!result.succeeded()) {
            const StageError& error = *result.error();
            Logger::log(LogLevel::Warning,
                        "Stage " + std::string(to_string(error.stage)) + " failed, continuing: " + error.message,
                        "pipeline");
            report_.stage_failures.push_back(error);
        }
    }

    if (stop.stop_requested()) {
        return std::nullopt;
    }
    emit(on_progress, progress_for(PipelineStage::Save), progress_message(PipelineStage::Save));
    std::vector<unsigned char> output;
    try {
        output = graph->serialize(SerializeOptions{true});
    } catch (const SaveError& e) {
        return package_failure(std::string("Failed to save PDF: ") + e.what());
    }
    graph.reset();

    if (stop.stop_requested()) {
        return std::nullopt;
    }

    Logger::log(LogLevel::Info,
                "Removed " + std::to_string(report_.keys_removed) + " entries, resampled " +
                std::to_string(report_.images_resampled) + "/" + std::to_string(report_.images_seen) +
                " images, re-deflated " + std::to_string(report_.streams_reflated) + " streams, " +
                std::to_string(report_.stage_failures.size()) + " stage failures",
                "pipeline");

    CompressionOutcome outcome = package_success(std::move(output), original_size);
    emit(on_progress, progress_for(PipelineStage::Done), progress_message(PipelineStage::Done));
    return outcome;
}

} // namespace pdfslim
