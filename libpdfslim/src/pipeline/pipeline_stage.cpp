#include "../../include/pipeline_stage.hpp"

namespace pdfslim {

std::string_view to_string(const PipelineStage stage) noexcept {
    switch (stage) {
        case PipelineStage::Load:                   return "Load";
        case PipelineStage::StripMetadata:          return "StripMetadata";
        case PipelineStage::OptimizeContentStreams: return "OptimizeContentStreams";
        case PipelineStage::ProcessImages:          return "ProcessImages";
        case PipelineStage::OptimizeStructure:      return "OptimizeStructure";
        case PipelineStage::Save:                   return "Save";
        case PipelineStage::Done:                   return "Done";
    }
    return "Unknown";
}

} // namespace pdfslim
