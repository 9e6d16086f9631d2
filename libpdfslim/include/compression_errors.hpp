/**
 * @file compression_errors.hpp
 * @brief Error taxonomy of the compression core.
 *
 * LoadError and SaveError are fatal and thrown by DocumentGraph; the
 * orchestrator turns them into the request's single failure message.
 * StageError is a value: interior stages report it and the pipeline
 * continues.
 */

#ifndef PDFSLIM_COMPRESSION_ERRORS_HPP
#define PDFSLIM_COMPRESSION_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace pdfslim {

enum class PipelineStage;

/**
 * @brief The input bytes do not parse into a usable graph, or the
 * document's encryption cannot be bypassed.
 */
class LoadError final : public std::runtime_error {
public:
    explicit LoadError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Serialization of the mutated graph failed.
 */
class SaveError final : public std::runtime_error {
public:
    explicit SaveError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Failure of one interior stage, recovered by the orchestrator.
 */
struct StageError {
    PipelineStage stage;
    std::string message;
};

} // namespace pdfslim

#endif // PDFSLIM_COMPRESSION_ERRORS_HPP
