/**
 * @file compression_job.hpp
 * @brief One compression request running on its own worker thread.
 */

#ifndef PDFSLIM_COMPRESSION_JOB_HPP
#define PDFSLIM_COMPRESSION_JOB_HPP

#include "compression_pipeline.hpp"
#include "compression_types.hpp"
#include "message_channel.hpp"
#include <optional>
#include <thread>
#include <variant>

namespace pdfslim {

/// Worker-to-caller message: any number of progress updates, then one terminal outcome.
using JobMessage = std::variant<ProgressUpdate, CompressionResult, CompressionFailure>;

/**
 * @brief Owns a std::jthread that runs one CompressionPipeline.
 *
 * @details The worker and its owner share nothing but the message
 * channel. Jobs are independent of each other and can run concurrently.
 * Destroying a job cancels it and joins the worker.
 */
class CompressionJob {
public:
    /**
     * @brief Starts compressing @p request immediately.
     */
    explicit CompressionJob(CompressionRequest request);

    /**
     * @brief Starts compressing @p document with a preconfigured pipeline.
     *
     * The pipeline's options are used.
     */
    CompressionJob(std::vector<unsigned char> document, CompressionPipeline pipeline);

    ~CompressionJob();

    CompressionJob(const CompressionJob&) = delete;
    CompressionJob& operator=(const CompressionJob&) = delete;
    CompressionJob(CompressionJob&&) = delete;
    CompressionJob& operator=(CompressionJob&&) = delete;

    /**
     * @brief Blocks for the next message.
     * @return std::nullopt once the terminal message has been read, or
     * after cancel().
     */
    std::optional<JobMessage> next_message();

    /**
     * @brief Drains the channel until the terminal outcome.
     * @param on_progress Invoked for each progress update; may be empty.
     * @return The outcome; "Compression was canceled" if the job was
     * cancelled before producing one.
     */
    CompressionOutcome wait(const ProgressCallback& on_progress = {});

    /**
     * @brief Stops the job. No message is delivered afterwards.
     *
     * The worker notices the request between stages and unwinds, dropping
     * its document graph. Safe to call more than once and from any thread.
     */
    void cancel();

    [[nodiscard]] bool cancelled() const noexcept;

private:
    void work(const std::stop_token& stop);

    std::vector<unsigned char> document_;
    CompressionPipeline pipeline_;
    MessageChannel<JobMessage> channel_;
    std::jthread worker_;
};

} // namespace pdfslim

#endif // PDFSLIM_COMPRESSION_JOB_HPP
