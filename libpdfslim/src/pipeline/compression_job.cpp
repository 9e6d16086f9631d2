#include "../../include/compression_job.hpp"
#include "../../include/logger.hpp"
#include <string>
#include <type_traits>
#include <utility>

namespace pdfslim {

CompressionJob::CompressionJob(CompressionRequest request)
    : CompressionJob(std::move(request.document), CompressionPipeline(request.options)) {}

CompressionJob::CompressionJob(std::vector<unsigned char> document, CompressionPipeline pipeline)
    : document_(std::move(document)),
      pipeline_(std::move(pipeline)),
      worker_([this](const std::stop_token& stop) { work(stop); }) {}

// worker_ is declared last, so it is joined before the channel goes away
CompressionJob::~CompressionJob() = default;

void CompressionJob::work(const std::stop_token& stop) {
    try {
        auto outcome = pipeline_.run(
            document_,
            [this, &stop](const ProgressUpdate& update) {
                if (!stop.stop_requested()) {
                    channel_.push(update);
                }
            },
            stop);
        if (outcome && !stop.stop_requested()) {
            std::visit([this](auto&& terminal) { channel_.push(std::forward<decltype(terminal)>(terminal)); },
                       std::move(*outcome));
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Unhandled exception in compression worker: ") + e.what(),
                    "compression_job");
        if (!stop.stop_requested()) {
            channel_.push(CompressionFailure{std::string("Unexpected error: ") + e.what()});
        }
    }
    document_.clear();
    document_.shrink_to_fit();
    channel_.close();
}

std::optional<JobMessage> CompressionJob::next_message() {
    return channel_.pop();
}

CompressionOutcome CompressionJob::wait(const ProgressCallback& on_progress) {
    while (auto message = next_message()) {
        if (auto* progress = std::get_if<ProgressUpdate>(&*message)) {
            if (on_progress) {
                on_progress(*progress);
            }
            continue;
        }
        if (auto* result = std::get_if<CompressionResult>(&*message)) {
            return std::move(*result);
        }
        return std::get<CompressionFailure>(std::move(*message));
    }
    return CompressionFailure{"Compression was canceled"};
}

void CompressionJob::cancel() {
    if (worker_.request_stop()) {
        Logger::log(LogLevel::Debug, "Compression job cancelled", "compression_job");
    }
    channel_.close_and_discard();
}

bool CompressionJob::cancelled() const noexcept {
    return worker_.get_stop_token().stop_requested();
}

} // namespace pdfslim
