/**
 * @file message_channel.hpp
 * @brief Blocking single-producer/single-consumer message queue.
 */

#ifndef PDFSLIM_MESSAGE_CHANNEL_HPP
#define PDFSLIM_MESSAGE_CHANNEL_HPP

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace pdfslim {

/**
 * @brief FIFO hand-off between a worker thread and its caller.
 *
 * @details Once closed, push() drops its argument and pop() drains what
 * is left before reporting the end of the stream.
 */
template <typename T>
class MessageChannel {
public:
    MessageChannel() = default;
    MessageChannel(const MessageChannel&) = delete;
    MessageChannel& operator=(const MessageChannel&) = delete;

    /**
     * @brief Enqueues @p value.
     * @return false if the channel is closed and the value was dropped.
     */
    bool push(T value) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return false;
            queue_.push(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Blocks until a message is available or the channel is closed and empty.
     * @return The next message, or std::nullopt at the end of the stream.
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

    /**
     * @brief Ends the stream; queued messages stay readable.
     */
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /**
     * @brief Ends the stream and drops every queued message.
     */
    void close_and_discard() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
            std::queue<T>().swap(queue_);
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<T> queue_;
    bool closed_{false};
};

} // namespace pdfslim

#endif // PDFSLIM_MESSAGE_CHANNEL_HPP
