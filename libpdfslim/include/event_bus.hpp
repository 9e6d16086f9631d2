/**
 * @file event_bus.hpp
 * @brief Defines a small, thread-safe publish/subscribe event bus.
 */

#ifndef PDFSLIM_EVENT_BUS_HPP
#define PDFSLIM_EVENT_BUS_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace pdfslim {

    /**
     * @brief Type-indexed publish/subscribe bus.
     *
     * @details Hosts use the bus to decouple the code that drains a
     * CompressionJob from the code that presents it (progress bar, console
     * report, CSV report). Handlers are invoked outside the internal lock,
     * so a handler may publish further events.
     */
    class EventBus {
    public:
        EventBus() = default;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g. CompressionCompleteEvent).
         * @param handler Invoked with a const reference to every published Event.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            subscribers_[std::type_index(typeid(Event))].push_back(
                [handler = std::move(handler)](const void* e) {
                    handler(*static_cast<const Event*>(e));
                });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::vector<Callback> callbacks;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) {
                    return;
                }
                callbacks = it->second;
            }
            for (const auto& fn : callbacks) {
                fn(&event);
            }
        }

        template <typename Event>
        [[nodiscard]] std::size_t subscriber_count() {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            return it == subscribers_.end() ? 0 : it->second.size();
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::mutex mtx_;
    };

} // namespace pdfslim

#endif // PDFSLIM_EVENT_BUS_HPP
