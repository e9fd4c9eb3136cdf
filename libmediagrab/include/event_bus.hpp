/**
 * @file event_bus.hpp
 * @brief Defines the publish/subscribe bus carrying routing progress.
 */

#ifndef MEDIAGRAB_EVENT_BUS_HPP
#define MEDIAGRAB_EVENT_BUS_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace mediagrab {

/**
 * @brief Type-indexed publish/subscribe bus.
 *
 * @details The orchestrator reports routing progress here without knowing
 * who is listening; the facade forwards the events to a GrabObserver and
 * tests subscribe directly.
 *
 * Handlers are invoked on the publishing thread, outside the internal
 * lock, on a snapshot of the subscriber list taken at publish time. A
 * handler may therefore subscribe or unsubscribe; the change applies to
 * the next publish.
 */
class EventBus {
public:
    ///< Handle returned by subscribe(), accepted by unsubscribe().
    using SubscriptionId = std::uint64_t;

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register @p handler for events of type @p Event.
     * @return Id to pass to unsubscribe().
     */
    template <typename Event>
    SubscriptionId subscribe(std::function<void(const Event&)> handler) {
        auto erased = std::make_shared<const Callback>([handler = std::move(handler)](const void* e) {
            handler(*static_cast<const Event*>(e));
        });
        std::lock_guard lock(mtx_);
        const SubscriptionId id = ++last_id_;
        subscribers_[std::type_index(typeid(Event))].push_back({id, std::move(erased)});
        return id;
    }

    /// Removes a handler; unknown ids are ignored.
    void unsubscribe(const SubscriptionId id) {
        std::lock_guard lock(mtx_);
        for (auto& [type, entries] : subscribers_) {
            std::erase_if(entries, [id](const Entry& entry) { return entry.id == id; });
        }
    }

    /**
     * @brief Deliver @p event to every handler subscribed to its type.
     */
    template <typename Event>
    void publish(const Event& event) const {
        std::vector<std::shared_ptr<const Callback>> snapshot;
        {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            if (it == subscribers_.end()) return;
            snapshot.reserve(it->second.size());
            for (const auto& entry : it->second) snapshot.push_back(entry.callback);
        }
        for (const auto& fn : snapshot) {
            (*fn)(&event);
        }
    }

    template <typename Event>
    [[nodiscard]] std::size_t subscriber_count() const {
        std::lock_guard lock(mtx_);
        const auto it = subscribers_.find(std::type_index(typeid(Event)));
        return it == subscribers_.end() ? 0 : it->second.size();
    }

private:
    using Callback = std::function<void(const void*)>;

    struct Entry {
        SubscriptionId id;
        std::shared_ptr<const Callback> callback;
    };

    std::unordered_map<std::type_index, std::vector<Entry>> subscribers_;
    SubscriptionId last_id_ = 0;
    mutable std::mutex mtx_;
};

} // namespace mediagrab

#endif // MEDIAGRAB_EVENT_BUS_HPP
