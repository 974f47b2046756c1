/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe channel between the engine and its observers
 *
 * The sync engine publishes status and activity events here without knowing
 * who renders them; the client and the tests subscribe to what they need.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<StatusEvent>([](const StatusEvent& e) { ... });
 * bus.emit(StatusEvent{StatusLevel::Ok, "sync complete"});
 * bus.unsubscribe<StatusEvent>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace tsync::events {

using SubscriptionId = std::size_t;

/**
 * @brief Event bus keyed by event type
 *
 * THREAD SAFETY:
 * - emit, subscribe and unsubscribe may be called from any thread
 * - Handlers run synchronously on the emitting thread after the lock is
 *   released, so a handler may subscribe or emit in turn
 * - A handler removed while an emit is in progress may still see that event
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        // Erase the event type behind a void pointer; emit<EventType> is the
        // only caller and always passes an EventType.
        auto erased = std::make_shared<Erased>(
            [fn = std::move(handler)](const void* event) { fn(*static_cast<const EventType*>(event)); });

        std::unique_lock lock(mutex_);
        const SubscriptionId id = ++last_id_;
        channels_[key<EventType>()].push_back(Entry{id, std::move(erased)});
        return id;
    }

    /// Unknown ids are ignored
    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto channel = channels_.find(key<EventType>());
        if (channel == channels_.end()) {
            return;
        }

        auto& entries = channel->second;
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            if (it->id == id) {
                entries.erase(it);
                break;
            }
        }
        if (entries.empty()) {
            channels_.erase(channel);
        }
    }

    /**
     * @brief Deliver an event to every current subscriber of its type
     *
     * A handler that throws is logged and skipped; the rest still run and
     * the emitter never sees the exception.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        const auto targets = snapshot(key<EventType>());
        for (const auto& target : targets) {
            try {
                (*target)(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto channel = channels_.find(key<EventType>());
        return channel == channels_.end() ? 0 : channel->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        channels_.clear();
    }

private:
    using Erased = std::function<void(const void*)>;

    struct Entry {
        SubscriptionId id;
        std::shared_ptr<Erased> handler;
    };

    template<typename EventType>
    static std::type_index key() {
        return std::type_index(typeid(EventType));
    }

    std::vector<std::shared_ptr<Erased>> snapshot(std::type_index type) const {
        std::shared_lock lock(mutex_);
        std::vector<std::shared_ptr<Erased>> targets;
        auto channel = channels_.find(type);
        if (channel != channels_.end()) {
            targets.reserve(channel->second.size());
            for (const auto& entry : channel->second) {
                targets.push_back(entry.handler);
            }
        }
        return targets;
    }

    std::unordered_map<std::type_index, std::vector<Entry>> channels_;
    mutable std::shared_mutex mutex_;
    SubscriptionId last_id_ = 0;
};

} // namespace tsync::events
