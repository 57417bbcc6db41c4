/**
 * @file event_bus.hpp
 * @brief Type-safe event bus for decoupled component communication
 *
 * WHY THIS FILE EXISTS:
 * The sync manager reports what happens to a session without knowing who
 * listens. Logging, metrics and tests subscribe to the events they care
 * about without knowing who emits them.
 *
 * WHAT IT DOES:
 * - Type-safe event subscription and emission
 * - Thread-safe concurrent access
 * - Handler registration and unregistration
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<SyncCompletedEvent>([](const SyncCompletedEvent& e) { ... });
 * bus.emit(SyncCompletedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace fullsync::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - Multiple threads can emit and subscribe concurrently
 * - Handlers are called synchronously in the emitting thread, which for
 *   session events is a sync worker
 */
class EventBus {
public:
    using SubscriptionId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * RETURNS:
     * Subscription ID for unsubscribing later
     */
    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        auto slot = std::make_shared<TypedSlot<EventType>>(std::move(handler));

        std::unique_lock lock(mutex_);
        const SubscriptionId id = next_id_++;
        slots_[key_of<EventType>()].push_back(Subscriber{id, std::move(slot)});
        return id;
    }

    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto it = slots_.find(key_of<EventType>());
        if (it == slots_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const Subscriber& s) { return s.id == id; }),
                   list.end());
        if (list.empty()) {
            slots_.erase(it);
        }
    }

    /**
     * @brief Emit an event to all subscribers
     *
     * EXCEPTION SAFETY:
     * A handler that throws is logged and skipped; the remaining handlers
     * still run and the emitter never sees the exception.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        // Snapshot under the lock so handlers may subscribe while running
        std::vector<std::shared_ptr<Slot>> targets;
        {
            std::shared_lock lock(mutex_);
            auto it = slots_.find(key_of<EventType>());
            if (it == slots_.end()) {
                return;
            }
            targets.reserve(it->second.size());
            for (const auto& subscriber : it->second) {
                targets.push_back(subscriber.slot);
            }
        }

        for (const auto& slot : targets) {
            try {
                slot->invoke(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = slots_.find(key_of<EventType>());
        return it == slots_.end() ? 0 : it->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

private:
    struct Slot {
        virtual ~Slot() = default;
        virtual void invoke(const void* event) const = 0;
    };

    template<typename EventType>
    struct TypedSlot final : Slot {
        explicit TypedSlot(std::function<void(const EventType&)> fn) : handler(std::move(fn)) {}

        void invoke(const void* event) const override {
            handler(*static_cast<const EventType*>(event));
        }

        std::function<void(const EventType&)> handler;
    };

    struct Subscriber {
        SubscriptionId id;
        std::shared_ptr<Slot> slot;
    };

    template<typename EventType>
    static std::type_index key_of() {
        return std::type_index(typeid(EventType));
    }

    std::unordered_map<std::type_index, std::vector<Subscriber>> slots_;
    mutable std::shared_mutex mutex_;
    SubscriptionId next_id_ = 0;
};

} // namespace fullsync::events
