/**
 * @file event_bus.hpp
 * @brief Publish/subscribe channel between the engine and its consumers
 *
 * The orchestrator, upload manager, cache and network observer emit onto one
 * bus owned by the engine; subscribers never hold references to emitters.
 * Handlers for one event type run in subscription order, which keeps
 * notification order deterministic.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<SyncCompletedEvent>([](const SyncCompletedEvent& e) { ... });
 * bus.emit(SyncCompletedEvent{...});
 * bus.unsubscribe<SyncCompletedEvent>(id);
 */

#pragma once

#include <functional>
#include <memory>
#include <typeindex>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <shared_mutex>
#include <algorithm>
#include <exception>
#include <typeinfo>

#include <spdlog/spdlog.h>

namespace ofs::events {

/**
 * @brief Type-safe event bus
 *
 * Uses template metaprogramming to provide compile-time type safety
 * while supporting any event type at runtime.
 *
 * THREAD SAFETY:
 * - Multiple threads can emit events concurrently
 * - Multiple threads can subscribe concurrently
 * - Handlers are called synchronously in emitting thread
 * - A handler may subscribe or unsubscribe from inside a callback
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    // Components keep a reference to the bus, so it never moves
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * TEMPLATE PARAMETERS:
     * EventType - The event type to subscribe to (e.g., SyncStartedEvent)
     *
     * PARAMETERS:
     * handler - Function called when event is emitted
     *           Signature: void(const EventType&)
     *
     * RETURNS:
     * Subscription ID for unsubscribing later
     *
     * EXAMPLE:
     * auto id = bus.subscribe<UploadProgressEvent>([](const UploadProgressEvent& e) {
     *     spdlog::info("{}: {:.1f}%", e.task_id, e.progress);
     * });
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        // Get type index for this event type
        auto type_id = std::type_index(typeid(EventType));

        // Create handler wrapper
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        size_t handler_id = next_handler_id_++;

        // Store handler
        handlers_[type_id].push_back({handler_id, wrapper});

        return handler_id;
    }

    /**
     * @brief Unsubscribe a specific handler
     *
     * PARAMETERS:
     * handler_id - ID returned from subscribe()
     *
     * EXAMPLE:
     * size_t id = bus.subscribe<MyEvent>(...);
     * // Later...
     * bus.unsubscribe<MyEvent>(id);
     */
    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto it = handlers_.find(type_id);

        if (it != handlers_.end()) {
            auto& handler_list = it->second;
            handler_list.erase(
                std::remove_if(handler_list.begin(), handler_list.end(),
                    [handler_id](const auto& pair) {
                        return pair.first == handler_id;
                    }),
                handler_list.end()
            );
        }
    }

    /**
     * @brief Emit an event to all subscribers
     *
     * TEMPLATE PARAMETERS:
     * EventType - The event type (usually deduced from argument)
     *
     * PARAMETERS:
     * event - The event to emit
     *
     * HOW IT WORKS:
     * 1. Lock handlers for this event type
     * 2. Call each handler synchronously
     * 3. Handlers run in emitting thread
     *
     * EXCEPTION SAFETY:
     * A handler throwing std::exception is logged and the remaining
     * handlers still execute.
     *
     * EXAMPLE:
     * bus.emit(SyncStartedEvent{3});
     */
    template<typename EventType>
    void emit(const EventType& event) {
        // Get handlers (make a copy to avoid deadlock if handler subscribes)
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto type_id = std::type_index(typeid(EventType));
            auto it = handlers_.find(type_id);

            if (it == handlers_.end()) {
                return;  // No subscribers for this event
            }

            // Copy handler pointers
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        // Call handlers without holding lock
        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    /**
     * @brief Get number of subscribers for an event type
     */
    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto type_id = std::type_index(typeid(EventType));
        auto it = handlers_.find(type_id);
        return it != handlers_.end() ? it->second.size() : 0;
    }

    /**
     * @brief Total handlers across all event types
     */
    size_t total_subscribers() const {
        std::shared_lock lock(mutex_);
        size_t total = 0;
        for (const auto& [type, list] : handlers_) {
            total += list.size();
        }
        return total;
    }

    /**
     * @brief Remove all subscribers
     */
    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    // ════════════════════════════════════════════════════════
    // Type Erasure Implementation
    // ════════════════════════════════════════════════════════

    /**
     * @brief Base class for type-erased handlers
     */
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    /**
     * @brief Typed handler implementation
     */
    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            // Safe cast - we only store EventType* for EventType handlers
            const EventType* typed_event = static_cast<const EventType*>(event);
            func(*typed_event);
        }
    };

    // ════════════════════════════════════════════════════════
    // Member Variables
    // ════════════════════════════════════════════════════════

    // Map: event type -> list of (handler_id, handler)
    std::unordered_map<
        std::type_index,
        std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    // Thread safety
    mutable std::shared_mutex mutex_;

    // Handler ID counter
    size_t next_handler_id_ = 0;
};

} // namespace ofs::events
