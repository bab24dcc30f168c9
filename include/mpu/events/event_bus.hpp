/**
 * @file event_bus.hpp
 * @brief Type-safe event bus for upload lifecycle notifications
 *
 * WHY THIS FILE EXISTS:
 * The orchestrator reports what it does (transfer started, part stored,
 * retry scheduled, transfer finished) without knowing who listens. Logging
 * and metrics subscribe here instead of being wired into the upload loop.
 *
 * Listeners usually live shorter than the bus (a metrics object per test, a
 * logger per run), so subscriptions can be held as a scoped Subscription that
 * detaches its handler when the listener goes away.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto sub = bus.subscribe_scoped<PartUploadedEvent>([](const PartUploadedEvent& e) { ... });
 * bus.emit(PartUploadedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mpu::events {

class EventBus;

/**
 * @brief Owning handle for one handler registration
 *
 * Unsubscribes on destruction. Move-only; a moved-from or released handle
 * does nothing. The bus must outlive every attached Subscription.
 */
class Subscription {
public:
    Subscription() = default;
    Subscription(EventBus& bus, std::size_t id) : bus_(&bus), id_(id) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : bus_(std::exchange(other.bus_, nullptr)), id_(other.id_) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = std::exchange(other.bus_, nullptr);
            id_ = other.id_;
        }
        return *this;
    }

    [[nodiscard]] bool attached() const noexcept { return bus_ != nullptr; }
    [[nodiscard]] std::size_t id() const noexcept { return id_; }

    /// Keep the handler registered past this handle's lifetime
    std::size_t release() noexcept {
        bus_ = nullptr;
        return id_;
    }

    inline void reset();

private:
    EventBus* bus_ = nullptr;
    std::size_t id_ = 0;
};

/**
 * @brief Type-safe event bus
 *
 * Handler ids are unique across event types, so unsubscribe needs only the
 * id.
 *
 * THREAD SAFETY:
 * - Part tasks on worker threads emit concurrently with the driving thread
 * - Handlers are called synchronously in the emitting thread
 * - Handlers are invoked on a copy of the handler list, so a handler may
 *   subscribe or unsubscribe without deadlocking
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for EventType
     *
     * RETURNS:
     * Id for unsubscribe(); the handler stays until then
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const std::size_t id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].push_back(
            {id, std::make_shared<HandlerImpl<EventType>>(std::move(handler))});
        return id;
    }

    /**
     * @brief Register a handler that lives as long as the returned handle
     */
    template<typename EventType>
    [[nodiscard]] Subscription subscribe_scoped(std::function<void(const EventType&)> handler) {
        return Subscription(*this, subscribe<EventType>(std::move(handler)));
    }

    /**
     * @return false if no handler with this id is registered
     */
    bool unsubscribe(std::size_t handler_id) {
        std::unique_lock lock(mutex_);
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
            auto& list = it->second;
            auto found = std::find_if(list.begin(), list.end(),
                [handler_id](const Entry& entry) { return entry.id == handler_id; });
            if (found != list.end()) {
                list.erase(found);
                if (list.empty()) {
                    handlers_.erase(it);
                }
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Deliver an event to every handler registered for its type
     *
     * EXCEPTION SAFETY:
     * A handler that throws is logged and counted in handler_failures();
     * remaining handlers still run and the emitter is not affected.
     *
     * RETURNS:
     * Number of handlers that ran without throwing
     */
    template<typename EventType>
    std::size_t emit(const EventType& event) {
        std::vector<std::shared_ptr<HandlerBase>> targets;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return 0;
            }
            targets.reserve(it->second.size());
            for (const auto& entry : it->second) {
                targets.push_back(entry.handler);
            }
        }

        std::size_t delivered = 0;
        for (auto& handler : targets) {
            try {
                handler->call(&event);
                ++delivered;
            } catch (const std::exception& e) {
                handler_failures_.fetch_add(1, std::memory_order_relaxed);
                spdlog::error("Event handler for {} failed: {}", typeid(EventType).name(), e.what());
            }
        }
        return delivered;
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    /// Handlers that threw since construction
    std::uint64_t handler_failures() const noexcept {
        return handler_failures_.load(std::memory_order_relaxed);
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            // Only EventType handlers are stored under typeid(EventType)
            func(*static_cast<const EventType*>(event));
        }
    };

    struct Entry {
        std::size_t id;
        std::shared_ptr<HandlerBase> handler;
    };

    std::unordered_map<std::type_index, std::vector<Entry>> handlers_;
    mutable std::shared_mutex mutex_;
    std::size_t next_handler_id_ = 0;
    std::atomic<std::uint64_t> handler_failures_{0};
};

inline void Subscription::reset() {
    if (bus_ != nullptr) {
        bus_->unsubscribe(id_);
        bus_ = nullptr;
    }
}

} // namespace mpu::events
