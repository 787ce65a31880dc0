/**
 * @file event_bus.hpp
 * @brief Type-safe broadcast bus for upload pipeline events
 *
 * The scheduler and the conflict negotiator publish immutable event
 * snapshots here; the upload manager, the logger component and any caller
 * subscribed through the manager receive them.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto sub = bus.subscribe<UploadProgressEvent>([](const UploadProgressEvent& e) { ... });
 * bus.emit(UploadProgressEvent{...});
 * // sub going out of scope unsubscribes
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
#include <utility>
#include <vector>

namespace rup::events {

class EventBus;

/**
 * @brief RAII handle for one or more handler registrations
 *
 * Must not outlive the bus it was obtained from.
 */
class Subscription {
public:
    Subscription() = default;
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : bus_(std::exchange(other.bus_, nullptr)),
          entries_(std::move(other.entries_)) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = std::exchange(other.bus_, nullptr);
            entries_ = std::move(other.entries_);
        }
        return *this;
    }

    /**
     * @brief Merge another subscription's registrations into this one
     */
    void merge(Subscription&& other);

    /**
     * @brief Unsubscribe everything now
     */
    void reset();

    [[nodiscard]] bool active() const noexcept { return bus_ != nullptr && !entries_.empty(); }

private:
    friend class EventBus;

    Subscription(EventBus* bus, std::type_index type, size_t id) : bus_(bus) {
        entries_.emplace_back(type, id);
    }

    EventBus* bus_ = nullptr;
    std::vector<std::pair<std::type_index, size_t>> entries_;
};

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - Any thread may emit or subscribe
 * - Handlers run synchronously on the emitting thread
 * - Handlers may subscribe/unsubscribe from inside a callback
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * @return Handle that unsubscribes on destruction
     */
    template<typename EventType>
    [[nodiscard]] Subscription subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        size_t handler_id = next_handler_id_++;
        handlers_[type_id].push_back({handler_id, wrapper});

        return Subscription(this, type_id, handler_id);
    }

    /**
     * @brief Remove one registration; unknown ids are ignored
     */
    void unsubscribe(std::type_index type_id, size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto it = handlers_.find(type_id);
        if (it == handlers_.end()) {
            return;
        }
        auto& handler_list = it->second;
        handler_list.erase(
            std::remove_if(handler_list.begin(), handler_list.end(),
                [handler_id](const auto& pair) {
                    return pair.first == handler_id;
                }),
            handler_list.end());
    }

    /**
     * @brief Deliver an event to every current subscriber of its type
     *
     * A throwing handler is logged and skipped; the remaining handlers
     * still run.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        // Copy handler pointers so callbacks can (un)subscribe without deadlock
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
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
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<
        std::type_index,
        std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

inline void Subscription::merge(Subscription&& other) {
    if (other.bus_ == nullptr) {
        return;
    }
    if (bus_ == nullptr) {
        bus_ = other.bus_;
    }
    entries_.insert(entries_.end(), other.entries_.begin(), other.entries_.end());
    other.entries_.clear();
    other.bus_ = nullptr;
}

inline void Subscription::reset() {
    if (bus_ != nullptr) {
        for (const auto& [type, id] : entries_) {
            bus_->unsubscribe(type, id);
        }
    }
    entries_.clear();
    bus_ = nullptr;
}

} // namespace rup::events
