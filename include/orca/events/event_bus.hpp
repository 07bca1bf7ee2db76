/**
 * @file event_bus.hpp
 * @brief Type-safe in-process bus for internal signals
 *
 * WHY THIS FILE EXISTS:
 * The trigger engine, the dispatcher and the action executor announce what
 * they did (a firing, a dispatched action, an outcome, a registry edit)
 * without knowing who listens. Logging, metrics and window-state cleanup
 * subscribe here.
 *
 * This bus carries internal signals only (see signals.hpp). Events about
 * resources travel through the EventPipeline instead.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<FiringProduced>([](const FiringProduced& s) { ... });
 * bus.emit(FiringProduced{firing});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace orca::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - Multiple threads can emit concurrently
 * - Multiple threads can subscribe concurrently
 * - Handlers are called synchronously in the emitting thread
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    // Non-copyable (would duplicate handlers)
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to signals of a specific type
     *
     * RETURNS:
     * Subscription ID for unsubscribing later
     */
    template<typename SignalType>
    size_t subscribe(std::function<void(const SignalType&)> handler) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(SignalType));
        std::shared_ptr<HandlerBase> wrapper = std::make_shared<HandlerImpl<SignalType>>(std::move(handler));
        size_t handler_id = next_handler_id_++;

        slots_[type_id].push_back(Slot{handler_id, std::move(wrapper)});
        return handler_id;
    }

    template<typename SignalType>
    void unsubscribe(size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto it = slots_.find(std::type_index(typeid(SignalType)));
        if (it == slots_.end()) {
            return;
        }
        auto& slots = it->second;
        slots.erase(std::remove_if(slots.begin(), slots.end(),
                                   [handler_id](const Slot& slot) { return slot.id == handler_id; }),
                    slots.end());
        if (slots.empty()) {
            slots_.erase(it);
        }
    }

    /**
     * @brief Emit a signal to all subscribers
     *
     * Handlers run outside the lock, so a handler may subscribe or emit.
     * A handler that throws is logged; the remaining handlers still run.
     */
    template<typename SignalType>
    void emit(const SignalType& signal) {
        std::vector<std::shared_ptr<HandlerBase>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = slots_.find(std::type_index(typeid(SignalType)));
            if (it == slots_.end()) {
                return;
            }
            snapshot.reserve(it->second.size());
            for (const auto& slot : it->second) {
                snapshot.push_back(slot.handler);
            }
        }

        for (auto& handler : snapshot) {
            try {
                handler->call(&signal);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(SignalType).name(), e.what());
            }
        }
    }

    template<typename SignalType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = slots_.find(std::type_index(typeid(SignalType)));
        return it != slots_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* signal) = 0;
    };

    template<typename SignalType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const SignalType&)> func;

        explicit HandlerImpl(std::function<void(const SignalType&)> f)
            : func(std::move(f)) {}

        void call(const void* signal) override {
            func(*static_cast<const SignalType*>(signal));
        }
    };

    struct Slot {
        size_t id;
        std::shared_ptr<HandlerBase> handler;
    };

    // signal type -> subscribers in subscription order
    std::unordered_map<std::type_index, std::vector<Slot>> slots_;

    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

} // namespace orca::events
