/**
 * @file event_bus.hpp
 * @brief Type-keyed publish/subscribe for observability events
 *
 * WHY THIS FILE EXISTS:
 * Sync sessions report peer churn, convergence and lookup misses without
 * knowing who listens. Loggers, metrics and status displays subscribe
 * without knowing which session emits.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<SessionConvergedEvent>([](const SessionConvergedEvent& e) { ... });
 * bus.emit(SessionConvergedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace docsync::events {

using HandlerId = std::size_t;

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - emit() may run concurrently from every session worker
 * - Handlers run synchronously on the emitting thread, outside the lock,
 *   so a handler may subscribe or emit without deadlocking
 * - A handler that throws is logged; the remaining handlers still run
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const HandlerId id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].push_back(
            {id, std::make_shared<HandlerImpl<EventType>>(std::move(handler))});
        return id;
    }

    template<typename EventType>
    bool unsubscribe(HandlerId handler_id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return false;
        }
        auto& list = it->second;
        const auto before = list.size();
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [handler_id](const auto& entry) { return entry.first == handler_id; }),
                   list.end());
        return list.size() != before;
    }

    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<HandlerBase>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            snapshot.reserve(it->second.size());
            for (const auto& entry : it->second) {
                snapshot.push_back(entry.second);
            }
        }

        for (auto& handler : snapshot) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
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

        explicit HandlerImpl(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<std::type_index, std::vector<std::pair<HandlerId, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    HandlerId next_handler_id_ = 0;
};

} // namespace docsync::events
