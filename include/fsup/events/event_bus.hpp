/**
 * @file event_bus.hpp
 * @brief Type-safe event bus between the upload pipeline and its observers
 *
 * WHY THIS FILE EXISTS:
 * The pipeline reports what it is doing (directory created, chunk written,
 * upload failed) without knowing who logs it or counts it. Observers such as
 * LoggerComponent and MetricsComponent subscribe here.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<ChunkWrittenEvent>([](const ChunkWrittenEvent& e) { ... });
 * bus.emit(ChunkWrittenEvent{...});
 * bus.unsubscribe<ChunkWrittenEvent>(id);
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

namespace fsup::events {

/**
 * @brief Synchronous publish/subscribe hub keyed by event type
 *
 * THREAD SAFETY:
 * - subscribe/unsubscribe/emit may be called from any thread
 * - Handlers run synchronously on the emitting thread
 * - The handler list is copied before dispatch, so a handler may
 *   subscribe or unsubscribe without deadlocking
 *
 * A handler that throws is logged and skipped; the remaining handlers and
 * the emitter are unaffected.
 */
class EventBus {
public:
    using HandlerId = std::size_t;

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
    void unsubscribe(HandlerId id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const auto& entry) { return entry.first == id; }),
                   list.end());
    }

    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<HandlerBase>> targets;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                targets.push_back(handler);
            }
        }

        for (auto& handler : targets) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            } catch (...) {
                spdlog::error("Event handler for {} threw an unknown exception", typeid(EventType).name());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
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

    std::unordered_map<std::type_index,
                       std::vector<std::pair<HandlerId, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    HandlerId next_handler_id_ = 0;
};

} // namespace fsup::events
