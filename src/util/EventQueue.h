// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef EventQueue_h
#define EventQueue_h

#include <any>
#include <functional>
#include <typeindex>
#include <mutex>
#include <unordered_map>
#include <algorithm>
#include <vector>

#include "LogGlobals.hpp"

namespace lplay
{
    namespace internal
    {
        template <typename T>
        struct get_signature;

        template <typename R, typename Arg>
        struct get_signature<std::function<R(Arg)>>
        {
            using FunctionType = R(Arg);
            using ReturnType = R;
            using ArgType = Arg;
        };
    }

    /// @brief Typed event queue.
    /// Events may be enqueued from any thread. Callbacks are registered during
    /// single-threaded initialization and are read-only afterwards.
    class EventQueue
    {
        using CallbackType = std::function<void(const std::any&)>;

        std::unordered_map<std::type_index, std::vector<CallbackType>> callback_map;

        std::vector<std::any> events;
        mutable std::mutex events_mutex;

        void dispatch_event(const std::any& event_data) const
        {
            auto it = callback_map.find(std::type_index(event_data.type()));
            if (it == callback_map.end())
                return;
            for (const auto& callback : it->second)
                callback(event_data);
        }

    public:

        /// Enqueue an event (thread-safe)
        template<typename EventType>
        bool enqueue_event(EventType&& event) noexcept
        {
            try {
                std::lock_guard lk(events_mutex);
                events.emplace_back(
                    std::in_place_type<std::decay_t<EventType>>,
                    std::forward<EventType>(event)
                );
                return true;
            }
            catch (const std::exception&) {
                return false;
            }
        }

        /// Dispatch a single event immediately
        template<class EventType>
        void dispatch(const EventType& event)
        {
            dispatch_event(std::any(event));
        }

        /// Dispatch (and remove) only events of type EventType
        template<class EventType>
        void dispatch_event_type()
        {
            std::vector<std::any> work;
            {
                std::lock_guard lock(events_mutex);
                // [begin, it) is kept, [it, end) is dispatched
                auto it = std::stable_partition(
                    events.begin(), events.end(),
                    [](const std::any& e) { return e.type() != typeid(EventType); }
                );
                work.assign(std::make_move_iterator(it),
                    std::make_move_iterator(events.end()));
                events.erase(it, events.end());
            }
            for (auto& e : work)
                dispatch_event(e);
        }

        /// Dispatch and remove all pending events, in enqueue order
        void dispatch_all_events()
        {
            std::vector<std::any> work;
            {
                std::lock_guard lock(events_mutex);
                work.swap(events);
            }
            for (auto& e : work)
                dispatch_event(e);
        }

        bool has_pending_events() const
        {
            std::lock_guard lock(events_mutex);
            return !events.empty();
        }

        size_t pending_event_count() const
        {
            std::lock_guard lock(events_mutex);
            return events.size();
        }

        void clear()
        {
            std::lock_guard lock(events_mutex);
            events.clear();
        }

        /// Registers a callback for the event type taken by the callable.
        /// Must only be called during initialization.
        template<typename Callable>
        void register_callback(Callable&& callable)
        {
            using EventType = std::decay_t<typename internal::get_signature<decltype(std::function{ callable }) > ::ArgType > ;

            std::function<void(const EventType&)> callback{ std::forward<Callable>(callable) };

            auto wrapped_callback = [callback](const std::any& event_data) {
                if (auto casted = std::any_cast<EventType>(&event_data))
                    callback(*casted);
                else
                    LogGlobals::error("EventQueue: mismatched event type %s", event_data.type().name());
                };

            callback_map[typeid(EventType)].push_back(wrapped_callback);
        }
    };
}

#endif
