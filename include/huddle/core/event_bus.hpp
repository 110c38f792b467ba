#pragma once

#include <algorithm>
#include <any>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace huddle::core {

class EventBus {
public:
    using EventHandler = std::function<void(const std::any&)>;
    using HandlerId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        std::lock_guard lock(m_mutex);

        auto type_index = std::type_index(typeid(EventType));
        auto wrapped_handler = [handler = std::move(handler)](const std::any& event) {
            handler(*std::any_cast<const EventType*>(event));
        };

        HandlerId id = m_next_handler_id++;
        m_handlers[type_index].emplace_back(id, std::move(wrapped_handler));
        m_handler_types.emplace(id, type_index);

        return id;
    }

    // Handlers run on the publishing thread, outside the bus lock
    template<typename EventType>
    void publish(const EventType& event) {
        std::vector<EventHandler> handlers_copy;

        {
            std::lock_guard lock(m_mutex);
            auto it = m_handlers.find(std::type_index(typeid(EventType)));

            if (it != m_handlers.end()) {
                handlers_copy.reserve(it->second.size());
                for (const auto& [id, handler] : it->second) {
                    handlers_copy.push_back(handler);
                }
            }
        }

        const std::any erased = &event;
        for (const auto& handler : handlers_copy) {
            try {
                handler(erased);
            } catch (const std::exception& e) {
                handle_exception(typeid(EventType).name(), e);
            }
        }
    }

    void unsubscribe(HandlerId id) {
        std::lock_guard lock(m_mutex);

        auto type_it = m_handler_types.find(id);
        if (type_it == m_handler_types.end()) {
            return;
        }

        auto& handlers = m_handlers[type_it->second];
        handlers.erase(
            std::remove_if(handlers.begin(), handlers.end(),
                          [id](const auto& pair) { return pair.first == id; }),
            handlers.end()
        );

        m_handler_types.erase(type_it);
    }

    void clear() {
        std::lock_guard lock(m_mutex);
        m_handlers.clear();
        m_handler_types.clear();
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::lock_guard lock(m_mutex);
        auto it = m_handlers.find(std::type_index(typeid(EventType)));
        return it != m_handlers.end() ? it->second.size() : 0;
    }

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::type_index, std::vector<std::pair<HandlerId, EventHandler>>> m_handlers;
    std::unordered_map<HandlerId, std::type_index> m_handler_types;
    HandlerId m_next_handler_id{1};

    void handle_exception(const std::string& event_type, const std::exception& e);
};

/**
 * @brief FIFO hand-off between a registry's critical section and the bus
 *
 * push() is called while the registry lock is held, so queue order equals
 * the order in which transitions were committed. drain() is called after
 * the lock is released; only one thread delivers at a time and a drain
 * that finds another one in progress returns immediately, leaving its
 * events to the active drainer. Handlers may call back into the registry.
 */
class OrderedPublisher {
public:
    explicit OrderedPublisher(std::shared_ptr<EventBus> bus)
        : m_bus(std::move(bus)) {}

    OrderedPublisher(const OrderedPublisher&) = delete;
    OrderedPublisher& operator=(const OrderedPublisher&) = delete;

    template<typename EventType>
    void push(EventType event) {
        std::lock_guard lock(m_mutex);
        m_pending.emplace_back(
            [event = std::move(event)](EventBus& bus) { bus.publish(event); });
    }

    void drain();

    // Drops undelivered events (shutdown path)
    void discard();

    [[nodiscard]] std::size_t pending_count() const {
        std::lock_guard lock(m_mutex);
        return m_pending.size();
    }

private:
    using Delivery = std::function<void(EventBus&)>;

    std::shared_ptr<EventBus> m_bus;
    mutable std::mutex m_mutex;
    std::deque<Delivery> m_pending;
    bool m_draining = false;
};

}
