#include "huddle/core/event_bus.hpp"
#include "huddle/utils/logger.hpp"

namespace huddle::core {

void EventBus::handle_exception(const std::string& event_type, const std::exception& e) {
    HUDDLE_LOG_ERROR("EventBus", "Exception in event handler for " + event_type + ": " + e.what());
}

namespace {

// Clears the draining flag if a delivery unwinds with a non-std exception
class DrainGuard {
public:
    DrainGuard(std::mutex& mutex, bool& draining) : m_mutex(mutex), m_draining(draining) {}
    ~DrainGuard() {
        if (m_armed) {
            std::lock_guard lock(m_mutex);
            m_draining = false;
        }
    }
    void release() { m_armed = false; }

private:
    std::mutex& m_mutex;
    bool& m_draining;
    bool m_armed = true;
};

}

void OrderedPublisher::drain() {
    {
        std::lock_guard lock(m_mutex);
        if (m_draining || m_pending.empty()) {
            return;
        }
        m_draining = true;
    }

    DrainGuard guard(m_mutex, m_draining);
    for (;;) {
        Delivery next;
        {
            std::lock_guard lock(m_mutex);
            if (m_pending.empty()) {
                m_draining = false;
                guard.release();
                return;
            }
            next = std::move(m_pending.front());
            m_pending.pop_front();
        }

        if (m_bus) {
            next(*m_bus);
        }
    }
}

void OrderedPublisher::discard() {
    std::lock_guard lock(m_mutex);
    if (!m_pending.empty()) {
        HUDDLE_LOG_DEBUG("EventBus", "Discarding " + std::to_string(m_pending.size()) + " undelivered events");
    }
    m_pending.clear();
}

}
