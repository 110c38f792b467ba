#pragma once

#include "huddle/core/event_bus.hpp"
#include "huddle/core/events.hpp"
#include <memory>
#include <string>
#include <vector>

namespace huddle::core {

// Logs every domain and lifecycle event published on the bus
class EventLogger {
public:
    explicit EventLogger(std::shared_ptr<EventBus> bus);
    ~EventLogger();

    EventLogger(const EventLogger&) = delete;
    EventLogger& operator=(const EventLogger&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool is_running() const { return m_running; }

private:
    std::shared_ptr<EventBus> m_event_bus;
    std::vector<EventBus::HandlerId> m_subscriptions;
    bool m_running{false};

    template<typename EventType, typename Handler>
    void subscribe_to(Handler handler);

    void log_configuration_event(const events::ConfigurationUpdated& event);
    void log_configuration_error(const events::ConfigurationError& event);
    void log_presence_changed(const events::PresenceChanged& event);
    void log_participant_joined(const events::VoiceParticipantJoined& event);
    void log_participant_left(const events::VoiceParticipantLeft& event);
    void log_mute_changed(const events::VoiceMuteChanged& event);
    void log_deafen_changed(const events::VoiceDeafenChanged& event);
    void log_signal_forwarded(const events::SignalForwarded& event);
    void log_application_state(const events::ApplicationStateChanged& event);
    void log_application_starting(const events::ApplicationStarting& event);
    void log_application_ready(const events::ApplicationReady& event);
    void log_application_shutting_down(const events::ApplicationShuttingDown& event);
    void log_service_error(const events::ServiceError& event);
};

}
