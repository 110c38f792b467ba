#include "huddle/core/event_logger.hpp"
#include "huddle/core/application.hpp"
#include "huddle/utils/logger.hpp"

namespace huddle::core {

EventLogger::EventLogger(std::shared_ptr<EventBus> bus)
    : m_event_bus(std::move(bus)) {}

EventLogger::~EventLogger() {
    stop();
}

template<typename EventType, typename Handler>
void EventLogger::subscribe_to(Handler handler) {
    m_subscriptions.push_back(
        m_event_bus->subscribe<EventType>(
            [this, handler](const EventType& e) { (this->*handler)(e); }));
}

void EventLogger::start() {
    if (m_running || !m_event_bus) return;

    subscribe_to<events::ConfigurationUpdated>(&EventLogger::log_configuration_event);
    subscribe_to<events::ConfigurationError>(&EventLogger::log_configuration_error);
    subscribe_to<events::PresenceChanged>(&EventLogger::log_presence_changed);
    subscribe_to<events::VoiceParticipantJoined>(&EventLogger::log_participant_joined);
    subscribe_to<events::VoiceParticipantLeft>(&EventLogger::log_participant_left);
    subscribe_to<events::VoiceMuteChanged>(&EventLogger::log_mute_changed);
    subscribe_to<events::VoiceDeafenChanged>(&EventLogger::log_deafen_changed);
    subscribe_to<events::SignalForwarded>(&EventLogger::log_signal_forwarded);
    subscribe_to<events::ApplicationStateChanged>(&EventLogger::log_application_state);
    subscribe_to<events::ApplicationStarting>(&EventLogger::log_application_starting);
    subscribe_to<events::ApplicationReady>(&EventLogger::log_application_ready);
    subscribe_to<events::ApplicationShuttingDown>(&EventLogger::log_application_shutting_down);
    subscribe_to<events::ServiceError>(&EventLogger::log_service_error);

    m_running = true;
    HUDDLE_LOG_DEBUG("EventLogger", "Event logger started");
}

void EventLogger::stop() {
    if (!m_running) return;

    for (auto id : m_subscriptions) {
        m_event_bus->unsubscribe(id);
    }
    m_subscriptions.clear();
    m_running = false;
    HUDDLE_LOG_DEBUG("EventLogger", "Event logger stopped");
}

void EventLogger::log_configuration_event(const events::ConfigurationUpdated& event) {
    (void)event;
    HUDDLE_LOG_INFO("EventLogger", "Configuration updated");
}

void EventLogger::log_configuration_error(const events::ConfigurationError& event) {
    HUDDLE_LOG_ERROR("EventLogger", "Configuration error: " + event.message);
}

// Transitions are already logged at Info by the engine
void EventLogger::log_presence_changed(const events::PresenceChanged& event) {
    HUDDLE_LOG_DEBUG("EventLogger", "Presence: " + event.user_id.value + " -> " +
                     std::string(to_string(event.status)) + (event.is_agent ? " (agent)" : ""));
}

void EventLogger::log_participant_joined(const events::VoiceParticipantJoined& event) {
    HUDDLE_LOG_DEBUG("EventLogger", "Voice join: " + event.participant.user_id.value + " in " + event.room_id.value);
}

void EventLogger::log_participant_left(const events::VoiceParticipantLeft& event) {
    HUDDLE_LOG_DEBUG("EventLogger", "Voice leave: " + event.user_id.value + " from " + event.room_id.value +
                     (event.room_closed ? " (room closed)" : ""));
}

void EventLogger::log_mute_changed(const events::VoiceMuteChanged& event) {
    HUDDLE_LOG_DEBUG("EventLogger", "Voice mute: " + event.user_id.value + " in " + event.room_id.value +
                     (event.muted ? " muted" : " unmuted"));
}

void EventLogger::log_deafen_changed(const events::VoiceDeafenChanged& event) {
    HUDDLE_LOG_DEBUG("EventLogger", "Voice deafen: " + event.user_id.value + " in " + event.room_id.value +
                     (event.deafened ? " deafened" : " undeafened"));
}

void EventLogger::log_signal_forwarded(const events::SignalForwarded& event) {
    HUDDLE_LOG_DEBUG("EventLogger", "Signal " + std::string(to_string(event.kind)) + ": " +
                     event.from_user_id.value + " -> " + event.to_user_id.value +
                     " (" + std::to_string(event.payload.size()) + " bytes)");
}

void EventLogger::log_application_state(const events::ApplicationStateChanged& event) {
    HUDDLE_LOG_INFO("EventLogger", "Application state changed: " + to_string(event.previous_state) +
                    " -> " + to_string(event.current_state));
}

void EventLogger::log_application_starting(const events::ApplicationStarting& event) {
    HUDDLE_LOG_INFO("EventLogger", "huddle v" + event.version + " starting");
}

void EventLogger::log_application_ready(const events::ApplicationReady& event) {
    HUDDLE_LOG_INFO("EventLogger", "Ready in " + std::to_string(event.startup_time.count()) + "ms");
}

void EventLogger::log_application_shutting_down(const events::ApplicationShuttingDown& event) {
    HUDDLE_LOG_INFO("EventLogger", "Shutting down: " + event.reason);
}

void EventLogger::log_service_error(const events::ServiceError& event) {
    HUDDLE_LOG_ERROR("EventLogger", "Service error [" + event.service_name + "]: " + event.error_message +
                     " (recoverable=" + (event.recoverable ? "true" : "false") + ")");
}

}
