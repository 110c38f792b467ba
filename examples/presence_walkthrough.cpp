#include "huddle/core/event_bus.hpp"
#include "huddle/core/event_logger.hpp"
#include "huddle/core/events.hpp"
#include "huddle/core/json_payloads.hpp"
#include "huddle/services/presence/presence_engine.hpp"
#include "huddle/services/voice/voice_relay.hpp"
#include "huddle/utils/logger.hpp"
#include "huddle/utils/timer_manager.hpp"
#include <iostream>
#include <thread>
#include <chrono>

using namespace huddle::core;
using namespace huddle::core::events;
using namespace std::chrono_literals;

class PresenceWatcher {
public:
    PresenceWatcher(std::shared_ptr<EventBus> bus) : m_event_bus(bus) {
        m_subscription = m_event_bus->subscribe<PresenceChanged>(
            [](const PresenceChanged& event) {
                std::cout << "presence: " << event.display_name << " -> "
                          << to_string(event.status) << std::endl;
            });
    }

    ~PresenceWatcher() {
        m_event_bus->unsubscribe(m_subscription);
    }

private:
    std::shared_ptr<EventBus> m_event_bus;
    EventBus::HandlerId m_subscription;
};

class VoiceWatcher {
public:
    VoiceWatcher(std::shared_ptr<EventBus> bus) : m_event_bus(bus) {
        m_joined_sub = m_event_bus->subscribe<VoiceParticipantJoined>(
            [](const VoiceParticipantJoined& event) {
                std::cout << "voice: " << to_json(event).dump() << std::endl;
            });

        m_signal_sub = m_event_bus->subscribe<SignalForwarded>(
            [](const SignalForwarded& event) {
                std::cout << "signal for connection " << event.target_connection.value
                          << ": " << to_json(event).dump() << std::endl;
            });
    }

    ~VoiceWatcher() {
        m_event_bus->unsubscribe(m_joined_sub);
        m_event_bus->unsubscribe(m_signal_sub);
    }

private:
    std::shared_ptr<EventBus> m_event_bus;
    EventBus::HandlerId m_joined_sub;
    EventBus::HandlerId m_signal_sub;
};

int main() {
    huddle::utils::LoggerManager::get_instance().set_level(huddle::utils::LogLevel::Warning);

    auto bus = std::make_shared<EventBus>();
    auto timers = std::make_shared<huddle::utils::TimerManager>();

    PresenceConfig config;
    config.grace_period = 200ms;
    config.idle_timeout = 400ms;
    config.agent_inactivity_timeout = 300ms;

    auto presence = std::make_shared<huddle::services::PresenceEngine>(bus, timers, config);
    auto voice = std::make_shared<huddle::services::VoiceRelay>(bus);

    PresenceWatcher presence_watcher(bus);
    VoiceWatcher voice_watcher(bus);

    std::cout << "Alice opens two tabs" << std::endl;
    presence->connect(UserId{"alice"}, ConnectionId{"a1"}, "Alice");
    presence->connect(UserId{"alice"}, ConnectionId{"a2"}, "Alice");

    std::cout << "Bob connects and both join the lounge" << std::endl;
    presence->connect(UserId{"bob"}, ConnectionId{"b1"}, "Bob");
    voice->join_room(RoomId{"lounge"}, UserId{"alice"}, ConnectionId{"a1"}, "Alice");
    voice->join_room(RoomId{"lounge"}, UserId{"bob"}, ConnectionId{"b1"}, "Bob");
    voice->relay_signal(SignalKind::Offer, UserId{"alice"}, UserId{"bob"}, "v=0 ...");

    std::cout << "Alice closes one tab, then the other" << std::endl;
    presence->disconnect(UserId{"alice"}, ConnectionId{"a2"});
    presence->disconnect(UserId{"alice"}, ConnectionId{"a1"});
    voice->on_disconnect(ConnectionId{"a1"});

    std::cout << "Waiting past the grace period and Bob's idle timeout..." << std::endl;
    std::this_thread::sleep_for(600ms);

    std::cout << "An agent makes one API call" << std::endl;
    presence->touch_agent_activity(UserId{"bot"}, "Build Bot");
    std::this_thread::sleep_for(500ms);

    std::cout << "Online now:" << std::endl;
    for (const auto& user : presence->snapshot()) {
        std::cout << "  " << to_json(user).dump() << std::endl;
    }

    presence->clear();
    timers->shutdown();
    return 0;
}
