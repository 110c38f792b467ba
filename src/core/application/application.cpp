#include "huddle/core/application.hpp"
#include "huddle/core/event_bus.hpp"
#include "huddle/core/event_logger.hpp"
#include "huddle/core/events.hpp"
#include "huddle/services/presence/presence_engine.hpp"
#include "huddle/services/voice/voice_relay.hpp"
#include "huddle/utils/logger.hpp"
#include "huddle/utils/timer_manager.hpp"
#include "version.h"

#include <atomic>
#include <chrono>
#include <vector>

namespace huddle {
namespace core {

std::string to_string(ApplicationState state) {
    switch (state) {
        case ApplicationState::NotInitialized: return "NotInitialized";
        case ApplicationState::Initializing: return "Initializing";
        case ApplicationState::Running: return "Running";
        case ApplicationState::Stopping: return "Stopping";
        case ApplicationState::Stopped: return "Stopped";
        case ApplicationState::Error: return "Error";
    }
    return "Unknown";
}

class ApplicationImpl : public Application {
public:
    explicit ApplicationImpl(const std::filesystem::path& config_path)
        : m_state(ApplicationState::NotInitialized),
          m_running(false),
          m_event_bus(std::make_shared<EventBus>()),
          m_config_service(std::make_shared<ConfigManager>(config_path)) {
        HUDDLE_LOG_DEBUG("Application", "Application created");
    }

    ~ApplicationImpl() override {
        if (m_state != ApplicationState::Stopped && m_state != ApplicationState::NotInitialized) {
            stop();
            shutdown();
        }
        HUDDLE_LOG_DEBUG("Application", "Application destroyed");
    }

    std::expected<void, ApplicationError> initialize() override {
        HUDDLE_LOG_INFO("Application", "Initializing...");

        if (m_state != ApplicationState::NotInitialized) {
            HUDDLE_LOG_WARNING("Application", "Already initialized");
            return std::unexpected(ApplicationError::AlreadyRunning);
        }

        m_started_at = std::chrono::steady_clock::now();
        set_state(ApplicationState::Initializing);

        try {
            if (!initialize_configuration()) {
                set_state(ApplicationState::Error);
                return std::unexpected(ApplicationError::ConfigurationError);
            }

            const auto config = m_config_service->get();
            initialize_event_logger();
            initialize_timers(config);
            initialize_presence_engine(config);
            initialize_voice_relay(config);
            connect_services();

            set_state(ApplicationState::Running);
            HUDDLE_LOG_INFO("Application", "Initialization complete");
            return {};

        } catch (const std::exception& e) {
            HUDDLE_LOG_ERROR("Application", "Initialization failed: " + std::string(e.what()));
            m_event_bus->publish(events::ServiceError{"Application", e.what(), false});
            set_state(ApplicationState::Error);
            return std::unexpected(ApplicationError::InitializationFailed);
        }
    }

    std::expected<void, ApplicationError> start() override {
        if (m_state != ApplicationState::Running) {
            HUDDLE_LOG_ERROR("Application", "Not initialized");
            return std::unexpected(ApplicationError::InitializationFailed);
        }
        if (m_running) {
            return std::unexpected(ApplicationError::AlreadyRunning);
        }

        m_event_bus->publish(events::ApplicationStarting{HUDDLE_VERSION_STRING});
        m_running = true;

        auto startup_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - m_started_at);
        m_event_bus->publish(events::ApplicationReady{startup_time});
        return {};
    }

    void stop() override {
        if (m_state == ApplicationState::Stopping || m_state == ApplicationState::Stopped) {
            return;
        }
        HUDDLE_LOG_INFO("Application", "Stopping...");
        m_running = false;
        m_event_bus->publish(events::ApplicationShuttingDown{});
        set_state(ApplicationState::Stopping);
    }

    void shutdown() override {
        if (m_state == ApplicationState::Stopped) {
            return;
        }
        HUDDLE_LOG_INFO("Application", "Shutting down...");

        cleanup_event_subscriptions();

        // Timers first so no callback touches the registries while they are cleared
        if (m_timers) {
            m_timers->shutdown();
        }
        if (m_presence_engine) {
            m_presence_engine->clear();
        }

        set_state(ApplicationState::Stopped);
        if (m_event_logger) {
            m_event_logger->stop();
        }
        HUDDLE_LOG_INFO("Application", "Shutdown complete");
    }

    ApplicationState get_state() const override {
        return m_state;
    }

    bool is_running() const override {
        return m_running;
    }

    std::expected<std::shared_ptr<services::PresenceEngine>, ApplicationError> get_presence_engine() override {
        if (!m_presence_engine) {
            return std::unexpected(ApplicationError::ServiceUnavailable);
        }
        return m_presence_engine;
    }

    std::expected<std::shared_ptr<services::VoiceRelay>, ApplicationError> get_voice_relay() override {
        if (!m_voice_relay) {
            return std::unexpected(ApplicationError::ServiceUnavailable);
        }
        return m_voice_relay;
    }

    std::expected<std::shared_ptr<ConfigManager>, ApplicationError> get_configuration_service() override {
        if (!m_config_service) {
            return std::unexpected(ApplicationError::ServiceUnavailable);
        }
        return m_config_service;
    }

    std::expected<ApplicationConfig, ApplicationError> get_config() const override {
        if (!m_config_service) {
            return std::unexpected(ApplicationError::ServiceUnavailable);
        }
        return m_config_service->get();
    }

    std::expected<std::shared_ptr<EventBus>, ApplicationError> get_event_bus() override {
        if (!m_event_bus) {
            return std::unexpected(ApplicationError::ServiceUnavailable);
        }
        return m_event_bus;
    }

private:
    void set_state(ApplicationState state) {
        auto previous = m_state.exchange(state);
        if (previous != state) {
            m_event_bus->publish(events::ApplicationStateChanged{previous, state});
        }
    }

    bool initialize_configuration() {
        m_config_service->set_event_bus(m_event_bus);

        auto loaded = m_config_service->load();
        if (!loaded) {
            HUDDLE_LOG_ERROR("Application", "Configuration could not be loaded from " +
                             m_config_service->path().string());
            return false;
        }
        return true;
    }

    // Started before the services so their first events are logged
    void initialize_event_logger() {
        m_event_logger = std::make_unique<EventLogger>(m_event_bus);
        m_event_logger->start();
    }

    void initialize_timers(const ApplicationConfig& config) {
        m_timers = std::make_shared<utils::TimerManager>(config.timers.worker_threads);
    }

    void initialize_presence_engine(const ApplicationConfig& config) {
        m_presence_engine = std::make_shared<services::PresenceEngine>(m_event_bus, m_timers, config.presence);
        HUDDLE_LOG_INFO("Application", "Presence engine initialized");
    }

    void initialize_voice_relay(const ApplicationConfig& config) {
        m_voice_relay = std::make_shared<services::VoiceRelay>(m_event_bus, config.voice);
        HUDDLE_LOG_INFO("Application", "Voice relay initialized");
    }

    void connect_services() {
        auto config_sub = m_event_bus->subscribe<events::ConfigurationUpdated>(
            [this](const events::ConfigurationUpdated& event) {
                apply_configuration(event.previous_config, event.new_config);
            }
        );
        m_event_subscriptions.push_back(config_sub);
    }

    void apply_configuration(const ApplicationConfig& previous, const ApplicationConfig& current) {
        if (m_presence_engine && !(previous.presence == current.presence)) {
            m_presence_engine->set_timeouts(current.presence);
        }
        if (m_voice_relay && !(previous.voice == current.voice)) {
            m_voice_relay->set_ice_servers(current.voice);
        }
        if (previous.log_level != current.log_level) {
            utils::LoggerManager::get_instance().set_level(current.log_level);
        }
        if (!(previous.timers == current.timers)) {
            HUDDLE_LOG_WARNING("Application", "timers.worker_threads takes effect after a restart");
        }
    }

    void cleanup_event_subscriptions() {
        for (auto id : m_event_subscriptions) {
            m_event_bus->unsubscribe(id);
        }
        m_event_subscriptions.clear();
    }

    std::atomic<ApplicationState> m_state;
    std::atomic<bool> m_running;
    std::chrono::steady_clock::time_point m_started_at{};

    std::shared_ptr<EventBus> m_event_bus;
    std::shared_ptr<ConfigManager> m_config_service;
    std::unique_ptr<EventLogger> m_event_logger;
    std::shared_ptr<utils::TimerManager> m_timers;
    std::shared_ptr<services::PresenceEngine> m_presence_engine;
    std::shared_ptr<services::VoiceRelay> m_voice_relay;
    std::vector<EventBus::HandlerId> m_event_subscriptions;
};

std::expected<std::unique_ptr<Application>, ApplicationError>
create_application(const std::filesystem::path& config_path) {
    HUDDLE_LOG_DEBUG("Application", "Creating application");

    try {
        return std::make_unique<ApplicationImpl>(config_path);
    } catch (const std::exception& e) {
        HUDDLE_LOG_ERROR("Application", "Creation failed: " + std::string(e.what()));
        return std::unexpected(ApplicationError::InitializationFailed);
    }
}

} // namespace core
} // namespace huddle
