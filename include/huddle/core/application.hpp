#pragma once

#include "huddle/core/models.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <string>

// Forward declarations
namespace huddle {
namespace core {
    class EventBus;
}

namespace services {
    class PresenceEngine;
    class VoiceRelay;
}
}

namespace huddle {
namespace core {

// Configuration manager
class ConfigManager {
public:
    explicit ConfigManager(const std::filesystem::path& config_path = {});
    ~ConfigManager();

    // Core operations; load() writes a documented default file when none exists
    std::expected<void, ConfigError> load();
    std::expected<void, ConfigError> save();

    // Configuration access
    ApplicationConfig get() const;
    const std::filesystem::path& path() const;

    // Validates, persists and publishes ConfigurationUpdated
    std::expected<void, ConfigError> update(const ApplicationConfig& config);

    // Event notifications
    void set_event_bus(std::shared_ptr<EventBus> bus);

    static std::filesystem::path default_config_path();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// Process-lifetime owner of the presence engine, voice relay and their timers
class Application {
public:
    virtual ~Application() = default;

    // Lifecycle management
    virtual std::expected<void, ApplicationError> initialize() = 0;
    virtual std::expected<void, ApplicationError> start() = 0;
    virtual void stop() = 0;
    virtual void shutdown() = 0;

    // State management
    virtual ApplicationState get_state() const = 0;
    virtual bool is_running() const = 0;

    // Service access
    virtual std::expected<std::shared_ptr<services::PresenceEngine>, ApplicationError> get_presence_engine() = 0;
    virtual std::expected<std::shared_ptr<services::VoiceRelay>, ApplicationError> get_voice_relay() = 0;
    virtual std::expected<std::shared_ptr<ConfigManager>, ApplicationError> get_configuration_service() = 0;
    virtual std::expected<ApplicationConfig, ApplicationError> get_config() const = 0;

    // Event bus access
    virtual std::expected<std::shared_ptr<EventBus>, ApplicationError> get_event_bus() = 0;
};

// Application creation; an empty path selects ConfigManager::default_config_path()
std::expected<std::unique_ptr<Application>, ApplicationError>
create_application(const std::filesystem::path& config_path = {});

std::string to_string(ApplicationState state);

} // namespace core
} // namespace huddle
