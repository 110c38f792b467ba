#include "huddle/core/application.hpp"
#include "huddle/core/event_bus.hpp"
#include "huddle/core/events.hpp"
#include "huddle/utils/config_validator.hpp"
#include "huddle/utils/yaml_config.hpp"
#include "huddle/utils/logger.hpp"
#include <cstdlib>
#include <fstream>
#include <shared_mutex>
#include <sstream>
#include <system_error>

namespace huddle {
namespace core {

namespace {

bool check_config(const ApplicationConfig& config) {
    auto validation = utils::ConfigValidator::validate_application_config(config);
    for (const auto& warning : validation.warnings) {
        HUDDLE_LOG_WARNING("ConfigService", warning);
    }
    if (!validation.is_valid) {
        HUDDLE_LOG_ERROR("ConfigService", "Invalid configuration: " + validation.get_error_summary());
    }
    return validation.is_valid;
}

}

// Configuration manager implementation

class ConfigManager::Impl {
public:
    explicit Impl(const std::filesystem::path& config_path)
        : m_config_path(config_path.empty() ? default_config_path() : config_path) {
        HUDDLE_LOG_DEBUG("ConfigService", "Initializing with path: " + m_config_path.string());
    }

    std::expected<void, ConfigError> load() {
        HUDDLE_LOG_DEBUG("ConfigService", "Loading configuration");

        std::error_code ec;
        if (!std::filesystem::exists(m_config_path, ec)) {
            HUDDLE_LOG_INFO("ConfigService", "No configuration at " + m_config_path.string() + ", writing defaults");
            {
                std::unique_lock lock(m_mutex);
                m_config = ApplicationConfig{};
            }
            auto saved = save();
            if (saved) {
                auto documented = add_documentation_comments();
                if (!documented) {
                    HUDDLE_LOG_WARNING("ConfigService", "Could not add documentation header");
                }
            }
            return saved;
        }

        auto result = utils::YamlConfigHelper::load_from_file(m_config_path);
        if (!result) {
            publish_error(result.error(), "Failed to load " + m_config_path.string());
            return std::unexpected(result.error());
        }

        if (!check_config(*result)) {
            publish_error(ConfigError::ValidationError, "Configuration failed validation");
            return std::unexpected(ConfigError::ValidationError);
        }

        std::unique_lock lock(m_mutex);
        m_config = *result;
        HUDDLE_LOG_DEBUG("ConfigService", "Configuration loaded");
        return {};
    }

    std::expected<void, ConfigError> save() {
        ApplicationConfig config_copy;
        {
            std::shared_lock lock(m_mutex);
            config_copy = m_config;
        }

        HUDDLE_LOG_DEBUG("ConfigService", "Saving configuration");
        return utils::YamlConfigHelper::save_to_file(config_copy, m_config_path);
    }

    std::expected<void, ConfigError> add_documentation_comments() const {
        std::ifstream in_file(m_config_path);
        if (!in_file) {
            return std::unexpected(ConfigError::FileNotFound);
        }

        std::stringstream content;
        content << "# huddle server configuration\n";
        content << "# This file was automatically generated on first run\n\n";
        content << "# log_level: debug, info, warning, error or none\n";
        content << "# log_file: path of an additional log file, empty for console only\n\n";
        content << "# Durations accept ms, s, m and h suffixes; a bare number means seconds\n";
        content << "# presence.grace_period: delay after a user's last connection closes before going Offline\n";
        content << "# presence.idle_timeout: time without heartbeat before an Online user becomes Idle\n";
        content << "# presence.agent_inactivity_timeout: time without API activity before an agent goes Offline\n\n";
        content << "# voice.stun_urls: STUN servers handed to WebRTC peers (empty list disables STUN)\n";
        content << "# voice.turn_url: optional TURN relay; requires turn_username and turn_credential\n\n";
        content << "# timers.worker_threads: threads running timer callbacks (1-64, restart required)\n\n";
        content << in_file.rdbuf();
        in_file.close();

        std::ofstream out_file(m_config_path);
        if (!out_file) {
            return std::unexpected(ConfigError::PermissionDenied);
        }

        out_file << content.str();
        HUDDLE_LOG_INFO("ConfigService", "Wrote default configuration to " + m_config_path.string());
        return {};
    }

    ApplicationConfig get() const {
        std::shared_lock lock(m_mutex);
        return m_config;
    }

    const std::filesystem::path& path() const {
        return m_config_path;
    }

    std::expected<void, ConfigError> update(const ApplicationConfig& config) {
        HUDDLE_LOG_INFO("ConfigService", "Updating configuration");

        if (!check_config(config)) {
            publish_error(ConfigError::ValidationError, "Rejected configuration update");
            return std::unexpected(ConfigError::ValidationError);
        }

        ApplicationConfig old_config;
        {
            std::unique_lock lock(m_mutex);
            old_config = m_config;
            m_config = config;
        }

        // Save and publish event outside of lock
        auto result = save();
        if (result && m_event_bus) {
            m_event_bus->publish(events::ConfigurationUpdated{std::move(old_config), config});
        }
        return result;
    }

    void set_event_bus(std::shared_ptr<EventBus> bus) {
        HUDDLE_LOG_DEBUG("ConfigService", "Setting event bus");
        m_event_bus = std::move(bus);
    }

private:
    void publish_error(ConfigError error, const std::string& message) const {
        if (m_event_bus) {
            m_event_bus->publish(events::ConfigurationError{error, message});
        }
    }

    mutable std::shared_mutex m_mutex;
    std::filesystem::path m_config_path;
    ApplicationConfig m_config;
    std::shared_ptr<EventBus> m_event_bus;
};

// ConfigManager implementation

ConfigManager::ConfigManager(const std::filesystem::path& config_path)
    : m_impl(std::make_unique<Impl>(config_path)) {}

ConfigManager::~ConfigManager() = default;

std::expected<void, ConfigError> ConfigManager::load() {
    return m_impl->load();
}

std::expected<void, ConfigError> ConfigManager::save() {
    return m_impl->save();
}

ApplicationConfig ConfigManager::get() const {
    return m_impl->get();
}

const std::filesystem::path& ConfigManager::path() const {
    return m_impl->path();
}

std::expected<void, ConfigError> ConfigManager::update(const ApplicationConfig& config) {
    return m_impl->update(config);
}

void ConfigManager::set_event_bus(std::shared_ptr<EventBus> bus) {
    m_impl->set_event_bus(std::move(bus));
}

std::filesystem::path ConfigManager::default_config_path() {
    std::filesystem::path config_dir;

    // $XDG_CONFIG_HOME/huddle or ~/.config/huddle
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME"); xdg_config && *xdg_config) {
        config_dir = std::filesystem::path(xdg_config) / "huddle";
    } else if (const char* home = std::getenv("HOME")) {
        config_dir = std::filesystem::path(home) / ".config" / "huddle";
    }

    return config_dir / "config.yaml";
}

} // namespace core
} // namespace huddle
