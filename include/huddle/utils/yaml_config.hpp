#pragma once

#include "huddle/core/models.hpp"
#include <yaml-cpp/yaml.h>
#include <expected>
#include <filesystem>

namespace huddle {
namespace utils {

class YamlConfigHelper {
public:
    // Load configuration from YAML file
    static std::expected<core::ApplicationConfig, core::ConfigError>
    load_from_file(const std::filesystem::path& path);

    // Save configuration to YAML file
    static std::expected<void, core::ConfigError>
    save_to_file(const core::ApplicationConfig& config, const std::filesystem::path& path);

    // Convert between YAML nodes and config structures; from_yaml throws
    // YAML::Exception on malformed values
    static core::ApplicationConfig from_yaml(const YAML::Node& node);
    static YAML::Node to_yaml(const core::ApplicationConfig& config);

    // Partial updates
    static void merge_presence_config(YAML::Node& node, const core::PresenceConfig& config);
    static void merge_voice_config(YAML::Node& node, const core::VoiceConfig& config);

private:
    static core::PresenceConfig parse_presence_config(const YAML::Node& node);
    static core::VoiceConfig parse_voice_config(const YAML::Node& node);
    static std::chrono::milliseconds parse_duration_node(const YAML::Node& node);
};

} // namespace utils
} // namespace huddle
