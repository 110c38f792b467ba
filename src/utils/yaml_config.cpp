#include "huddle/utils/yaml_config.hpp"
#include "huddle/utils/format_utils.hpp"
#include "huddle/utils/logger.hpp"
#include <fstream>
#include <system_error>

namespace huddle {
namespace utils {

std::expected<core::ApplicationConfig, core::ConfigError>
YamlConfigHelper::load_from_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        HUDDLE_LOG_WARNING("YamlConfig", "File not found: " + path.string());
        return std::unexpected(core::ConfigError::FileNotFound);
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::BadFile& e) {
        HUDDLE_LOG_ERROR("YamlConfig", "Cannot read " + path.string() + ": " + e.what());
        return std::unexpected(core::ConfigError::PermissionDenied);
    } catch (const YAML::Exception& e) {
        HUDDLE_LOG_ERROR("YamlConfig", "Parse error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

std::expected<void, core::ConfigError>
YamlConfigHelper::save_to_file(const core::ApplicationConfig& config, const std::filesystem::path& path) {
    auto dir = path.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            HUDDLE_LOG_ERROR("YamlConfig", "Cannot create directory " + dir.string() + ": " + ec.message());
            return std::unexpected(core::ConfigError::PermissionDenied);
        }
    }

    std::ofstream file(path);
    if (!file) {
        HUDDLE_LOG_ERROR("YamlConfig", "Cannot open file for writing: " + path.string());
        return std::unexpected(core::ConfigError::PermissionDenied);
    }

    YAML::Emitter out;
    out << to_yaml(config);
    if (!out.good()) {
        HUDDLE_LOG_ERROR("YamlConfig", "Emit error: " + out.GetLastError());
        return std::unexpected(core::ConfigError::InvalidFormat);
    }

    file << out.c_str() << '\n';
    return {};
}

core::ApplicationConfig YamlConfigHelper::from_yaml(const YAML::Node& node) {
    core::ApplicationConfig config;

    if (node["log_level"]) {
        config.log_level = log_level_from_string(node["log_level"].as<std::string>());
    }
    if (node["log_file"]) {
        config.log_file = node["log_file"].as<std::string>();
    }

    if (node["presence"]) {
        config.presence = parse_presence_config(node["presence"]);
    }
    if (node["voice"]) {
        config.voice = parse_voice_config(node["voice"]);
    }

    if (node["timers"] && node["timers"]["worker_threads"]) {
        config.timers.worker_threads = node["timers"]["worker_threads"].as<std::size_t>();
    }

    return config;
}

YAML::Node YamlConfigHelper::to_yaml(const core::ApplicationConfig& config) {
    YAML::Node node;

    node["log_level"] = to_string(config.log_level);
    node["log_file"] = config.log_file;

    merge_presence_config(node, config.presence);
    merge_voice_config(node, config.voice);

    node["timers"]["worker_threads"] = config.timers.worker_threads;

    return node;
}

void YamlConfigHelper::merge_presence_config(YAML::Node& node, const core::PresenceConfig& config) {
    node["presence"]["grace_period"] = format_duration(config.grace_period);
    node["presence"]["idle_timeout"] = format_duration(config.idle_timeout);
    node["presence"]["agent_inactivity_timeout"] = format_duration(config.agent_inactivity_timeout);
}

void YamlConfigHelper::merge_voice_config(YAML::Node& node, const core::VoiceConfig& config) {
    YAML::Node stun_urls(YAML::NodeType::Sequence);
    for (const auto& url : config.stun_urls) {
        stun_urls.push_back(url);
    }
    node["voice"]["stun_urls"] = stun_urls;
    node["voice"]["turn_url"] = config.turn_url;
    node["voice"]["turn_username"] = config.turn_username;
    node["voice"]["turn_credential"] = config.turn_credential;
}

core::PresenceConfig YamlConfigHelper::parse_presence_config(const YAML::Node& node) {
    core::PresenceConfig config;

    if (node["grace_period"]) {
        config.grace_period = parse_duration_node(node["grace_period"]);
    }
    if (node["idle_timeout"]) {
        config.idle_timeout = parse_duration_node(node["idle_timeout"]);
    }
    if (node["agent_inactivity_timeout"]) {
        config.agent_inactivity_timeout = parse_duration_node(node["agent_inactivity_timeout"]);
    }

    return config;
}

core::VoiceConfig YamlConfigHelper::parse_voice_config(const YAML::Node& node) {
    core::VoiceConfig config;

    // An explicit empty list disables STUN
    if (node["stun_urls"]) {
        config.stun_urls = node["stun_urls"].as<std::vector<std::string>>();
    }
    if (node["turn_url"]) {
        config.turn_url = node["turn_url"].as<std::string>();
    }
    if (node["turn_username"]) {
        config.turn_username = node["turn_username"].as<std::string>();
    }
    if (node["turn_credential"]) {
        config.turn_credential = node["turn_credential"].as<std::string>();
    }

    return config;
}

std::chrono::milliseconds YamlConfigHelper::parse_duration_node(const YAML::Node& node) {
    auto parsed = parse_duration(node.as<std::string>());
    if (!parsed) {
        throw YAML::RepresentationException(node.Mark(), parsed.error());
    }
    return *parsed;
}

} // namespace utils
} // namespace huddle
