#include "huddle/utils/config_validator.hpp"
#include "huddle/utils/format_utils.hpp"

#include <array>
#include <string_view>

namespace huddle::utils {

namespace {

void require_in_range(ValidationResult& result, std::chrono::milliseconds value, const std::string& name) {
    if (value.count() <= 0) {
        result.add_error(ValidationError::InvalidTimeout, name + " must be positive");
    } else if (value > MAX_DURATION) {
        result.add_error(ValidationError::InvalidTimeout, name + " must not exceed " + format_duration(MAX_DURATION));
    }
}

}

ValidationResult ConfigValidator::validate_presence_config(const core::PresenceConfig& config) {
    ValidationResult result;

    require_in_range(result, config.grace_period, "Grace period");
    require_in_range(result, config.idle_timeout, "Idle timeout");
    require_in_range(result, config.agent_inactivity_timeout, "Agent inactivity timeout");

    if (!result.is_valid) {
        return result;
    }

    if (config.grace_period < std::chrono::seconds{1}) {
        result.add_warning("Grace period under 1 second will mark users offline on brief reconnects");
    }
    if (config.grace_period > config.idle_timeout) {
        result.add_warning("Grace period (" + format_duration(config.grace_period) +
            ") is longer than the idle timeout (" + format_duration(config.idle_timeout) + ")");
    }

    return result;
}

ValidationResult ConfigValidator::validate_voice_config(const core::VoiceConfig& config) {
    ValidationResult result;

    for (const auto& url : config.stun_urls) {
        if (!is_valid_ice_url(url)) {
            result.add_error(ValidationError::InvalidIceUrl, "Invalid STUN url: " + url);
        }
    }

    if (!config.turn_url.empty()) {
        if (!is_valid_ice_url(config.turn_url)) {
            result.add_error(ValidationError::InvalidIceUrl, "Invalid TURN url: " + config.turn_url);
        }
        if (config.turn_username.empty() || config.turn_credential.empty()) {
            result.add_error(ValidationError::MissingTurnCredentials,
                "TURN url requires both turn_username and turn_credential");
        }
    }

    if (config.stun_urls.empty() && config.turn_url.empty()) {
        result.add_warning("No ICE servers configured; peers behind NAT will not connect");
    }

    return result;
}

ValidationResult ConfigValidator::validate_timer_config(const core::TimerConfig& config) {
    ValidationResult result;

    if (config.worker_threads < 1 || config.worker_threads > MAX_WORKER_THREADS) {
        result.add_error(ValidationError::InvalidWorkerCount,
            "timers.worker_threads must be between 1 and " + std::to_string(MAX_WORKER_THREADS));
    }

    return result;
}

ValidationResult ConfigValidator::validate_application_config(const core::ApplicationConfig& config) {
    ValidationResult result;

    result.merge(validate_presence_config(config.presence));
    result.merge(validate_voice_config(config.voice));
    result.merge(validate_timer_config(config.timers));

    return result;
}

bool ConfigValidator::is_valid_ice_url(const std::string& url) {
    static constexpr std::array<std::string_view, 4> schemes{"stun:", "stuns:", "turn:", "turns:"};

    for (const auto scheme : schemes) {
        if (url.size() > scheme.size() && url.starts_with(scheme)) {
            return true;
        }
    }
    return false;
}

} // namespace huddle::utils
