#pragma once

#include "huddle/core/models.hpp"
#include <string>
#include <utility>
#include <vector>

namespace huddle::utils {

/**
 * @brief Configuration validation errors
 */
enum class ValidationError {
    InvalidTimeout,
    InvalidWorkerCount,
    InvalidIceUrl,
    MissingTurnCredentials
};

/**
 * @brief Detailed validation result
 */
struct ValidationResult {
    bool is_valid = true;
    std::vector<std::pair<ValidationError, std::string>> errors;
    std::vector<std::string> warnings;

    void add_error(ValidationError error, const std::string& message) {
        is_valid = false;
        errors.emplace_back(error, message);
    }

    void add_warning(const std::string& message) {
        warnings.emplace_back(message);
    }

    void merge(const ValidationResult& other) {
        errors.insert(errors.end(), other.errors.begin(), other.errors.end());
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
        is_valid = is_valid && other.is_valid;
    }

    std::string get_error_summary() const {
        std::string summary;
        for (const auto& [error, message] : errors) {
            if (!summary.empty()) summary += "; ";
            summary += message;
        }
        return summary;
    }

    std::string get_warning_summary() const {
        std::string summary;
        for (const auto& warning : warnings) {
            if (!summary.empty()) summary += "; ";
            summary += warning;
        }
        return summary;
    }
};

class ConfigValidator {
public:
    static ValidationResult validate_presence_config(const core::PresenceConfig& config);
    static ValidationResult validate_voice_config(const core::VoiceConfig& config);
    static ValidationResult validate_timer_config(const core::TimerConfig& config);
    static ValidationResult validate_application_config(const core::ApplicationConfig& config);

    /**
     * @brief Check a STUN/TURN url scheme ("stun:", "stuns:", "turn:", "turns:")
     */
    static bool is_valid_ice_url(const std::string& url);

    static constexpr std::size_t MAX_WORKER_THREADS = 64;
};

} // namespace huddle::utils
