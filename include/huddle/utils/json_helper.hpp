#pragma once

#include <nlohmann/json.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace huddle::utils {

/**
 * @brief Checked access to inbound JSON messages
 *
 * Every accessor reports problems as a message instead of letting
 * nlohmann exceptions reach the caller.
 */
class JsonHelper {
public:
    /**
     * @brief Parse one line of JSON text
     *
     * @param json_string The text to parse; surrounding whitespace is ignored
     * @return std::expected<nlohmann::json, std::string> Parsed value or error message
     */
    static std::expected<nlohmann::json, std::string> safe_parse(std::string_view json_string);

    /**
     * @brief Parse text that must hold a JSON object
     */
    static std::expected<nlohmann::json, std::string> parse_object(std::string_view json_string);

    /**
     * @brief Get a required field, returning an error if it is missing or mistyped
     *
     * @tparam T The expected type of the field
     * @param json The JSON object
     * @param field The field name
     * @return std::expected<T, std::string> The value or error message
     */
    template<typename T>
    static std::expected<T, std::string> get_required(const nlohmann::json& json, const std::string& field);

    /**
     * @brief Get an optional field, falling back to default_value when absent or mistyped
     */
    template<typename T>
    static T get_optional(const nlohmann::json& json, const std::string& field, const T& default_value);

    // True if the field exists and is not null
    static bool has_field(const nlohmann::json& json, const std::string& field);
};

// Template implementations
template<typename T>
std::expected<T, std::string> JsonHelper::get_required(const nlohmann::json& json, const std::string& field) {
    if (!json.is_object() || !json.contains(field)) {
        return std::unexpected("Missing required field: " + field);
    }

    try {
        return json.at(field).get<T>();
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected("Invalid value for field '" + field + "': " + e.what());
    }
}

template<typename T>
T JsonHelper::get_optional(const nlohmann::json& json, const std::string& field, const T& default_value) {
    if (!has_field(json, field)) {
        return default_value;
    }

    try {
        return json.at(field).get<T>();
    } catch (const nlohmann::json::exception&) {
        return default_value;
    }
}

} // namespace huddle::utils
