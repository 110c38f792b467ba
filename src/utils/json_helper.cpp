#include "huddle/utils/json_helper.hpp"

namespace huddle::utils {

namespace {

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

}

std::expected<nlohmann::json, std::string> JsonHelper::safe_parse(std::string_view json_string) {
    const auto text = trim(json_string);
    if (text.empty()) {
        return std::unexpected("Empty JSON string");
    }

    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected("JSON parse error: " + std::string(e.what()));
    }
}

std::expected<nlohmann::json, std::string> JsonHelper::parse_object(std::string_view json_string) {
    auto parsed = safe_parse(json_string);
    if (!parsed) {
        return parsed;
    }
    if (!parsed->is_object()) {
        return std::unexpected(std::string("Expected a JSON object, got ") + parsed->type_name());
    }
    return parsed;
}

bool JsonHelper::has_field(const nlohmann::json& json, const std::string& field) {
    return json.is_object() && json.contains(field) && !json.at(field).is_null();
}

} // namespace huddle::utils
