#include "taskrelay/utils/json_helper.hpp"

namespace taskrelay::utils {

std::expected<nlohmann::json, std::string> JsonHelper::safe_parse(const std::string& json_string) {
    if (json_string.empty()) {
        return std::unexpected("Empty JSON string");
    }

    try {
        return nlohmann::json::parse(json_string);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected("JSON parse error: " + std::string(e.what()));
    } catch (const std::exception& e) {
        return std::unexpected("Error parsing JSON: " + std::string(e.what()));
    }
}

bool JsonHelper::has_field(const nlohmann::json& json, const std::string& field) {
    return json.is_object() && json.contains(field) && !json.at(field).is_null();
}

} // namespace taskrelay::utils
