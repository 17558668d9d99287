#pragma once

#include <nlohmann/json.hpp>
#include <expected>
#include <optional>
#include <string>
#include <type_traits>

namespace taskrelay::utils {

/**
 * @brief Helper utilities for safe JSON parsing and field extraction
 */
class JsonHelper {
public:
    /**
     * @brief Strictly parse a JSON document
     *
     * @param json_string The text to parse
     * @return std::expected<nlohmann::json, std::string> Parsed JSON or error message
     */
    static std::expected<nlohmann::json, std::string> safe_parse(const std::string& json_string);

    /**
     * @brief Get an optional field, empty when missing, null or of the wrong type
     *
     * @tparam T The expected type of the field
     * @param json The JSON object
     * @param field The field name
     */
    template<typename T>
    static std::optional<T> get_optional(const nlohmann::json& json, const std::string& field);

    /**
     * @brief Check if a field exists and is not null
     */
    static bool has_field(const nlohmann::json& json, const std::string& field);
};

template<typename T>
std::optional<T> JsonHelper::get_optional(const nlohmann::json& json, const std::string& field) {
    if (!has_field(json, field)) {
        return std::nullopt;
    }

    const auto& value = json.at(field);
    if constexpr (std::is_same_v<T, std::string>) {
        if (!value.is_string()) return std::nullopt;
    } else if constexpr (std::is_arithmetic_v<T>) {
        if (!value.is_number()) return std::nullopt;
    }

    try {
        return value.get<T>();
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

} // namespace taskrelay::utils
