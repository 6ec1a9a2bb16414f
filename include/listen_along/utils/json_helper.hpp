#pragma once

#include <nlohmann/json.hpp>
#include <expected>
#include <string>

namespace listen_along::utils {

/**
 * @brief Helper utilities for safe JSON parsing and field extraction
 */
class JsonHelper {
public:
    /**
     * @brief Safely parse a JSON string
     *
     * @param json_string The JSON string to parse
     * @return Parsed JSON or an error message
     */
    static std::expected<nlohmann::json, std::string> safe_parse(const std::string& json_string);

    /**
     * @brief Get a required field from JSON, returning an error if missing or mistyped
     */
    template<typename T>
    static std::expected<T, std::string> get_required(const nlohmann::json& json, const std::string& field);

    /**
     * @brief Get an optional field from JSON, falling back to a default value
     */
    template<typename T>
    static T get_optional(const nlohmann::json& json, const std::string& field, const T& default_value);

    /**
     * @brief Check if a field exists and is not null
     */
    static bool has_field(const nlohmann::json& json, const std::string& field);

    /**
     * @brief Check if a field exists and is a non-empty array
     */
    static bool has_array(const nlohmann::json& json, const std::string& field);

    template<typename Func>
    static void for_each_in_array(const nlohmann::json& json, const std::string& field, Func&& func);
};

template<typename T>
std::expected<T, std::string> JsonHelper::get_required(const nlohmann::json& json, const std::string& field) {
    if (!json.is_object() || !json.contains(field)) {
        return std::unexpected("Missing required field: " + field);
    }

    try {
        return json.at(field).get<T>();
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected("Failed to extract field '" + field + "': " + e.what());
    }
}

template<typename T>
T JsonHelper::get_optional(const nlohmann::json& json, const std::string& field, const T& default_value) {
    if (!json.is_object() || !json.contains(field) || json.at(field).is_null()) {
        return default_value;
    }

    try {
        return json.at(field).get<T>();
    } catch (const nlohmann::json::exception&) {
        return default_value;
    }
}

template<typename Func>
void JsonHelper::for_each_in_array(const nlohmann::json& json, const std::string& field, Func&& func) {
    if (!has_array(json, field)) {
        return;
    }

    for (const auto& element : json.at(field)) {
        func(element);
    }
}

} // namespace listen_along::utils
