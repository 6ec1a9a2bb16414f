#include "listen_along/utils/json_helper.hpp"

namespace listen_along::utils {

std::expected<nlohmann::json, std::string> JsonHelper::safe_parse(const std::string& json_string) {
    if (json_string.empty()) {
        return std::unexpected("Empty JSON string");
    }

    // Error pages from proxies and CDNs come back as HTML
    if (json_string.front() == '<') {
        return std::unexpected("Response appears to be XML/HTML, not JSON");
    }

    try {
        return nlohmann::json::parse(json_string);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected("JSON parse error: " + std::string(e.what()));
    }
}

bool JsonHelper::has_field(const nlohmann::json& json, const std::string& field) {
    return json.is_object() && json.contains(field) && !json.at(field).is_null();
}

bool JsonHelper::has_array(const nlohmann::json& json, const std::string& field) {
    return json.is_object() && json.contains(field) && json.at(field).is_array()
        && !json.at(field).empty();
}

} // namespace listen_along::utils
