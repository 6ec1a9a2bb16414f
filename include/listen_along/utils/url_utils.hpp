#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace listen_along {
namespace utils {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

class UrlUtils {
public:
    static std::string encode(const std::string& str);
    static std::string decode(const std::string& str);
    static std::unordered_map<std::string, std::string> parse_query_string(const std::string& query);
    // Keeps insertion order so generated URLs are reproducible.
    static std::string build_query_string(const QueryParams& params);
    static bool is_valid_url(const std::string& url);
    static std::optional<std::string> get_host(const std::string& url);
    static std::optional<int> get_port(const std::string& url);
    static std::optional<std::string> get_scheme(const std::string& url);
    static std::string get_path(const std::string& url);
    static std::string get_query(const std::string& url);
};

} // namespace utils
} // namespace listen_along
