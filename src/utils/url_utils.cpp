#include "listen_along/utils/url_utils.hpp"

#include <cctype>
#include <charconv>
#include <sstream>
#include <iomanip>

namespace listen_along {
namespace utils {

namespace {
    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    // Index of the first character after "scheme://".
    std::size_t authority_start(const std::string& url) {
        const auto scheme_pos = url.find("://");
        if (scheme_pos == std::string::npos) return std::string::npos;
        return scheme_pos + 3;
    }
}

std::string UrlUtils::encode(const std::string& str) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;

    for (char c : str) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(uc);
        }
    }

    return encoded.str();
}

std::string UrlUtils::decode(const std::string& str) {
    std::string decoded;
    decoded.reserve(str.size());

    for (std::size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            const int hi = hex_value(str[i + 1]);
            const int lo = hex_value(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
            decoded.push_back(str[i]);
        } else if (str[i] == '+') {
            decoded.push_back(' ');
        } else {
            decoded.push_back(str[i]);
        }
    }
    return decoded;
}

std::unordered_map<std::string, std::string> UrlUtils::parse_query_string(const std::string& query) {
    std::unordered_map<std::string, std::string> params;
    std::istringstream iss(query);
    std::string pair;

    while (std::getline(iss, pair, '&')) {
        const auto pos = pair.find('=');
        if (pos != std::string::npos) {
            params[decode(pair.substr(0, pos))] = decode(pair.substr(pos + 1));
        }
    }

    return params;
}

std::string UrlUtils::build_query_string(const QueryParams& params) {
    std::ostringstream oss;
    bool first = true;

    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << encode(key) << "=" << encode(value);
        first = false;
    }

    return oss.str();
}

bool UrlUtils::is_valid_url(const std::string& url) {
    const auto scheme = get_scheme(url);
    if (!scheme || (*scheme != "http" && *scheme != "https")) {
        return false;
    }
    return get_host(url).has_value();
}

std::optional<std::string> UrlUtils::get_host(const std::string& url) {
    const auto host_start = authority_start(url);
    if (host_start == std::string::npos) return std::nullopt;

    auto host_end = url.find_first_of(":/?#", host_start);
    if (host_end == std::string::npos) host_end = url.size();
    if (host_start >= host_end) return std::nullopt;

    return url.substr(host_start, host_end - host_start);
}

std::optional<int> UrlUtils::get_port(const std::string& url) {
    const auto host = get_host(url);
    if (!host) return std::nullopt;

    const auto port_pos = authority_start(url) + host->size();
    if (port_pos >= url.size() || url[port_pos] != ':') {
        const auto scheme = get_scheme(url);
        if (scheme == "http") return 80;
        if (scheme == "https") return 443;
        return std::nullopt;
    }

    auto port_end = url.find_first_of("/?#", port_pos);
    if (port_end == std::string::npos) port_end = url.size();

    int port = 0;
    const char* first = url.data() + port_pos + 1;
    const char* last = url.data() + port_end;
    const auto [ptr, ec] = std::from_chars(first, last, port);
    if (ec != std::errc{} || ptr != last || port <= 0 || port > 65535) {
        return std::nullopt;
    }
    return port;
}

std::optional<std::string> UrlUtils::get_scheme(const std::string& url) {
    const auto colon = url.find(':');
    if (colon == std::string::npos || colon == 0) {
        return std::nullopt;
    }
    std::string scheme = url.substr(0, colon);
    for (auto& c : scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return scheme;
}

std::string UrlUtils::get_path(const std::string& url) {
    const auto start = authority_start(url);
    if (start == std::string::npos) return {};

    const auto path_start = url.find_first_of("/?#", start);
    if (path_start == std::string::npos || url[path_start] != '/') return "/";
    const auto path_end = url.find_first_of("?#", path_start);
    return url.substr(path_start, path_end == std::string::npos ? std::string::npos
                                                                : path_end - path_start);
}

std::string UrlUtils::get_query(const std::string& url) {
    const auto query_start = url.find('?');
    if (query_start == std::string::npos) return {};
    const auto query_end = url.find('#', query_start);
    return url.substr(query_start + 1, query_end == std::string::npos ? std::string::npos
                                                                      : query_end - query_start - 1);
}

} // namespace utils
} // namespace listen_along
