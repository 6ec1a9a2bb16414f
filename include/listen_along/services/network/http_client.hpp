#pragma once

#include "listen_along/services/network/http_types.hpp"
#include <expected>
#include <memory>

namespace listen_along {
namespace services {

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual std::expected<HttpResponse, NetworkError> execute(const HttpRequest& request) = 0;

    // Convenience wrappers around execute()
    std::expected<HttpResponse, NetworkError> get(
        const std::string& url,
        const HttpHeaders& headers = {});

    std::expected<HttpResponse, NetworkError> post(
        const std::string& url,
        const std::string& body,
        const HttpHeaders& headers = {});

    std::expected<HttpResponse, NetworkError> post_json(
        const std::string& url,
        const std::string& json_body,
        const HttpHeaders& headers = {});
};

struct HttpClientConfig {
    std::chrono::seconds default_timeout{15};
    std::string user_agent = "ListenAlong/1.0";
    bool verify_ssl = true;
};

std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config = {});

} // namespace services
} // namespace listen_along
