#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace listen_along {
namespace services {

enum class HttpMethod {
    GET,
    POST,
    PUT
};

enum class HttpStatus : int {
    OK = 200,
    Created = 201,
    NoContent = 204,
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    TooManyRequests = 429,
    InternalServerError = 500,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504
};

enum class NetworkError {
    ConnectionFailed,
    Timeout,
    DNSResolutionFailed,
    SSLError,
    InvalidUrl,
    TooManyRedirects,
    BadResponse,
    Cancelled
};

std::string to_string(NetworkError error);

using HttpHeaders = std::unordered_map<std::string, std::string>;

// One part of a multipart/form-data body, held in memory.
struct MultipartPart {
    std::string name;
    std::string data;
    std::optional<std::string> filename;
    std::optional<std::string> content_type;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::string body;
    std::vector<MultipartPart> multipart; // sent instead of body when non-empty
    std::optional<std::chrono::seconds> timeout; // client default when unset
    bool follow_redirects = true;
    int max_redirects = 5;

    std::optional<std::string> basic_auth; // "username:password"
    std::optional<std::string> bearer_token;

    bool verify_ssl = true;

    bool is_valid() const;
};

struct HttpResponse {
    HttpStatus status_code = HttpStatus::OK;
    HttpHeaders headers;
    std::string body;
    std::chrono::milliseconds response_time{0};
    std::string final_url;

    int status() const { return static_cast<int>(status_code); }
    bool is_success() const;
    bool is_client_error() const;
    bool is_server_error() const;
};

} // namespace services
} // namespace listen_along
