#include "listen_along/services/network/http_client.hpp"
#include "listen_along/services/network/request_builder.hpp"
#include "listen_along/utils/url_utils.hpp"

namespace listen_along {
namespace services {

std::string to_string(NetworkError error) {
    switch (error) {
        case NetworkError::ConnectionFailed: return "connection failed";
        case NetworkError::Timeout: return "timeout";
        case NetworkError::DNSResolutionFailed: return "DNS resolution failed";
        case NetworkError::SSLError: return "SSL error";
        case NetworkError::InvalidUrl: return "invalid URL";
        case NetworkError::TooManyRedirects: return "too many redirects";
        case NetworkError::BadResponse: return "bad response";
        case NetworkError::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool HttpRequest::is_valid() const {
    return !url.empty() && utils::UrlUtils::is_valid_url(url);
}

bool HttpResponse::is_success() const {
    return status() >= 200 && status() < 300;
}

bool HttpResponse::is_client_error() const {
    return status() >= 400 && status() < 500;
}

bool HttpResponse::is_server_error() const {
    return status() >= 500 && status() < 600;
}

std::expected<HttpResponse, NetworkError> HttpClient::get(
    const std::string& url, const HttpHeaders& headers) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = url;
    request.headers = headers;
    return execute(request);
}

std::expected<HttpResponse, NetworkError> HttpClient::post(
    const std::string& url, const std::string& body, const HttpHeaders& headers) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = url;
    request.body = body;
    request.headers = headers;
    return execute(request);
}

std::expected<HttpResponse, NetworkError> HttpClient::post_json(
    const std::string& url, const std::string& json_body, const HttpHeaders& headers) {
    HttpHeaders json_headers = headers;
    json_headers["Content-Type"] = "application/json";
    return post(url, json_body, json_headers);
}

RequestBuilder::RequestBuilder(const std::string& url) {
    m_request.url = url;
}

RequestBuilder& RequestBuilder::method(HttpMethod method) {
    m_request.method = method;
    return *this;
}

RequestBuilder& RequestBuilder::url(const std::string& url) {
    m_request.url = url;
    return *this;
}

RequestBuilder& RequestBuilder::header(const std::string& name, const std::string& value) {
    m_request.headers[name] = value;
    return *this;
}

RequestBuilder& RequestBuilder::body(const std::string& body) {
    m_request.body = body;
    return *this;
}

RequestBuilder& RequestBuilder::json_body(const std::string& json) {
    m_request.body = json;
    m_request.headers["Content-Type"] = "application/json";
    return *this;
}

RequestBuilder& RequestBuilder::form_body(const std::string& urlencoded) {
    m_request.body = urlencoded;
    m_request.headers["Content-Type"] = "application/x-www-form-urlencoded";
    return *this;
}

RequestBuilder& RequestBuilder::part(MultipartPart part) {
    m_request.multipart.push_back(std::move(part));
    return *this;
}

RequestBuilder& RequestBuilder::timeout(std::chrono::seconds timeout) {
    m_request.timeout = timeout;
    return *this;
}

RequestBuilder& RequestBuilder::basic_auth(const std::string& username, const std::string& password) {
    m_request.basic_auth = username + ":" + password;
    return *this;
}

RequestBuilder& RequestBuilder::bearer_token(const std::string& token) {
    m_request.bearer_token = token;
    return *this;
}

HttpRequest RequestBuilder::build() const {
    return m_request;
}

} // namespace services
} // namespace listen_along
