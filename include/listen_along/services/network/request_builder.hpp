#pragma once

#include "listen_along/services/network/http_types.hpp"
#include <chrono>
#include <string>

namespace listen_along {
namespace services {

class RequestBuilder {
public:
    RequestBuilder() = default;
    explicit RequestBuilder(const std::string& url);

    RequestBuilder& method(HttpMethod method);
    RequestBuilder& url(const std::string& url);
    RequestBuilder& header(const std::string& name, const std::string& value);
    RequestBuilder& body(const std::string& body);
    RequestBuilder& json_body(const std::string& json);
    RequestBuilder& form_body(const std::string& urlencoded);
    RequestBuilder& part(MultipartPart part);
    RequestBuilder& timeout(std::chrono::seconds timeout);
    RequestBuilder& basic_auth(const std::string& username, const std::string& password);
    RequestBuilder& bearer_token(const std::string& token);

    HttpRequest build() const;

private:
    HttpRequest m_request;
};

} // namespace services
} // namespace listen_along
