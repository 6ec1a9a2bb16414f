#include "listen_along/services/network/http_client.hpp"
#include "listen_along/utils/logger.hpp"
#include <curl/curl.h>
#include <chrono>

namespace listen_along {
namespace services {

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

static size_t HeaderCallback(char* buffer, size_t size, size_t nitems, HttpHeaders* headers) {
    const size_t total_size = size * nitems;
    std::string line(buffer, total_size);

    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        auto value = line.substr(colon + 1);
        const auto first = value.find_first_not_of(" \t");
        const auto last = value.find_last_not_of(" \t\r\n");
        value = first == std::string::npos ? std::string{} : value.substr(first, last - first + 1);
        (*headers)[line.substr(0, colon)] = value;
    }

    return total_size;
}

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const HttpClientConfig& config) : m_config(config) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~CurlHttpClient() override {
        curl_global_cleanup();
    }

    std::expected<HttpResponse, NetworkError> execute(const HttpRequest& request) override {
        LOG_DEBUG("CurlHttpClient", "Starting HTTP request to: " + request.url);

        if (!request.is_valid()) {
            LOG_ERROR("CurlHttpClient", "Invalid URL provided: " + request.url);
            return std::unexpected<NetworkError>(NetworkError::InvalidUrl);
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            LOG_ERROR("CurlHttpClient", "Failed to initialize curl handle");
            return std::unexpected<NetworkError>(NetworkError::ConnectionFailed);
        }

        HttpResponse response;
        std::string response_body;
        const auto start_time = std::chrono::steady_clock::now();

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        curl_mime* form = setup_method_and_body(curl, request);

        struct curl_slist* header_list = setup_headers(request);
        if (header_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        }

        if (request.basic_auth) {
            curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
            curl_easy_setopt(curl, CURLOPT_USERPWD, request.basic_auth->c_str());
        }

        const auto timeout = request.timeout.value_or(m_config.default_timeout);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(request.max_redirects));

        const bool verify = request.verify_ssl && m_config.verify_ssl;
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);

        const CURLcode res = curl_easy_perform(curl);

        long response_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);

        char* final_url = nullptr;
        curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &final_url);
        response.final_url = final_url ? std::string(final_url) : request.url;

        if (header_list) {
            curl_slist_free_all(header_list);
        }
        if (form) {
            curl_mime_free(form);
        }
        curl_easy_cleanup(curl);

        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (res != CURLE_OK) {
            LOG_ERROR("CurlHttpClient", "HTTP request failed: " + std::string(curl_easy_strerror(res)));
            return std::unexpected<NetworkError>(curl_error_to_network_error(res));
        }

        LOG_DEBUG("CurlHttpClient", "HTTP request completed in " + std::to_string(duration.count()) +
                  "ms with status " + std::to_string(response_code));

        response.status_code = static_cast<HttpStatus>(response_code);
        response.body = std::move(response_body);
        response.response_time = duration;
        return response;
    }

private:
    HttpClientConfig m_config;

    // Returns the mime handle for multipart requests; the caller frees it.
    curl_mime* setup_method_and_body(CURL* curl, const HttpRequest& request) {
        switch (request.method) {
            case HttpMethod::GET:
                return nullptr;
            case HttpMethod::POST:
                if (!request.multipart.empty()) {
                    return setup_multipart(curl, request);
                }
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.length()));
                return nullptr;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.length()));
                return nullptr;
        }
        return nullptr;
    }

    curl_mime* setup_multipart(CURL* curl, const HttpRequest& request) {
        curl_mime* form = curl_mime_init(curl);
        for (const auto& part : request.multipart) {
            curl_mimepart* field = curl_mime_addpart(form);
            curl_mime_name(field, part.name.c_str());
            curl_mime_data(field, part.data.data(), part.data.size());
            if (part.filename) {
                curl_mime_filename(field, part.filename->c_str());
            }
            if (part.content_type) {
                curl_mime_type(field, part.content_type->c_str());
            }
        }
        curl_easy_setopt(curl, CURLOPT_MIMEPOST, form);
        LOG_DEBUG("CurlHttpClient", "Multipart body with " + std::to_string(request.multipart.size()) + " parts");
        return form;
    }

    struct curl_slist* setup_headers(const HttpRequest& request) {
        struct curl_slist* header_list = nullptr;

        for (const auto& [key, value] : request.headers) {
            const std::string header = key + ": " + value;
            header_list = curl_slist_append(header_list, header.c_str());
        }

        if (request.bearer_token) {
            const std::string auth_header = "Authorization: Bearer " + *request.bearer_token;
            header_list = curl_slist_append(header_list, auth_header.c_str());
        }

        if (!m_config.user_agent.empty()) {
            const std::string ua_header = "User-Agent: " + m_config.user_agent;
            header_list = curl_slist_append(header_list, ua_header.c_str());
        }

        return header_list;
    }

    NetworkError curl_error_to_network_error(CURLcode code) {
        switch (code) {
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
                return NetworkError::DNSResolutionFailed;
            case CURLE_COULDNT_CONNECT:
                return NetworkError::ConnectionFailed;
            case CURLE_OPERATION_TIMEDOUT:
                return NetworkError::Timeout;
            case CURLE_SSL_CONNECT_ERROR:
            case CURLE_SSL_CERTPROBLEM:
            case CURLE_SSL_CIPHER:
                return NetworkError::SSLError;
            case CURLE_TOO_MANY_REDIRECTS:
                return NetworkError::TooManyRedirects;
            case CURLE_URL_MALFORMAT:
                return NetworkError::InvalidUrl;
            case CURLE_ABORTED_BY_CALLBACK:
                return NetworkError::Cancelled;
            default:
                return NetworkError::BadResponse;
        }
    }
};

std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config) {
    return std::make_unique<CurlHttpClient>(config);
}

} // namespace services
} // namespace listen_along
