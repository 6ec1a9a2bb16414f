#include "listen_along/services/artwork/artwork_publisher.hpp"
#include "listen_along/services/network/http_client.hpp"
#include "listen_along/services/network/request_builder.hpp"
#include "listen_along/utils/logger.hpp"
#include "listen_along/utils/url_utils.hpp"

#include <algorithm>
#include <cctype>

namespace listen_along::services {

namespace {
    std::string trim(const std::string& text) {
        const auto first = std::find_if_not(text.begin(), text.end(),
            [](unsigned char c) { return std::isspace(c) != 0; });
        const auto last = std::find_if_not(text.rbegin(), text.rend(),
            [](unsigned char c) { return std::isspace(c) != 0; }).base();
        return first < last ? std::string(first, last) : std::string{};
    }
}

// ============================================================================
// CatboxImageHost
// ============================================================================

CatboxImageHost::CatboxImageHost(std::shared_ptr<HttpClient> http_client, core::ArtworkConfig config)
    : m_http_client(std::move(http_client))
    , m_config(std::move(config)) {}

bool CatboxImageHost::is_acceptable_url(const std::string& body) {
    if (body.empty() || body.size() >= MAX_RESPONSE_LENGTH) {
        return false;
    }
    if (!utils::UrlUtils::is_valid_url(body)) {
        return false;
    }
    return body.find("catbox.moe") != std::string::npos;
}

std::expected<std::string, core::UploadError> CatboxImageHost::upload(const std::vector<std::uint8_t>& bytes) {
    if (bytes.empty()) {
        return std::unexpected(core::UploadError::EmptyPayload);
    }
    if (bytes.size() > m_config.max_upload_bytes) {
        LOG_WARNING("Catbox", "Artwork is " + std::to_string(bytes.size()) + " bytes, over the upload limit");
        return std::unexpected(core::UploadError::TooLarge);
    }

    auto request = RequestBuilder(m_config.upload_url)
        .method(HttpMethod::POST)
        .part({"reqtype", "fileupload", std::nullopt, std::nullopt})
        .part({"fileToUpload", std::string(bytes.begin(), bytes.end()), "cover.jpg", "image/jpeg"})
        .timeout(m_config.timeout)
        .build();

    auto response = m_http_client->execute(request);
    if (!response) {
        LOG_WARNING("Catbox", "Upload failed: " + to_string(response.error()));
        return std::unexpected(core::UploadError::TransportFailed);
    }
    if (!response->is_success()) {
        LOG_WARNING("Catbox", "Upload returned HTTP " + std::to_string(response->status()));
        return std::unexpected(core::UploadError::TransportFailed);
    }

    auto url = trim(response->body);
    if (!is_acceptable_url(url)) {
        LOG_WARNING("Catbox", "Unexpected upload response: " + url.substr(0, 100));
        return std::unexpected(core::UploadError::RejectedResponse);
    }

    LOG_DEBUG("Catbox", "Uploaded artwork to " + url);
    return url;
}

// ============================================================================
// ArtworkPublisher
// ============================================================================

ArtworkPublisher::ArtworkPublisher(std::shared_ptr<ImageHost> host)
    : m_host(std::move(host)) {}

std::expected<std::string, core::UploadError> ArtworkPublisher::publish(const std::string& cache_key,
                                                                        const std::vector<std::uint8_t>& bytes) {
    if (auto hit = cached(cache_key)) {
        LOG_DEBUG("ArtworkPublisher", "Cache hit for " + cache_key);
        return *hit;
    }

    auto url = m_host->upload(bytes);
    if (!url) {
        return std::unexpected(url.error());
    }

    std::lock_guard lock(m_cache_mutex);
    m_cache[cache_key] = *url;
    return *url;
}

std::optional<std::string> ArtworkPublisher::cached(const std::string& cache_key) const {
    std::lock_guard lock(m_cache_mutex);
    if (auto it = m_cache.find(cache_key); it != m_cache.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::size_t ArtworkPublisher::cache_size() const {
    std::lock_guard lock(m_cache_mutex);
    return m_cache.size();
}

} // namespace listen_along::services
