#pragma once

#include "listen_along/core/models.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace listen_along::services {

class HttpClient;

// Somewhere that turns image bytes into a public URL.
class ImageHost {
public:
    virtual ~ImageHost() = default;
    virtual std::expected<std::string, core::UploadError> upload(const std::vector<std::uint8_t>& bytes) = 0;
};

// Anonymous uploads to catbox.moe.
class CatboxImageHost : public ImageHost {
public:
    static constexpr std::size_t MAX_RESPONSE_LENGTH = 500;

    CatboxImageHost(std::shared_ptr<HttpClient> http_client, core::ArtworkConfig config);

    std::expected<std::string, core::UploadError> upload(const std::vector<std::uint8_t>& bytes) override;

    static bool is_acceptable_url(const std::string& body);

private:
    std::shared_ptr<HttpClient> m_http_client;
    core::ArtworkConfig m_config;
};

/**
 * @brief Publishes cover art through an ImageHost, caching URLs by track identity.
 *
 * The cache is consulted before any I/O and written only after a confirmed
 * upload. Failures are returned as-is; the publisher never retries.
 */
class ArtworkPublisher {
public:
    explicit ArtworkPublisher(std::shared_ptr<ImageHost> host);

    std::expected<std::string, core::UploadError> publish(const std::string& cache_key,
                                                          const std::vector<std::uint8_t>& bytes);

    std::optional<std::string> cached(const std::string& cache_key) const;
    std::size_t cache_size() const;

private:
    std::shared_ptr<ImageHost> m_host;

    mutable std::mutex m_cache_mutex;
    std::unordered_map<std::string, std::string> m_cache;
};

} // namespace listen_along::services
