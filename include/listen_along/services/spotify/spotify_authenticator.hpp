#pragma once

#include "listen_along/core/models.hpp"
#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace listen_along {
namespace platform {
    class BrowserLauncher;
}
namespace services {

class HttpClient;
class SpotifyAuthStorage;

/**
 * @brief Spotify authorization-code flow.
 *
 * The first authorization opens the browser and captures the redirect on a
 * loopback listener bound to the configured redirect URI. The refresh token
 * is persisted; access tokens are refreshed on demand.
 */
class SpotifyAuthenticator {
public:
    static constexpr const char* AUTHORIZE_URL = "https://accounts.spotify.com/authorize";
    static constexpr const char* TOKEN_URL = "https://accounts.spotify.com/api/token";
    static constexpr const char* SCOPES =
        "user-read-currently-playing user-read-playback-state user-modify-playback-state";

    SpotifyAuthenticator(std::shared_ptr<HttpClient> http_client,
                         std::shared_ptr<SpotifyAuthStorage> storage,
                         core::SpotifyConfig config,
                         std::shared_ptr<platform::BrowserLauncher> browser_launcher = nullptr);

    // A valid access token, refreshing it when expired.
    std::expected<std::string, core::PlaybackError> access_token();

    // Interactive login. Blocks until the redirect arrives or the wait times out.
    std::expected<void, core::PlaybackError> authorize(std::chrono::seconds timeout = std::chrono::minutes(5));

    bool has_credentials() const;

    // Drops the cached access token after the API rejected it.
    void invalidate();

    void shutdown();

    std::string authorization_url(const std::string& state) const;

private:
    std::expected<void, core::PlaybackError> request_token(const std::string& form_body);
    std::expected<std::string, core::PlaybackError> wait_for_code(const std::string& state,
                                                                  std::chrono::seconds timeout);

    std::shared_ptr<HttpClient> m_http_client;
    std::shared_ptr<SpotifyAuthStorage> m_storage;
    core::SpotifyConfig m_config;
    std::shared_ptr<platform::BrowserLauncher> m_browser_launcher;

    std::mutex m_token_mutex;
    std::string m_access_token;
    std::chrono::steady_clock::time_point m_expires_at{};

    std::atomic<bool> m_shutting_down{false};
};

} // namespace services
} // namespace listen_along
