#pragma once

#include "listen_along/core/models.hpp"
#include "listen_along/services/deep_link/playback_service.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace listen_along {
namespace services {

class HttpClient;
class SpotifyAuthenticator;

struct SpotifyTrack {
    std::string id;
    std::string uri;
    std::string name;
    std::vector<std::string> artists;
    std::string album;
    std::string album_id;
    std::string image_url;
    std::int64_t duration_ms = 0;

    static std::optional<SpotifyTrack> from_json(const nlohmann::json& item);
};

struct CurrentlyPlaying {
    SpotifyTrack track;
    std::int64_t progress_ms = 0;
    bool is_playing = false;
};

/**
 * @brief Spotify Web API calls used by the streaming source and listen-along playback.
 */
class SpotifyClient : public PlaybackService {
public:
    static constexpr const char* API_BASE = "https://api.spotify.com/v1";

    SpotifyClient(std::shared_ptr<HttpClient> http_client,
                  std::shared_ptr<SpotifyAuthenticator> authenticator);

    // nullopt when nothing (or a non-track item such as an ad) is playing.
    std::expected<std::optional<CurrentlyPlaying>, core::PlaybackError> currently_playing();

    std::expected<std::vector<SpotifyTrack>, core::PlaybackError> search_tracks(const std::string& query, int limit);

    std::expected<std::vector<std::uint8_t>, core::PlaybackError> fetch_image(const std::string& url);

    // PlaybackService
    bool has_active_session() override;
    std::expected<std::string, core::PlaybackError> find_track(const std::string& title,
                                                               const std::string& artist) override;
    std::expected<void, core::PlaybackError> start_playback(const std::string& track_uri,
                                                            std::chrono::milliseconds position) override;
    std::string track_uri(const std::string& track_id) const override;

    // Lowercases and strips edition/remaster/feat. noise for comparison.
    static std::string normalize(const std::string& text);

    // First item whose normalized title and artists overlap the query.
    static std::optional<SpotifyTrack> pick_match(const std::vector<SpotifyTrack>& items,
                                                  const std::string& title,
                                                  const std::string& artist);

    static core::PlaybackError map_status(int status);

private:
    std::shared_ptr<HttpClient> m_http_client;
    std::shared_ptr<SpotifyAuthenticator> m_authenticator;

    std::expected<nlohmann::json, core::PlaybackError> api_get(const std::string& path);
};

} // namespace services
} // namespace listen_along
