#include "listen_along/services/source/spotify_source_adapter.hpp"
#include "listen_along/services/spotify/spotify_client.hpp"
#include "listen_along/utils/logger.hpp"

namespace listen_along::services {

namespace {
    core::AdapterProbeError to_probe_error(core::PlaybackError error) {
        switch (error) {
            case core::PlaybackError::NotAuthorized:
                return core::AdapterProbeError::Unauthorized;
            case core::PlaybackError::NetworkError:
                return core::AdapterProbeError::TransportFailed;
            case core::PlaybackError::ServerError:
                return core::AdapterProbeError::InvalidResponse;
            default:
                return core::AdapterProbeError::Unavailable;
        }
    }
}

SpotifySourceAdapter::SpotifySourceAdapter(std::shared_ptr<SpotifyClient> client)
    : m_client(std::move(client)) {}

std::expected<std::optional<core::TrackSnapshot>, core::AdapterProbeError> SpotifySourceAdapter::probe() {
    auto playing = m_client->currently_playing();
    if (!playing) {
        return std::unexpected(to_probe_error(playing.error()));
    }
    if (!*playing) {
        return std::optional<core::TrackSnapshot>{};
    }

    const auto& current = **playing;
    const auto& track = current.track;

    core::TrackSnapshot snapshot;
    snapshot.title = track.name;
    snapshot.artist = track.artists.empty() ? std::string{} : track.artists.front();
    if (!track.album.empty()) {
        snapshot.album = track.album;
    }
    snapshot.source_id = core::SourceId::FallbackSource;
    snapshot.position_ms = current.progress_ms;
    if (track.duration_ms > 0) {
        snapshot.duration_ms = track.duration_ms;
    }
    snapshot.is_playing = current.is_playing;
    if (!track.id.empty()) {
        snapshot.service_track_id = track.id;
    }

    // Paused tracks are skipped by the arbitrator; do not download their art
    if (snapshot.is_playing) {
        snapshot.artwork_bytes = cover_for(track.album_id, track.image_url);
    }

    return std::optional<core::TrackSnapshot>{std::move(snapshot)};
}

std::optional<std::vector<std::uint8_t>> SpotifySourceAdapter::cover_for(const std::string& album_id,
                                                                         const std::string& image_url) {
    if (!album_id.empty() && album_id == m_cover_album_id) {
        return m_cover;
    }

    m_cover_album_id = album_id;
    m_cover.reset();

    if (image_url.empty()) {
        return m_cover;
    }

    auto bytes = m_client->fetch_image(image_url);
    if (bytes && !bytes->empty()) {
        m_cover = std::move(*bytes);
    } else {
        LOG_DEBUG("SpotifySource", "No cover art for album " + album_id);
    }
    return m_cover;
}

} // namespace listen_along::services
