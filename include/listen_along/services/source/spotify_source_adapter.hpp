#pragma once

#include "listen_along/services/source/source_adapter.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace listen_along::services {

class SpotifyClient;

// Streaming-service source (FallbackSource), read from the Web API.
class SpotifySourceAdapter : public SourceAdapter {
public:
    explicit SpotifySourceAdapter(std::shared_ptr<SpotifyClient> client);

    std::expected<std::optional<core::TrackSnapshot>, core::AdapterProbeError> probe() override;
    std::string name() const override { return "Spotify"; }
    core::SourceId source_id() const override { return core::SourceId::FallbackSource; }

private:
    std::shared_ptr<SpotifyClient> m_client;

    // Cover art for the last album seen
    std::string m_cover_album_id;
    std::optional<std::vector<std::uint8_t>> m_cover;

    std::optional<std::vector<std::uint8_t>> cover_for(const std::string& album_id, const std::string& image_url);
};

} // namespace listen_along::services
