#pragma once

#include "listen_along/services/source/source_adapter.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class QString;

namespace listen_along::services {

class HttpClient;

/**
 * @brief Desktop media-session source (PrimarySource) over MPRIS D-Bus.
 *
 * Scans org.mpris.MediaPlayer2.* services on the session bus. A player in
 * "Playing" state wins over paused ones. Cover art is read from file:// URLs
 * directly and downloaded for http(s) URLs, and cached per URL.
 */
class MprisSourceAdapter : public SourceAdapter {
public:
    MprisSourceAdapter(core::MediaSessionConfig config, std::shared_ptr<HttpClient> http_client);
    ~MprisSourceAdapter() override;

    std::expected<std::optional<core::TrackSnapshot>, core::AdapterProbeError> probe() override;
    std::string name() const override { return "MPRIS"; }
    core::SourceId source_id() const override { return core::SourceId::PrimarySource; }

private:
    core::MediaSessionConfig m_config;
    std::shared_ptr<HttpClient> m_http_client;

    std::string m_cover_url;
    std::optional<std::vector<std::uint8_t>> m_cover;

    std::vector<std::string> list_players() const;
    std::optional<core::TrackSnapshot> read_player(const QString& service);
    std::optional<std::vector<std::uint8_t>> cover_for(const std::string& art_url);
};

} // namespace listen_along::services
