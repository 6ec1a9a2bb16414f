#pragma once

#include "listen_along/core/models.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace listen_along::services {

// Discord rich presence data
struct PresenceData {
    std::string state;
    std::string details;
    std::string large_image_key;
    std::string large_image_text;

    // 2 = Listening
    int activity_type = 2;

    std::optional<std::chrono::system_clock::time_point> start_timestamp;
    std::optional<std::chrono::system_clock::time_point> end_timestamp;

    struct Party {
        std::string id;
        int current_size = 0;
        int max_size = 0;
        bool operator==(const Party& other) const = default;
    };
    std::optional<Party> party;

    // Listen-along invite handed to whoever presses "Join".
    std::optional<std::string> join_secret;

    bool is_valid() const {
        return !state.empty() || !details.empty() || !large_image_key.empty();
    }

    bool operator==(const PresenceData& other) const = default;
};

class PresenceBuilder {
public:
    struct FormatOptions {
        bool show_progress = true;
        bool enable_invites = true;
        std::string asset_key = "music";
        std::string party_id = "listen-along-session";

        std::string details = "{title}";
        std::string state = "by {artist}";
        std::string large_image_text = "{album}";

        static FormatOptions from_config(const core::DiscordConfig& config);
    };

    PresenceBuilder();
    explicit PresenceBuilder(FormatOptions options);

    // The full update for a track. artwork_url replaces the static asset key when present.
    PresenceData from_track(const core::TrackSnapshot& track,
                            const std::optional<std::string>& artwork_url,
                            std::chrono::system_clock::time_point now) const;

    static nlohmann::json to_json(const PresenceData& data);

    const FormatOptions& options() const { return m_options; }

private:
    FormatOptions m_options;

    void apply_timestamps(PresenceData& data, const core::TrackSnapshot& track,
                          std::chrono::system_clock::time_point now) const;
    void apply_invite(PresenceData& data, const core::TrackSnapshot& track,
                      std::chrono::system_clock::time_point now) const;
};

} // namespace listen_along::services
