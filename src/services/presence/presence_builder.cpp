#include "listen_along/services/presence/presence_builder.hpp"
#include "listen_along/services/deep_link/invite.hpp"
#include "listen_along/utils/format_utils.hpp"

namespace listen_along::services {

using json = nlohmann::json;

namespace {
    // Discord rejects text fields outside 2..128 bytes.
    constexpr std::size_t MIN_FIELD_LENGTH = 2;
    constexpr std::size_t MAX_FIELD_LENGTH = 128;

    std::string fit_field(std::string text, const std::string& fallback) {
        if (text.size() < MIN_FIELD_LENGTH) {
            return fallback;
        }
        return utils::truncate_utf8(text, MAX_FIELD_LENGTH);
    }

    std::int64_t to_epoch_seconds(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }
}

PresenceBuilder::FormatOptions PresenceBuilder::FormatOptions::from_config(const core::DiscordConfig& config) {
    FormatOptions options;
    options.show_progress = config.show_progress;
    options.enable_invites = config.enable_invites;
    options.asset_key = config.asset_key;
    options.party_id = config.party_id;
    options.details = config.details_format;
    options.state = config.state_format;
    options.large_image_text = config.large_image_text_format;
    return options;
}

PresenceBuilder::PresenceBuilder() : PresenceBuilder(FormatOptions{}) {}

PresenceBuilder::PresenceBuilder(FormatOptions options)
    : m_options(std::move(options)) {}

PresenceData PresenceBuilder::from_track(const core::TrackSnapshot& track,
                                         const std::optional<std::string>& artwork_url,
                                         std::chrono::system_clock::time_point now) const {
    core::TrackSnapshot shown = track;
    if (shown.title.size() < MIN_FIELD_LENGTH) shown.title = "Unknown";
    if (shown.artist.size() < MIN_FIELD_LENGTH) shown.artist = "Unknown Artist";

    PresenceData data;
    data.large_image_key = artwork_url.value_or(m_options.asset_key);

    data.details = fit_field(utils::replace_placeholders(m_options.details, shown), shown.title);
    data.state = fit_field(utils::replace_placeholders(m_options.state, shown), "by " + shown.artist);

    auto large_text = m_options.large_image_text.empty()
        ? std::string{} : utils::replace_placeholders(m_options.large_image_text, shown);
    data.large_image_text = fit_field(std::move(large_text), shown.title);

    apply_timestamps(data, track, now);
    apply_invite(data, track, now);

    return data;
}

void PresenceBuilder::apply_timestamps(PresenceData& data, const core::TrackSnapshot& track,
                                       std::chrono::system_clock::time_point now) const {
    const auto position = std::chrono::milliseconds(track.position_ms.value_or(0));
    data.start_timestamp = now - position;

    if (m_options.show_progress && track.duration_ms && *track.duration_ms > 0) {
        data.end_timestamp = *data.start_timestamp + std::chrono::milliseconds(*track.duration_ms);
    }
}

void PresenceBuilder::apply_invite(PresenceData& data, const core::TrackSnapshot& track,
                                   std::chrono::system_clock::time_point now) const {
    if (!m_options.enable_invites) return;

    data.join_secret = format_invite(InvitePayload::from_track(track, now));
    data.party = PresenceData::Party{m_options.party_id, 1, 2};
}

json PresenceBuilder::to_json(const PresenceData& data) {
    json activity;

    if (!data.is_valid()) {
        return activity;
    }

    activity["type"] = data.activity_type;
    activity["status_display_type"] = 2;
    activity["instance"] = true;

    if (!data.details.empty()) activity["details"] = data.details;
    if (!data.state.empty()) activity["state"] = data.state;

    if (!data.large_image_key.empty()) {
        json assets;
        assets["large_image"] = data.large_image_key;
        if (!data.large_image_text.empty()) assets["large_text"] = data.large_image_text;
        activity["assets"] = assets;
    }

    if (data.start_timestamp || data.end_timestamp) {
        json timestamps;
        if (data.start_timestamp) timestamps["start"] = to_epoch_seconds(*data.start_timestamp);
        if (data.end_timestamp) timestamps["end"] = to_epoch_seconds(*data.end_timestamp);
        activity["timestamps"] = timestamps;
    }

    if (data.party && !data.party->id.empty()) {
        activity["party"] = {
            {"id", data.party->id},
            {"size", json::array({data.party->current_size, data.party->max_size})}
        };
    }

    if (data.join_secret && !data.join_secret->empty()) {
        activity["secrets"] = {{"join", *data.join_secret}};
    }

    return activity;
}

} // namespace listen_along::services
