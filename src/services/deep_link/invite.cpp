#include "listen_along/services/deep_link/invite.hpp"
#include "listen_along/utils/format_utils.hpp"
#include "listen_along/utils/url_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace listen_along::services {

namespace {
    const std::string SCHEME_PREFIX = std::string(INVITE_SCHEME) + "://";
    const std::string DISCORD_SCHEME_PREFIX = "discord-";

    bool starts_with_icase(const std::string& text, const std::string& prefix) {
        if (text.size() < prefix.size()) {
            return false;
        }
        return std::equal(prefix.begin(), prefix.end(), text.begin(),
            [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) ==
                       std::tolower(static_cast<unsigned char>(b));
            });
    }

    bool is_spotify_id(const std::string& id) {
        return id.size() == 22 && std::all_of(id.begin(), id.end(),
            [](unsigned char c) { return std::isalnum(c) != 0; });
    }

    // discord-<digits>://join/<secret> (Discord URL-encodes the secret)
    std::optional<std::string> unwrap_discord_launch(const std::string& uri) {
        if (!starts_with_icase(uri, DISCORD_SCHEME_PREFIX)) {
            return std::nullopt;
        }
        const auto sep = uri.find("://");
        if (sep == std::string::npos) {
            return std::nullopt;
        }
        auto rest = uri.substr(sep + 3);
        if (starts_with_icase(rest, "join/")) {
            rest = rest.substr(5);
        }
        return utils::UrlUtils::decode(rest);
    }
}

InvitePayload InvitePayload::from_track(const core::TrackSnapshot& track,
                                        std::chrono::system_clock::time_point now) {
    InvitePayload payload;
    payload.title = track.title;
    payload.artist = track.artist;
    if (track.source_id == core::SourceId::FallbackSource) {
        payload.spotify_track_id = track.service_track_id;
    }
    payload.started_at = now - std::chrono::milliseconds(track.position_ms.value_or(0));
    return payload;
}

std::string format_invite(const InvitePayload& payload) {
    utils::QueryParams params;
    if (payload.started_at) {
        const auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
            payload.started_at->time_since_epoch()).count();
        params.emplace_back("at", std::to_string(epoch));
    }
    if (payload.spotify_track_id && is_spotify_id(*payload.spotify_track_id)) {
        params.emplace_back("sp", *payload.spotify_track_id);
    }
    params.emplace_back("track", utils::truncate_utf8(payload.title, MAX_INVITE_TITLE_BYTES));
    params.emplace_back("artist", utils::truncate_utf8(payload.artist, MAX_INVITE_ARTIST_BYTES));

    auto uri = SCHEME_PREFIX + "sync?" + utils::UrlUtils::build_query_string(params);
    if (uri.size() > MAX_INVITE_LENGTH) {
        uri.resize(MAX_INVITE_LENGTH);
        // Do not leave a dangling partial %XX escape
        const auto pct = uri.rfind('%');
        if (pct != std::string::npos && pct + 3 > uri.size()) {
            uri.resize(pct);
        }
    }
    return uri;
}

std::expected<InvitePayload, core::DeepLinkError> parse_invite(const std::string& uri) {
    std::string invite = uri;
    if (auto unwrapped = unwrap_discord_launch(uri)) {
        invite = *unwrapped;
    }

    if (!starts_with_icase(invite, SCHEME_PREFIX)) {
        return std::unexpected(core::DeepLinkError::InvalidUri);
    }

    const auto query = utils::UrlUtils::get_query(invite);
    const auto params = utils::UrlUtils::parse_query_string(query);

    InvitePayload payload;
    if (const auto it = params.find("track"); it != params.end()) {
        payload.title = it->second;
    }
    if (const auto it = params.find("artist"); it != params.end()) {
        payload.artist = it->second;
    }
    if (const auto it = params.find("sp"); it != params.end() && is_spotify_id(it->second)) {
        payload.spotify_track_id = it->second;
    }
    if (const auto it = params.find("at"); it != params.end()) {
        long long epoch = 0;
        const auto& value = it->second;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), epoch);
        if (ec == std::errc{} && ptr == value.data() + value.size() && epoch > 0) {
            payload.started_at = std::chrono::system_clock::time_point(std::chrono::seconds(epoch));
        }
    }

    if (payload.title.empty() && !payload.spotify_track_id) {
        return std::unexpected(core::DeepLinkError::MissingTrack);
    }
    return payload;
}

bool looks_like_invite_uri(const std::string& argument) {
    if (starts_with_icase(argument, SCHEME_PREFIX)) {
        return true;
    }
    return starts_with_icase(argument, DISCORD_SCHEME_PREFIX) &&
           argument.find("://") != std::string::npos;
}

} // namespace listen_along::services
