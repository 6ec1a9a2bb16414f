#include "listen_along/services/spotify/spotify_client.hpp"
#include "listen_along/services/spotify/spotify_authenticator.hpp"
#include "listen_along/services/network/http_client.hpp"
#include "listen_along/services/network/request_builder.hpp"
#include "listen_along/utils/json_helper.hpp"
#include "listen_along/utils/logger.hpp"
#include "listen_along/utils/url_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace listen_along {
namespace services {

using json = nlohmann::json;

namespace {

std::string to_lower_trimmed(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    const auto first = out.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = out.find_last_not_of(" \t\r\n");
    return out.substr(first, last - first + 1);
}

bool overlaps(const std::string& a, const std::string& b) {
    return a.find(b) != std::string::npos || b.find(a) != std::string::npos;
}

std::string joined_artists(const SpotifyTrack& track) {
    std::string joined;
    for (const auto& artist : track.artists) {
        if (!joined.empty()) joined += " ";
        joined += artist;
    }
    return to_lower_trimmed(joined);
}

bool artist_matches(const SpotifyTrack& track, const std::string& artist_low) {
    return artist_low.empty() || overlaps(joined_artists(track), artist_low);
}

} // namespace

std::optional<SpotifyTrack> SpotifyTrack::from_json(const json& item) {
    if (!item.is_object()) {
        return std::nullopt;
    }

    auto name = utils::JsonHelper::get_required<std::string>(item, "name");
    if (!name) {
        return std::nullopt;
    }

    SpotifyTrack track;
    // Local files carry "id": null and a spotify:local: uri
    track.id = utils::JsonHelper::get_optional<std::string>(item, "id", "");
    track.name = *name;
    track.uri = utils::JsonHelper::get_optional<std::string>(
        item, "uri", track.id.empty() ? std::string{} : "spotify:track:" + track.id);
    track.duration_ms = utils::JsonHelper::get_optional<std::int64_t>(item, "duration_ms", 0);

    utils::JsonHelper::for_each_in_array(item, "artists", [&track](const json& artist) {
        auto artist_name = utils::JsonHelper::get_optional<std::string>(artist, "name", "");
        if (!artist_name.empty()) {
            track.artists.push_back(std::move(artist_name));
        }
    });

    if (item.contains("album") && item["album"].is_object()) {
        const auto& album = item["album"];
        track.album = utils::JsonHelper::get_optional<std::string>(album, "name", "");
        track.album_id = utils::JsonHelper::get_optional<std::string>(album, "id", "");
        if (utils::JsonHelper::has_array(album, "images")) {
            track.image_url = utils::JsonHelper::get_optional<std::string>(album["images"][0], "url", "");
        }
    }

    return track;
}

SpotifyClient::SpotifyClient(std::shared_ptr<HttpClient> http_client,
                             std::shared_ptr<SpotifyAuthenticator> authenticator)
    : m_http_client(std::move(http_client))
    , m_authenticator(std::move(authenticator)) {}

core::PlaybackError SpotifyClient::map_status(int status) {
    switch (status) {
        case 401: return core::PlaybackError::NotAuthorized;
        case 403: return core::PlaybackError::PremiumRequired;
        case 404: return core::PlaybackError::NoActiveDevice;
        default: return core::PlaybackError::ServerError;
    }
}

std::expected<json, core::PlaybackError> SpotifyClient::api_get(const std::string& path) {
    auto token = m_authenticator->access_token();
    if (!token) {
        return std::unexpected(token.error());
    }

    auto request = RequestBuilder(std::string(API_BASE) + path)
        .method(HttpMethod::GET)
        .bearer_token(*token)
        .build();

    auto response = m_http_client->execute(request);
    if (!response) {
        LOG_DEBUG("SpotifyClient", "GET " + path + " failed: " + to_string(response.error()));
        return std::unexpected(core::PlaybackError::NetworkError);
    }
    if (response->status_code == HttpStatus::NoContent || response->body.empty()) {
        return json();
    }
    if (!response->is_success()) {
        if (response->status_code == HttpStatus::Unauthorized) {
            m_authenticator->invalidate();
        }
        LOG_DEBUG("SpotifyClient", "GET " + path + " returned HTTP " + std::to_string(response->status()));
        return std::unexpected(map_status(response->status()));
    }

    auto parsed = utils::JsonHelper::safe_parse(response->body);
    if (!parsed) {
        LOG_WARNING("SpotifyClient", "Unparseable response for " + path + ": " + parsed.error());
        return std::unexpected(core::PlaybackError::ServerError);
    }
    return *parsed;
}

std::expected<std::optional<CurrentlyPlaying>, core::PlaybackError> SpotifyClient::currently_playing() {
    auto body = api_get("/me/player/currently-playing");
    if (!body) {
        return std::unexpected(body.error());
    }
    if (!body->is_object() || !utils::JsonHelper::has_field(*body, "item")) {
        return std::optional<CurrentlyPlaying>{};
    }
    if (utils::JsonHelper::get_optional<std::string>(*body, "currently_playing_type", "track") != "track") {
        return std::optional<CurrentlyPlaying>{};
    }

    auto track = SpotifyTrack::from_json((*body)["item"]);
    if (!track) {
        return std::optional<CurrentlyPlaying>{};
    }

    CurrentlyPlaying playing;
    playing.track = std::move(*track);
    playing.progress_ms = utils::JsonHelper::get_optional<std::int64_t>(*body, "progress_ms", 0);
    playing.is_playing = utils::JsonHelper::get_optional<bool>(*body, "is_playing", false);
    return std::optional<CurrentlyPlaying>{std::move(playing)};
}

std::expected<std::vector<SpotifyTrack>, core::PlaybackError> SpotifyClient::search_tracks(
        const std::string& query, int limit) {
    const auto path = "/search?" + utils::UrlUtils::build_query_string({
        {"q", query},
        {"type", "track"},
        {"limit", std::to_string(limit)}
    });

    auto body = api_get(path);
    if (!body) {
        return std::unexpected(body.error());
    }

    std::vector<SpotifyTrack> tracks;
    if (body->is_object() && body->contains("tracks")) {
        utils::JsonHelper::for_each_in_array((*body)["tracks"], "items", [&tracks](const json& item) {
            if (auto track = SpotifyTrack::from_json(item)) {
                tracks.push_back(std::move(*track));
            }
        });
    }
    return tracks;
}

std::expected<std::vector<std::uint8_t>, core::PlaybackError> SpotifyClient::fetch_image(const std::string& url) {
    auto response = m_http_client->get(url);
    if (!response || !response->is_success()) {
        LOG_DEBUG("SpotifyClient", "Cover art download failed for " + url);
        return std::unexpected(core::PlaybackError::NetworkError);
    }
    return std::vector<std::uint8_t>(response->body.begin(), response->body.end());
}

bool SpotifyClient::has_active_session() {
    if (!m_authenticator->has_credentials()) {
        return false;
    }
    return m_authenticator->access_token().has_value();
}

std::string SpotifyClient::track_uri(const std::string& track_id) const {
    return "spotify:track:" + track_id;
}

std::expected<std::string, core::PlaybackError> SpotifyClient::find_track(const std::string& title,
                                                                          const std::string& artist) {
    std::string structured = "track:\"" + title + "\"";
    if (!artist.empty()) {
        structured += " artist:\"" + artist + "\"";
    }

    auto results = search_tracks(structured, 5);
    if (!results) {
        return std::unexpected(results.error());
    }
    if (auto match = pick_match(*results, title, artist)) {
        return match->uri;
    }

    const auto norm_title = normalize(title);
    auto plain = norm_title;
    if (!artist.empty()) {
        plain += " " + normalize(artist);
    }
    LOG_DEBUG("SpotifyClient", "Falling back to plain search: " + plain);

    results = search_tracks(plain, 10);
    if (!results) {
        return std::unexpected(results.error());
    }
    if (auto match = pick_match(*results, title, artist)) {
        return match->uri;
    }

    if (!results->empty() && !norm_title.empty()) {
        const auto& top = results->front();
        const auto top_name = normalize(top.name);
        if (!top_name.empty() && (norm_title.starts_with(top_name) || top_name.starts_with(norm_title))) {
            LOG_DEBUG("SpotifyClient", "Accepting top result by prefix: " + top.name);
            return top.uri;
        }
    }

    return std::unexpected(core::PlaybackError::TrackNotFound);
}

std::expected<void, core::PlaybackError> SpotifyClient::start_playback(const std::string& track_uri,
                                                                       std::chrono::milliseconds position) {
    auto token = m_authenticator->access_token();
    if (!token) {
        return std::unexpected(token.error());
    }

    json body = {{"uris", json::array({track_uri})}};
    if (position.count() > 0) {
        body["position_ms"] = position.count();
    }

    auto request = RequestBuilder(std::string(API_BASE) + "/me/player/play")
        .method(HttpMethod::PUT)
        .json_body(body.dump())
        .bearer_token(*token)
        .build();

    auto response = m_http_client->execute(request);
    if (!response) {
        return std::unexpected(core::PlaybackError::NetworkError);
    }
    if (!response->is_success()) {
        const auto error = map_status(response->status());
        if (error == core::PlaybackError::NotAuthorized) {
            m_authenticator->invalidate();
        }
        LOG_WARNING("SpotifyClient", "Playback request failed: " + core::to_string(error));
        return std::unexpected(error);
    }

    LOG_INFO("SpotifyClient", "Playback started: " + track_uri + " at " + std::to_string(position.count()) + " ms");
    return {};
}

std::string SpotifyClient::normalize(const std::string& text) {
    static const std::regex paren_noise(
        R"(\s*[\(\[](?:remaster(?:ed)?(?:\s*\d{4})?|deluxe(?:\s*edition)?|single|bonus|expanded|)"
        R"(anniversary(?:\s*edition)?|live|remix|feat\.?[^\)\]]*|ft\.?[^\)\]]*|with\s+[^\)\]]*|)"
        R"(version|edition|explicit|clean|mono|stereo|radio\s*edit|acoustic|original\s*mix|extended|)"
        R"(instrumental|from\s+[^\)\]]*|prod\.?\s*[^\)\]]*)[^\)\]]*[\)\]])",
        std::regex::ECMAScript | std::regex::icase);

    // hyphen, en dash or em dash followed by an edition keyword
    static const std::regex dash_suffix(
        std::string("\\s*(?:-|\xE2\x80\x93|\xE2\x80\x94)\\s*") +
        R"((?:single|deluxe|remaster(?:ed)?(?:\s*\d{4})?|bonus\s*track|expanded|anniversary|live|remix|)"
        R"(version|edition|explicit|clean|mono|stereo|radio\s*edit|acoustic|original\s*mix|extended|)"
        R"(instrumental|interlude|skit)[\s\S]*$)",
        std::regex::ECMAScript | std::regex::icase);

    auto result = std::regex_replace(text, paren_noise, "");
    result = std::regex_replace(result, dash_suffix, "");
    return to_lower_trimmed(result);
}

std::optional<SpotifyTrack> SpotifyClient::pick_match(const std::vector<SpotifyTrack>& items,
                                                      const std::string& title,
                                                      const std::string& artist) {
    const auto title_norm = normalize(title);
    const auto artist_low = to_lower_trimmed(artist);

    auto exact = std::find_if(items.begin(), items.end(), [&](const SpotifyTrack& item) {
        return normalize(item.name) == title_norm && artist_matches(item, artist_low);
    });
    if (exact != items.end()) {
        return *exact;
    }

    auto partial = std::find_if(items.begin(), items.end(), [&](const SpotifyTrack& item) {
        return overlaps(normalize(item.name), title_norm) && artist_matches(item, artist_low);
    });
    if (partial != items.end()) {
        return *partial;
    }
    return std::nullopt;
}

} // namespace services
} // namespace listen_along
