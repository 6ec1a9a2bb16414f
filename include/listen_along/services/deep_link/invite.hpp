#pragma once

#include "listen_along/core/models.hpp"
#include <chrono>
#include <expected>
#include <optional>
#include <string>

namespace listen_along::services {

inline constexpr const char* INVITE_SCHEME = "listenalong";

// Discord caps secrets at 128 characters.
inline constexpr std::size_t MAX_INVITE_LENGTH = 128;
inline constexpr std::size_t MAX_INVITE_TITLE_BYTES = 50;
inline constexpr std::size_t MAX_INVITE_ARTIST_BYTES = 30;

// What a listen-along invite identifies: a track and when the host started it.
struct InvitePayload {
    std::string title;
    std::string artist;
    std::optional<std::string> spotify_track_id;
    std::optional<std::chrono::system_clock::time_point> started_at;

    static InvitePayload from_track(const core::TrackSnapshot& track,
                                    std::chrono::system_clock::time_point now);
};

// listenalong://sync?at=<epoch s>&sp=<id>&track=<title>&artist=<artist>
std::string format_invite(const InvitePayload& payload);

// Accepts the invite URI itself, a bare secret as delivered by ACTIVITY_JOIN,
// and the discord-<client id>://join/<secret> launch form.
std::expected<InvitePayload, core::DeepLinkError> parse_invite(const std::string& uri);

// True for arguments the OS hands us when one of our schemes is invoked.
bool looks_like_invite_uri(const std::string& argument);

} // namespace listen_along::services
