#pragma once

#include "listen_along/core/models.hpp"
#include <chrono>
#include <expected>
#include <string>

namespace listen_along::services {

// A streaming service that can start playback on the user's active device.
class PlaybackService {
public:
    virtual ~PlaybackService() = default;

    virtual bool has_active_session() = 0;

    // Service URI (e.g. spotify:track:<id>) of the best match, or TrackNotFound.
    virtual std::expected<std::string, core::PlaybackError> find_track(const std::string& title,
                                                                       const std::string& artist) = 0;

    virtual std::expected<void, core::PlaybackError> start_playback(const std::string& track_uri,
                                                                    std::chrono::milliseconds position) = 0;

    virtual std::string track_uri(const std::string& track_id) const = 0;
};

} // namespace listen_along::services
