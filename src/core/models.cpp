#include "listen_along/core/models.hpp"
#include "listen_along/utils/url_utils.hpp"
#include "version.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace listen_along {
namespace core {

namespace {
    constexpr std::uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
    constexpr std::uint64_t FNV_PRIME = 0x100000001b3ULL;

    void fnv1a(std::uint64_t& hash, std::string_view data) {
        for (unsigned char c : data) {
            hash ^= c;
            hash *= FNV_PRIME;
        }
    }
}

std::string to_string(SourceId source) {
    switch (source) {
        case SourceId::PrimarySource: return "media-session";
        case SourceId::FallbackSource: return "spotify";
    }
    return "unknown";
}

std::string to_string(PresenceState state) {
    switch (state) {
        case PresenceState::Idle: return "idle";
        case PresenceState::Active: return "active";
        case PresenceState::Paused: return "paused";
    }
    return "unknown";
}

std::string to_string(AdapterProbeError error) {
    switch (error) {
        case AdapterProbeError::Unavailable: return "source unavailable";
        case AdapterProbeError::TransportFailed: return "transport failed";
        case AdapterProbeError::Unauthorized: return "not authorized";
        case AdapterProbeError::InvalidResponse: return "invalid response";
    }
    return "unknown";
}

std::string to_string(UploadError error) {
    switch (error) {
        case UploadError::EmptyPayload: return "empty payload";
        case UploadError::TooLarge: return "payload too large";
        case UploadError::TransportFailed: return "transport failed";
        case UploadError::RejectedResponse: return "host rejected upload";
    }
    return "unknown";
}

std::string to_string(SessionError error) {
    switch (error) {
        case SessionError::NotConnected: return "not connected";
        case SessionError::ConnectFailed: return "connect failed";
        case SessionError::IpcError: return "IPC error";
        case SessionError::InvalidPayload: return "invalid payload";
        case SessionError::Timeout: return "timeout";
    }
    return "unknown";
}

std::string to_string(PlaybackError error) {
    switch (error) {
        case PlaybackError::NotAuthorized: return "not authorized";
        case PlaybackError::NoActiveDevice: return "no active device";
        case PlaybackError::PremiumRequired: return "premium required";
        case PlaybackError::TrackNotFound: return "track not found";
        case PlaybackError::ServerError: return "server error";
        case PlaybackError::NetworkError: return "network error";
    }
    return "unknown";
}

std::string to_string(ApplicationError error) {
    switch (error) {
        case ApplicationError::InitializationFailed: return "initialization failed";
        case ApplicationError::ServiceUnavailable: return "service unavailable";
        case ApplicationError::ConfigurationError: return "configuration error";
        case ApplicationError::AlreadyRunning: return "already running";
        case ApplicationError::StartupConnectFailed: return "could not connect to Discord";
        case ApplicationError::ShutdownFailed: return "shutdown failed";
    }
    return "unknown";
}

std::string to_string(ValidationError error) {
    switch (error) {
        case ValidationError::EmptyClientId: return "discord.client_id is empty";
        case ValidationError::InvalidClientId: return "discord.client_id must be numeric";
        case ValidationError::InvalidPollInterval: return "sources.poll_interval_seconds out of range";
        case ValidationError::InvalidConnectAttempts: return "startup.connect_attempts out of range";
        case ValidationError::MissingSpotifyCredentials: return "sources.spotify needs client_id and client_secret";
        case ValidationError::InvalidUrl: return "invalid URL";
    }
    return "unknown";
}

bool same_track(const TrackSnapshot& lhs, const TrackSnapshot& rhs) {
    return lhs.title == rhs.title
        && lhs.artist == rhs.artist
        && lhs.source_id == rhs.source_id;
}

bool same_track(const std::optional<TrackSnapshot>& lhs, const std::optional<TrackSnapshot>& rhs) {
    if (!lhs || !rhs) {
        return lhs.has_value() == rhs.has_value();
    }
    return same_track(*lhs, *rhs);
}

std::string artwork_cache_key(const TrackSnapshot& snapshot) {
    const auto source = to_string(snapshot.source_id);

    std::uint64_t hash = FNV_OFFSET_BASIS;
    fnv1a(hash, snapshot.title);
    fnv1a(hash, "\x1f");
    fnv1a(hash, snapshot.artist);
    fnv1a(hash, "\x1f");
    fnv1a(hash, source);

    char digest[17];
    std::snprintf(digest, sizeof(digest), "%016llx", static_cast<unsigned long long>(hash));
    return source + "-" + digest;
}

std::expected<void, ValidationError> DiscordConfig::validate() const {
    if (client_id.empty()) {
        return std::unexpected(ValidationError::EmptyClientId);
    }

    // Discord application ids are snowflakes
    const bool numeric = std::all_of(client_id.begin(), client_id.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!numeric) {
        return std::unexpected(ValidationError::InvalidClientId);
    }

    return {};
}

std::expected<void, ValidationError> StartupConfig::validate() const {
    if (connect_attempts < ConfigLimits::MIN_CONNECT_ATTEMPTS ||
        connect_attempts > ConfigLimits::MAX_CONNECT_ATTEMPTS) {
        return std::unexpected(ValidationError::InvalidConnectAttempts);
    }
    return {};
}

std::expected<void, ValidationError> SourcesConfig::validate() const {
    if (poll_interval < ConfigLimits::MIN_POLL_INTERVAL ||
        poll_interval > ConfigLimits::MAX_POLL_INTERVAL) {
        return std::unexpected(ValidationError::InvalidPollInterval);
    }

    if (spotify.enabled && (spotify.client_id.empty() || spotify.client_secret.empty())) {
        return std::unexpected(ValidationError::MissingSpotifyCredentials);
    }

    if (spotify.enabled && !utils::UrlUtils::is_valid_url(spotify.redirect_uri)) {
        return std::unexpected(ValidationError::InvalidUrl);
    }

    return {};
}

std::expected<void, ValidationError> ArtworkConfig::validate() const {
    if (enabled && !utils::UrlUtils::is_valid_url(upload_url)) {
        return std::unexpected(ValidationError::InvalidUrl);
    }
    return {};
}

std::expected<void, ValidationError> ApplicationConfig::validate() const {
    if (auto result = discord.validate(); !result) {
        return result;
    }
    if (auto result = startup.validate(); !result) {
        return result;
    }
    if (auto result = sources.validate(); !result) {
        return result;
    }
    return artwork.validate();
}

std::string ApplicationConfig::version_string() const {
    return LISTEN_ALONG_VERSION_STRING;
}

int ApplicationConfig::version_major() const {
    return LISTEN_ALONG_VERSION_MAJOR;
}

int ApplicationConfig::version_minor() const {
    return LISTEN_ALONG_VERSION_MINOR;
}

int ApplicationConfig::version_patch() const {
    return LISTEN_ALONG_VERSION_PATCH;
}

} // namespace core
} // namespace listen_along
