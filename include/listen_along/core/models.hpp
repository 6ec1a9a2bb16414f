#pragma once

#include "listen_along/utils/logger.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace listen_along {
namespace core {

// ============================================================================
// Application-wide types
// ============================================================================

enum class ApplicationState {
    NotInitialized,
    Initializing,
    Running,
    Stopping,
    Stopped,
    Error
};

enum class ApplicationError {
    InitializationFailed,
    ServiceUnavailable,
    ConfigurationError,
    AlreadyRunning,
    StartupConnectFailed,
    ShutdownFailed
};

enum class ConfigError {
    FileNotFound,
    InvalidFormat,
    ValidationError,
    PermissionDenied
};

enum class ValidationError {
    EmptyClientId,
    InvalidClientId,
    InvalidPollInterval,
    InvalidConnectAttempts,
    MissingSpotifyCredentials,
    InvalidUrl
};

std::string to_string(ValidationError error);

struct ConfigLimits {
    static constexpr std::chrono::seconds MIN_POLL_INTERVAL{1};
    static constexpr std::chrono::seconds MAX_POLL_INTERVAL{300};
    static constexpr int MIN_CONNECT_ATTEMPTS = 1;
    static constexpr int MAX_CONNECT_ATTEMPTS = 20;
};

// ============================================================================
// Domain errors
// ============================================================================

// A source could not be read this tick. Never used for "nothing playing".
enum class AdapterProbeError {
    Unavailable,
    TransportFailed,
    Unauthorized,
    InvalidResponse
};

enum class UploadError {
    EmptyPayload,
    TooLarge,
    TransportFailed,
    RejectedResponse
};

enum class SessionError {
    NotConnected,
    ConnectFailed,
    IpcError,
    InvalidPayload,
    Timeout
};

enum class PlaybackError {
    NotAuthorized,
    NoActiveDevice,
    PremiumRequired,
    TrackNotFound,
    ServerError,
    NetworkError
};

enum class DeepLinkError {
    InvalidUri,
    MissingTrack
};

std::string to_string(AdapterProbeError error);
std::string to_string(UploadError error);
std::string to_string(SessionError error);
std::string to_string(PlaybackError error);
std::string to_string(ApplicationError error);

// ============================================================================
// Track model
// ============================================================================

// Sources in fixed priority order.
enum class SourceId {
    PrimarySource,   // OS media session (MPRIS)
    FallbackSource   // streaming web API (Spotify)
};

std::string to_string(SourceId source);

struct TrackSnapshot {
    std::string title;
    std::string artist;
    std::optional<std::string> album;
    std::optional<std::vector<std::uint8_t>> artwork_bytes;
    SourceId source_id = SourceId::PrimarySource;
    std::optional<std::int64_t> position_ms;
    std::optional<std::int64_t> duration_ms;
    bool is_playing = false;

    // Streaming-service identity, e.g. a Spotify track id.
    std::optional<std::string> service_track_id;
};

// Reconciliation identity: title, artist and source only.
bool same_track(const TrackSnapshot& lhs, const TrackSnapshot& rhs);
bool same_track(const std::optional<TrackSnapshot>& lhs, const std::optional<TrackSnapshot>& rhs);

// Stable across runs; never depends on artwork bytes.
std::string artwork_cache_key(const TrackSnapshot& snapshot);

enum class PresenceState {
    Idle,     // nothing published
    Active,   // a track is published
    Paused    // publishing suspended by the user
};

std::string to_string(PresenceState state);

struct PublishedState {
    std::optional<TrackSnapshot> last_snapshot;
    std::optional<std::string> artwork_url;
    std::optional<std::string> artwork_cache_key;
    bool connected = false;
};

// ============================================================================
// Configuration structures
// ============================================================================

struct DiscordConfig {
    std::string client_id;
    std::string asset_key = "music";
    bool show_progress = true;
    bool enable_invites = true;
    bool auto_accept_join_requests = true;
    std::string party_id = "listen-along-session";

    std::string details_format = "{title}";
    std::string state_format = "by {artist}";
    std::string large_image_text_format = "{album}";

    std::expected<void, ValidationError> validate() const;
};

struct StartupConfig {
    int connect_attempts = 3;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{10000};

    std::expected<void, ValidationError> validate() const;
};

struct MediaSessionConfig {
    bool enabled = true;
    // Substring of the MPRIS bus name, e.g. "spotify" or "rhythmbox". Empty accepts any player.
    std::string player_filter;
};

struct SpotifyConfig {
    bool enabled = false;
    std::string client_id;
    std::string client_secret;
    std::string redirect_uri = "http://localhost:8888/callback";
};

struct SourcesConfig {
    std::chrono::seconds poll_interval{5};
    MediaSessionConfig media_session;
    SpotifyConfig spotify;

    std::expected<void, ValidationError> validate() const;
};

struct ArtworkConfig {
    bool enabled = true;
    std::string upload_url = "https://catbox.moe/user/api.php";
    std::size_t max_upload_bytes = 20 * 1024 * 1024;
    std::chrono::seconds timeout{10};

    std::expected<void, ValidationError> validate() const;
};

struct DeepLinkConfig {
    std::string web_search_url = "https://open.spotify.com/search/{query}";
    std::chrono::milliseconds latency_offset{1500};
    bool register_discord_launch = true;
};

struct ApplicationConfig {
    DiscordConfig discord;
    StartupConfig startup;
    SourcesConfig sources;
    ArtworkConfig artwork;
    DeepLinkConfig deep_link;

    listen_along::utils::LogLevel log_level = listen_along::utils::LogLevel::Info;

    std::expected<void, ValidationError> validate() const;

    std::string version_string() const;
    int version_major() const;
    int version_minor() const;
    int version_patch() const;
};

} // namespace core
} // namespace listen_along
