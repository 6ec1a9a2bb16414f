#pragma once

#include "listen_along/core/event_bus.hpp"
#include "listen_along/core/models.hpp"
#include "listen_along/services/presence/presence_builder.hpp"
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace listen_along {
namespace services {
    class ArtworkPublisher;
    class PresenceSession;
}
namespace core {

/**
 * @brief Decides, per tick, whether remote presence is updated, cleared or left alone.
 *
 * Owns the PublishedState. Every method is called from the presence loop
 * thread only.
 *
 * - Paused ignores ticks entirely.
 * - No snapshot clears the remote presence once, on the transition.
 * - A snapshot equal to the published one (title, artist, source) is a no-op,
 *   apart from bounded artwork retries.
 * - A different snapshot uploads artwork (cached) and sends one full update.
 *
 * NotConnected from the session triggers exactly one connect() and one retry.
 * While one track keeps playing the session is pinged every
 * LIVENESS_CHECK_TICKS ticks; a dropped session gets the track republished.
 * A failed clear on a live connection is retried on the next empty tick.
 */
class PresenceReconciler {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr int MAX_ARTWORK_RETRIES = 3;
    static constexpr int LIVENESS_CHECK_TICKS = 6;

    PresenceReconciler(std::shared_ptr<services::PresenceSession> session,
                       std::shared_ptr<services::ArtworkPublisher> artwork,
                       services::PresenceBuilder builder,
                       std::shared_ptr<EventBus> event_bus = nullptr,
                       PublishedState initial_state = {},
                       Clock clock = std::chrono::system_clock::now);

    void tick(const std::optional<TrackSnapshot>& snapshot);

    void pause();
    void resume();

    // Clears remote presence, disconnects and forgets what was published.
    void clear();

    // Idempotent final release.
    void shutdown();

    PresenceState state() const { return m_state; }
    const PublishedState& published() const { return m_published; }
    int artwork_retries() const { return m_artwork_retries; }

private:
    std::shared_ptr<services::PresenceSession> m_session;
    std::shared_ptr<services::ArtworkPublisher> m_artwork;
    services::PresenceBuilder m_builder;
    std::shared_ptr<EventBus> m_event_bus;
    Clock m_clock;

    PublishedState m_published;
    PresenceState m_state = PresenceState::Idle;
    int m_artwork_retries = 0;
    int m_ticks_since_ping = 0;
    bool m_shut_down = false;

    void publish_track(const TrackSnapshot& snapshot);
    void retry_artwork(const TrackSnapshot& snapshot);
    void clear_remote(const std::string& reason);
    bool session_alive();
    void republish(const TrackSnapshot& snapshot);

    std::optional<std::string> upload_artwork(const TrackSnapshot& snapshot);

    std::expected<void, SessionError> call_with_reconnect(
        const std::function<std::expected<void, SessionError>()>& call);

    void set_state(PresenceState state);
    void set_connected(bool connected, const std::string& reason = {});

    template<typename EventType>
    void emit(const EventType& event) {
        if (m_event_bus) {
            m_event_bus->publish(event);
        }
    }
};

} // namespace core
} // namespace listen_along
