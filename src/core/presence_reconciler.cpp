#include "listen_along/core/presence_reconciler.hpp"
#include "listen_along/core/events.hpp"
#include "listen_along/services/artwork/artwork_publisher.hpp"
#include "listen_along/services/presence/presence_session.hpp"
#include "listen_along/utils/logger.hpp"

namespace listen_along {
namespace core {

PresenceReconciler::PresenceReconciler(std::shared_ptr<services::PresenceSession> session,
                                       std::shared_ptr<services::ArtworkPublisher> artwork,
                                       services::PresenceBuilder builder,
                                       std::shared_ptr<EventBus> event_bus,
                                       PublishedState initial_state,
                                       Clock clock)
    : m_session(std::move(session))
    , m_artwork(std::move(artwork))
    , m_builder(std::move(builder))
    , m_event_bus(std::move(event_bus))
    , m_clock(std::move(clock))
    , m_published(std::move(initial_state)) {
    if (m_published.last_snapshot) {
        m_state = PresenceState::Active;
    }
}

void PresenceReconciler::tick(const std::optional<TrackSnapshot>& snapshot) {
    if (m_state == PresenceState::Paused || m_shut_down) {
        return;
    }

    if (!snapshot) {
        if (m_published.last_snapshot) {
            clear_remote("nothing playing");
        }
        if (!m_published.last_snapshot) {
            set_state(PresenceState::Idle);
        }
        return;
    }

    if (same_track(*snapshot, m_published.last_snapshot)) {
        if (!session_alive()) {
            republish(*snapshot);
            return;
        }
        retry_artwork(*snapshot);
        return;
    }

    publish_track(*snapshot);
}

void PresenceReconciler::publish_track(const TrackSnapshot& snapshot) {
    LOG_INFO("Reconciler", "Now playing: " + snapshot.title + " by " + snapshot.artist +
             " (" + to_string(snapshot.source_id) + ")");

    auto artwork_url = upload_artwork(snapshot);
    auto data = m_builder.from_track(snapshot, artwork_url, m_clock());

    auto result = call_with_reconnect([this, &data] { return m_session->update(data); });
    if (!result) {
        // last_snapshot stays as it was, so the next tick tries again
        LOG_WARNING("Reconciler", "Presence update failed: " + to_string(result.error()));
        return;
    }

    m_published.last_snapshot = snapshot;
    m_published.artwork_url = artwork_url;
    m_published.artwork_cache_key = artwork_cache_key(snapshot);
    m_artwork_retries = 0;
    m_ticks_since_ping = 0;

    set_state(PresenceState::Active);
    emit(events::TrackPublished(snapshot, artwork_url));
}

void PresenceReconciler::retry_artwork(const TrackSnapshot& snapshot) {
    if (m_published.artwork_url || !m_artwork || !snapshot.artwork_bytes || snapshot.artwork_bytes->empty()) {
        return;
    }
    if (m_artwork_retries >= MAX_ARTWORK_RETRIES) {
        return;
    }

    ++m_artwork_retries;
    LOG_DEBUG("Reconciler", "Retrying artwork upload (" + std::to_string(m_artwork_retries) + "/" +
              std::to_string(MAX_ARTWORK_RETRIES) + ")");

    auto artwork_url = upload_artwork(snapshot);
    if (!artwork_url) {
        return;
    }

    auto data = m_builder.from_track(snapshot, artwork_url, m_clock());
    auto result = call_with_reconnect([this, &data] { return m_session->update(data); });
    if (!result) {
        LOG_WARNING("Reconciler", "Artwork update failed: " + to_string(result.error()));
        return;
    }

    m_published.artwork_url = artwork_url;
    emit(events::TrackPublished(snapshot, artwork_url));
}

bool PresenceReconciler::session_alive() {
    if (!m_session->is_connected()) {
        return false;
    }
    if (++m_ticks_since_ping < LIVENESS_CHECK_TICKS) {
        return true;
    }
    m_ticks_since_ping = 0;

    auto alive = m_session->ping();
    if (alive) {
        return true;
    }
    if (alive.error() != SessionError::NotConnected) {
        LOG_DEBUG("Reconciler", "Liveness check inconclusive: " + to_string(alive.error()));
        return true;
    }
    return false;
}

void PresenceReconciler::republish(const TrackSnapshot& snapshot) {
    LOG_INFO("Reconciler", "Presence session dropped, republishing " + snapshot.title);
    set_connected(false, "connection lost");

    auto data = m_builder.from_track(snapshot, m_published.artwork_url, m_clock());
    auto result = call_with_reconnect([this, &data] { return m_session->update(data); });
    if (!result) {
        // The next tick finds the session down and tries again
        LOG_WARNING("Reconciler", "Republish failed: " + to_string(result.error()));
        return;
    }
    m_ticks_since_ping = 0;
}

std::optional<std::string> PresenceReconciler::upload_artwork(const TrackSnapshot& snapshot) {
    if (!m_artwork || !snapshot.artwork_bytes || snapshot.artwork_bytes->empty()) {
        return std::nullopt;
    }

    auto url = m_artwork->publish(artwork_cache_key(snapshot), *snapshot.artwork_bytes);
    if (!url) {
        LOG_WARNING("Reconciler", "Artwork upload failed: " + to_string(url.error()));
        return std::nullopt;
    }
    return *url;
}

void PresenceReconciler::clear_remote(const std::string& reason) {
    auto result = call_with_reconnect([this] { return m_session->clear(); });
    if (!result) {
        if (m_session->is_connected()) {
            // Discord may still show the track; keep it so the next tick clears again
            LOG_WARNING("Reconciler", "Presence clear failed, will retry: " + to_string(result.error()));
            return;
        }
        // A closed connection drops the activity on Discord's side as well
        LOG_INFO("Reconciler", "Presence clear failed on a closed connection: " + to_string(result.error()));
    }

    m_published.last_snapshot.reset();
    m_published.artwork_url.reset();
    m_published.artwork_cache_key.reset();
    m_artwork_retries = 0;

    emit(events::PresenceCleared(reason));
}

std::expected<void, SessionError> PresenceReconciler::call_with_reconnect(
        const std::function<std::expected<void, SessionError>()>& call) {
    auto result = call();
    if (result) {
        set_connected(true);
        return result;
    }
    if (result.error() != SessionError::NotConnected) {
        return result;
    }

    LOG_INFO("Reconciler", "Presence session not connected, reconnecting");
    auto connected = m_session->connect();
    if (!connected) {
        set_connected(false, "reconnect failed: " + to_string(connected.error()));
        return std::unexpected(connected.error());
    }
    set_connected(true);

    result = call();
    if (!result && result.error() == SessionError::NotConnected) {
        set_connected(false, "connection lost");
    }
    return result;
}

void PresenceReconciler::pause() {
    if (m_shut_down) return;
    LOG_INFO("Reconciler", "Presence updates paused");
    set_state(PresenceState::Paused);
}

void PresenceReconciler::resume() {
    if (m_shut_down || m_state != PresenceState::Paused) return;
    LOG_INFO("Reconciler", "Presence updates resumed");
    set_state(m_published.last_snapshot ? PresenceState::Active : PresenceState::Idle);
}

void PresenceReconciler::clear() {
    if (m_shut_down) return;

    LOG_INFO("Reconciler", "Clearing presence");
    if (m_published.last_snapshot && m_session->is_connected()) {
        if (auto result = m_session->clear(); !result) {
            LOG_WARNING("Reconciler", "Presence clear failed: " + to_string(result.error()));
        }
    }
    m_session->disconnect();

    // Deliberate disconnect: no SessionStatusChanged, the next track reconnects lazily
    m_published = PublishedState{};
    m_artwork_retries = 0;
    m_ticks_since_ping = 0;

    set_state(PresenceState::Idle);
    emit(events::PresenceCleared("cleared by user"));
}

void PresenceReconciler::shutdown() {
    if (m_shut_down) return;
    m_shut_down = true;

    if (m_published.last_snapshot && m_session->is_connected()) {
        LOG_INFO("Reconciler", "Clearing presence before exit");
        if (auto result = m_session->clear(); !result) {
            LOG_WARNING("Reconciler", "Presence clear on exit failed: " + to_string(result.error()));
        }
    }
    m_session->disconnect();

    m_published = PublishedState{};
    m_state = PresenceState::Idle;
}

void PresenceReconciler::set_state(PresenceState state) {
    if (state == m_state) return;

    const auto previous = m_state;
    m_state = state;
    LOG_DEBUG("Reconciler", "State " + to_string(previous) + " -> " + to_string(state));
    emit(events::ReconcilerStateChanged(previous, state));
}

void PresenceReconciler::set_connected(bool connected, const std::string& reason) {
    if (connected == m_published.connected) return;

    m_published.connected = connected;
    if (connected) {
        emit(events::SessionStatusChanged::up());
    } else {
        LOG_WARNING("Reconciler", "Presence session down: " + reason);
        emit(events::SessionStatusChanged::down(reason));
    }
}

} // namespace core
} // namespace listen_along
