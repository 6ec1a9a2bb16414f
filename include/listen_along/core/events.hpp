#pragma once

#include "listen_along/core/models.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace listen_along::core::events {

struct Event {
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
    Event() = default;
    virtual ~Event() = default;
};

struct ConfigurationUpdated : Event {
    ApplicationConfig previous_config;
    ApplicationConfig new_config;

    ConfigurationUpdated(ApplicationConfig prev, ApplicationConfig curr)
        : previous_config(std::move(prev)), new_config(std::move(curr)) {}
};

// Connection state of the presence session as seen by the reconciler.
struct SessionStatusChanged : Event {
    bool connected;
    std::string reason;

    static SessionStatusChanged up() {
        return SessionStatusChanged(true, {});
    }

    static SessionStatusChanged down(std::string reason_msg) {
        return SessionStatusChanged(false, std::move(reason_msg));
    }

private:
    SessionStatusChanged(bool is_connected, std::string r)
        : connected(is_connected), reason(std::move(r)) {}
};

struct TrackPublished : Event {
    TrackSnapshot track;
    std::optional<std::string> artwork_url;

    TrackPublished(TrackSnapshot t, std::optional<std::string> url)
        : track(std::move(t)), artwork_url(std::move(url)) {}
};

struct PresenceCleared : Event {
    std::string reason;

    explicit PresenceCleared(std::string r = "")
        : reason(std::move(r)) {}
};

struct ReconcilerStateChanged : Event {
    PresenceState previous_state;
    PresenceState current_state;

    ReconcilerStateChanged(PresenceState prev, PresenceState curr)
        : previous_state(prev), current_state(curr) {}
};

// A listen-along invite arrived from Discord.
struct JoinReceived : Event {
    std::string secret;

    explicit JoinReceived(std::string s)
        : secret(std::move(s)) {}
};

struct ApplicationStarting : Event {
    std::string version;

    explicit ApplicationStarting(std::string ver)
        : version(std::move(ver)) {}
};

struct ApplicationReady : Event {
    std::chrono::milliseconds startup_time;

    explicit ApplicationReady(std::chrono::milliseconds time)
        : startup_time(time) {}
};

struct ApplicationShuttingDown : Event {
    std::string reason;

    explicit ApplicationShuttingDown(std::string r = "User requested")
        : reason(std::move(r)) {}
};

} // namespace listen_along::core::events
