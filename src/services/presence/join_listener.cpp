#include "listen_along/services/presence/join_listener.hpp"
#include "listen_along/services/presence/discord_ipc.hpp"
#include "listen_along/utils/json_helper.hpp"
#include "listen_along/utils/logger.hpp"

#include <exception>

namespace listen_along::services {

using json = nlohmann::json;

DiscordJoinListener::DiscordJoinListener(std::string client_id, JoinCallback on_join, Options options)
    : m_client_id(std::move(client_id))
    , m_on_join(std::move(on_join))
    , m_options(options) {}

DiscordJoinListener::~DiscordJoinListener() {
    stop();
}

void DiscordJoinListener::start() {
    if (m_thread.joinable()) {
        return;
    }
    LOG_DEBUG("JoinListener", "Starting join listener");
    m_thread = std::jthread([this](std::stop_token stop) { run(stop); });
}

void DiscordJoinListener::stop() {
    if (!m_thread.joinable()) {
        return;
    }
    m_thread.request_stop();
    m_wait_cv.notify_all();
    m_thread.join();
    LOG_DEBUG("JoinListener", "Join listener stopped");
}

bool DiscordJoinListener::wait_for(std::stop_token stop, std::chrono::seconds delay) {
    std::unique_lock lock(m_wait_mutex);
    m_wait_cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

void DiscordJoinListener::run(std::stop_token stop) {
    while (!stop.stop_requested()) {
        try {
            DiscordIpc ipc(m_client_id);

            if (!ipc.connect()) {
                LOG_DEBUG("JoinListener", "No Discord pipe found, retrying in " +
                          std::to_string(m_options.no_pipe_retry.count()) + "s");
                if (!wait_for(stop, m_options.no_pipe_retry)) break;
                continue;
            }

            if (subscribe(ipc)) {
                event_loop(ipc, stop);
            }
            ipc.disconnect();
        } catch (const std::exception& e) {
            LOG_ERROR("JoinListener", "Listener connection failed: " + std::string(e.what()));
        }

        if (!wait_for(stop, m_options.error_retry)) break;
    }
}

bool DiscordJoinListener::subscribe(DiscordIpc& ipc) {
    for (const char* evt : {"ACTIVITY_JOIN", "ACTIVITY_JOIN_REQUEST"}) {
        auto reply = ipc.send_command("SUBSCRIBE", json::object(), evt);
        if (!reply) {
            LOG_DEBUG("JoinListener", std::string("Subscribe to ") + evt + " failed: " +
                      core::to_string(reply.error()));
            return false;
        }
    }
    LOG_DEBUG("JoinListener", "Subscribed to join events");
    return true;
}

void DiscordJoinListener::event_loop(DiscordIpc& ipc, std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto message = ipc.read_message(m_options.read_timeout);
        if (!message) {
            LOG_DEBUG("JoinListener", "Listener connection lost: " + core::to_string(message.error()));
            return;
        }
        if (*message && (*message)->is_object()) {
            handle_message(ipc, **message);
        }
    }
}

DiscordJoinListener::JoinEvent DiscordJoinListener::parse_event(const json& message) {
    using utils::JsonHelper;

    JoinEvent event;
    const auto evt = JsonHelper::get_optional<std::string>(message, "evt", "");
    if (evt != "ACTIVITY_JOIN" && evt != "ACTIVITY_JOIN_REQUEST") {
        return event;
    }

    const json data = JsonHelper::get_optional<json>(message, "data", json::object());
    if (evt == "ACTIVITY_JOIN") {
        event.kind = JoinEvent::Kind::Join;
        event.secret = JsonHelper::get_optional<std::string>(data, "secret", "");
        return event;
    }

    event.kind = JoinEvent::Kind::JoinRequest;
    const json user = JsonHelper::get_optional<json>(data, "user", json::object());
    event.user_id = JsonHelper::get_optional<std::string>(user, "id", "");
    event.username = JsonHelper::get_optional<std::string>(user, "username", "?");
    return event;
}

void DiscordJoinListener::handle_message(DiscordIpc& ipc, const json& message) {
    const auto event = parse_event(message);

    switch (event.kind) {
        case JoinEvent::Kind::None:
            return;

        case JoinEvent::Kind::Join:
            LOG_INFO("JoinListener", "ACTIVITY_JOIN received");
            if (!event.secret.empty() && m_on_join) {
                m_on_join(event.secret);
            }
            return;

        case JoinEvent::Kind::JoinRequest:
            if (!m_options.auto_accept) {
                LOG_INFO("JoinListener", "Join request from " + event.username + " left for manual acceptance");
                return;
            }
            if (event.user_id.empty()) {
                return;
            }

            LOG_INFO("JoinListener", "Auto-accepting join request from " + event.username);
            if (auto reply = ipc.send_command("SEND_ACTIVITY_JOIN_INVITE", {{"user_id", event.user_id}}); !reply) {
                LOG_WARNING("JoinListener", "Failed to accept join request: " + core::to_string(reply.error()));
            }
            return;
    }
}

} // namespace listen_along::services
