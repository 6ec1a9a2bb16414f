#include "listen_along/services/presence/presence_session.hpp"
#include "listen_along/services/presence/discord_ipc.hpp"
#include "listen_along/utils/logger.hpp"

namespace listen_along::services {

DiscordPresenceSession::DiscordPresenceSession(std::string client_id)
    : m_ipc(std::make_unique<DiscordIpc>(std::move(client_id))) {}

DiscordPresenceSession::~DiscordPresenceSession() {
    disconnect();
}

std::expected<void, core::SessionError> DiscordPresenceSession::connect() {
    if (m_ipc->is_connected()) {
        return {};
    }
    return m_ipc->connect();
}

std::expected<void, core::SessionError> DiscordPresenceSession::update(const PresenceData& data) {
    if (!data.is_valid()) {
        return std::unexpected(core::SessionError::InvalidPayload);
    }
    if (!m_ipc->is_connected()) {
        return std::unexpected(core::SessionError::NotConnected);
    }

    LOG_DEBUG("DiscordSession", "Setting activity: " + data.details + " / " + data.state);
    return m_ipc->set_activity(PresenceBuilder::to_json(data));
}

std::expected<void, core::SessionError> DiscordPresenceSession::clear() {
    if (!m_ipc->is_connected()) {
        return std::unexpected(core::SessionError::NotConnected);
    }

    LOG_DEBUG("DiscordSession", "Clearing activity");
    return m_ipc->set_activity(nullptr);
}

std::expected<void, core::SessionError> DiscordPresenceSession::clear_for_pid(std::uint32_t pid) {
    if (!m_ipc->is_connected()) {
        return std::unexpected(core::SessionError::NotConnected);
    }
    return m_ipc->set_activity(nullptr, pid);
}

std::expected<void, core::SessionError> DiscordPresenceSession::ping() {
    if (!m_ipc->is_connected()) {
        return std::unexpected(core::SessionError::NotConnected);
    }
    return m_ipc->ping();
}

void DiscordPresenceSession::disconnect() {
    if (m_ipc) {
        m_ipc->disconnect();
    }
}

bool DiscordPresenceSession::is_connected() const {
    return m_ipc->is_connected();
}

} // namespace listen_along::services
