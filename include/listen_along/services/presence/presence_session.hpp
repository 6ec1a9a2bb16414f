#pragma once

#include "listen_along/core/models.hpp"
#include "listen_along/services/presence/presence_builder.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>

namespace listen_along::services {

class DiscordIpc;

// The remote presence connection. No call retries internally; update and
// clear fail with SessionError::NotConnected while disconnected.
class PresenceSession {
public:
    virtual ~PresenceSession() = default;

    virtual std::expected<void, core::SessionError> connect() = 0;
    virtual std::expected<void, core::SessionError> update(const PresenceData& data) = 0;
    virtual std::expected<void, core::SessionError> clear() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    // Round trip that finds a connection the remote end dropped silently.
    virtual std::expected<void, core::SessionError> ping() = 0;
};

class DiscordPresenceSession : public PresenceSession {
public:
    explicit DiscordPresenceSession(std::string client_id);
    ~DiscordPresenceSession() override;

    std::expected<void, core::SessionError> connect() override;
    std::expected<void, core::SessionError> update(const PresenceData& data) override;
    std::expected<void, core::SessionError> clear() override;
    void disconnect() override;
    bool is_connected() const override;
    std::expected<void, core::SessionError> ping() override;

    // Clears the activity another process (or pid 0) left behind.
    std::expected<void, core::SessionError> clear_for_pid(std::uint32_t pid);

private:
    std::unique_ptr<DiscordIpc> m_ipc;
};

} // namespace listen_along::services
