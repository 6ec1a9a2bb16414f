#pragma once

#include "listen_along/core/models.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace listen_along {
namespace core {
    class EventBus;
    class CommandQueue;
}

namespace services {
    class PresenceSession;
}
}

namespace listen_along {
namespace core {

class ConfigManager {
public:
    explicit ConfigManager(const std::filesystem::path& config_path = {});
    ~ConfigManager();

    std::expected<void, ConfigError> load();
    std::expected<void, ConfigError> save();

    const ApplicationConfig& get() const;
    // Validates, saves and publishes ConfigurationUpdated.
    std::expected<void, ConfigError> update(const ApplicationConfig& config);

    void set_event_bus(std::shared_ptr<EventBus> bus);

    const std::filesystem::path& path() const;
    static std::filesystem::path default_config_path();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

// Tries connect() up to config.connect_attempts times, doubling the delay
// between attempts up to config.max_delay.
std::expected<void, ApplicationError> connect_with_backoff(services::PresenceSession& session,
                                                           const StartupConfig& config,
                                                           const SleepFunction& sleep);

class Application {
public:
    virtual ~Application() = default;

    virtual std::expected<void, ApplicationError> initialize() = 0;
    virtual std::expected<void, ApplicationError> start() = 0;
    // Enqueues Exit, joins the loop and releases the presence. Idempotent.
    virtual void stop() = 0;
    virtual void shutdown() = 0;

    virtual ApplicationState get_state() const = 0;
    virtual bool is_running() const = 0;

    virtual void run_once() = 0;
    virtual void quit() = 0;

    virtual const ApplicationConfig& get_config() const = 0;
    virtual EventBus& get_event_bus() = 0;
    virtual CommandQueue& get_command_queue() = 0;
};

std::expected<std::unique_ptr<Application>, ApplicationError>
create_application(std::shared_ptr<ConfigManager> config);

} // namespace core
} // namespace listen_along
