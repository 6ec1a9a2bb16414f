#include "listen_along/core/application.hpp"
#include "listen_along/core/event_bus.hpp"
#include "listen_along/core/events.hpp"
#include "listen_along/utils/yaml_config.hpp"
#include "listen_along/utils/logger.hpp"
#include <cstdlib>
#include <shared_mutex>

namespace listen_along {
namespace core {

namespace {

const char* const CONFIG_HEADER =
    "# Listen Along configuration\n"
    "# This file was generated on first run. Edit the values below and restart.\n"
    "#\n"
    "# log_level: debug, info, warning, error or none\n"
    "#\n"
    "# discord.client_id: application id from the Discord Developer Portal (required)\n"
    "# discord.asset_key: uploaded art asset shown when there is no cover art\n"
    "# discord.details_format / state_format / large_image_text_format:\n"
    "#   templates using {title}, {artist}, {album} and {source}\n"
    "# discord.enable_invites: attach a listen-along Join button\n"
    "#\n"
    "# startup: Discord connect retries before giving up\n"
    "#\n"
    "# sources.poll_interval_seconds: 1-300\n"
    "# sources.media_session: desktop players over MPRIS (Qt builds only)\n"
    "#   player_filter: only follow players whose bus name contains this text\n"
    "# sources.spotify: Spotify Web API, used when no desktop player is playing\n"
    "#\n"
    "# artwork: cover art uploaded to catbox.moe so Discord can show it\n"
    "#\n"
    "# deep_link.web_search_url: opened when an invite cannot start playback,\n"
    "#   {query} is replaced by \"title artist\"\n"
    "# deep_link.latency_offset_ms: added to the seek position when joining\n\n";

} // namespace

class ConfigManager::Impl {
public:
    explicit Impl(const std::filesystem::path& config_path)
        : m_config_path(config_path.empty() ? default_config_path() : config_path) {
        LOG_DEBUG("ConfigService", "Initializing with path: " + m_config_path.string());
        ensure_config_directory();
        m_config_exists = std::filesystem::exists(m_config_path);
    }

    std::expected<void, ConfigError> load() {
        LOG_DEBUG("ConfigService", "Loading configuration");

        if (!std::filesystem::exists(m_config_path)) {
            LOG_INFO("ConfigService", "No configuration found, writing defaults to " + m_config_path.string());
            {
                std::unique_lock lock(m_mutex);
                m_config = ApplicationConfig{};
            }
            return save();
        }

        auto result = utils::YamlConfigHelper::load_from_file(m_config_path);
        if (!result) {
            return std::unexpected(result.error());
        }

        std::unique_lock lock(m_mutex);
        m_config = std::move(*result);
        LOG_DEBUG("ConfigService", "Configuration loaded");
        return {};
    }

    std::expected<void, ConfigError> save() {
        ApplicationConfig config_copy;
        {
            std::shared_lock lock(m_mutex);
            config_copy = m_config;
        }

        // Header only on the first write, so user comments are not duplicated
        const std::string header = m_config_exists ? std::string{} : std::string{CONFIG_HEADER};
        auto result = utils::YamlConfigHelper::save_to_file(config_copy, m_config_path, header);
        if (result) {
            m_config_exists = true;
        }
        return result;
    }

    const ApplicationConfig& get() const {
        std::shared_lock lock(m_mutex);
        return m_config;
    }

    std::expected<void, ConfigError> update(const ApplicationConfig& config) {
        if (auto valid = config.validate(); !valid) {
            LOG_WARNING("ConfigService", "Rejected configuration: " + to_string(valid.error()));
            return std::unexpected(ConfigError::ValidationError);
        }

        ApplicationConfig old_config;
        {
            std::unique_lock lock(m_mutex);
            old_config = m_config;
            m_config = config;
        }

        auto result = save();
        if (result && m_event_bus) {
            m_event_bus->publish(events::ConfigurationUpdated{std::move(old_config), config});
        }
        return result;
    }

    void set_event_bus(std::shared_ptr<EventBus> bus) {
        m_event_bus = std::move(bus);
    }

    const std::filesystem::path& path() const {
        return m_config_path;
    }

private:
    void ensure_config_directory() {
        auto dir = m_config_path.parent_path();
        if (dir.empty()) {
            return;
        }

        std::error_code ec;
        if (std::filesystem::create_directories(dir, ec)) {
            LOG_DEBUG("ConfigService", "Created directory: " + dir.string());
        } else if (ec) {
            LOG_WARNING("ConfigService", "Could not create " + dir.string() + ": " + ec.message());
        }
    }

    mutable std::shared_mutex m_mutex;
    std::filesystem::path m_config_path;
    ApplicationConfig m_config;
    std::shared_ptr<EventBus> m_event_bus;
    bool m_config_exists = false;
};

std::filesystem::path ConfigManager::default_config_path() {
    std::filesystem::path config_dir;

#ifdef _WIN32
    if (const char* app_data = std::getenv("APPDATA")) {
        config_dir = std::filesystem::path(app_data) / "Listen Along";
    }
#else
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME")) {
        config_dir = std::filesystem::path(xdg_config) / "listen-along";
    } else if (const char* home = std::getenv("HOME")) {
        config_dir = std::filesystem::path(home) / ".config" / "listen-along";
    }
#endif

    return config_dir / "config.yaml";
}

ConfigManager::ConfigManager(const std::filesystem::path& config_path)
    : m_impl(std::make_unique<Impl>(config_path)) {}

ConfigManager::~ConfigManager() = default;

std::expected<void, ConfigError> ConfigManager::load() {
    return m_impl->load();
}

std::expected<void, ConfigError> ConfigManager::save() {
    return m_impl->save();
}

const ApplicationConfig& ConfigManager::get() const {
    return m_impl->get();
}

std::expected<void, ConfigError> ConfigManager::update(const ApplicationConfig& config) {
    return m_impl->update(config);
}

void ConfigManager::set_event_bus(std::shared_ptr<EventBus> bus) {
    m_impl->set_event_bus(std::move(bus));
}

const std::filesystem::path& ConfigManager::path() const {
    return m_impl->path();
}

} // namespace core
} // namespace listen_along
