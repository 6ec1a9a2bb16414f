#include "listen_along/utils/yaml_config.hpp"
#include "listen_along/utils/logger.hpp"
#include <fstream>

namespace listen_along {
namespace utils {

namespace {
    template<typename T>
    void read_if_present(const YAML::Node& node, const char* key, T& target) {
        if (node[key]) {
            target = node[key].as<T>();
        }
    }

    template<typename Duration>
    void read_duration(const YAML::Node& node, const char* key, Duration& target) {
        if (node[key]) {
            target = Duration{node[key].as<typename Duration::rep>()};
        }
    }
}

std::expected<core::ApplicationConfig, core::ConfigError>
YamlConfigHelper::load_from_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_WARNING("YamlConfig", "File not found: " + path.string());
        return std::unexpected(core::ConfigError::FileNotFound);
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YamlConfig", "Parse error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

std::expected<void, core::ConfigError>
YamlConfigHelper::save_to_file(const core::ApplicationConfig& config, const std::filesystem::path& path,
                               const std::string& header) {
    std::error_code ec;
    const auto dir = path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir, ec)) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            LOG_ERROR("YamlConfig", "Cannot create directory " + dir.string() + ": " + ec.message());
            return std::unexpected(core::ConfigError::PermissionDenied);
        }
    }

    std::ofstream file(path);
    if (!file) {
        LOG_ERROR("YamlConfig", "Cannot open file for writing: " + path.string());
        return std::unexpected(core::ConfigError::PermissionDenied);
    }

    YAML::Emitter out;
    out << to_yaml(config);
    if (!out.good()) {
        LOG_ERROR("YamlConfig", "Emit error: " + out.GetLastError());
        return std::unexpected(core::ConfigError::InvalidFormat);
    }

    file << header << out.c_str() << '\n';
    if (!file) {
        return std::unexpected(core::ConfigError::PermissionDenied);
    }
    return {};
}

core::ApplicationConfig YamlConfigHelper::from_yaml(const YAML::Node& node) {
    core::ApplicationConfig config;

    if (node["log_level"]) {
        config.log_level = log_level_from_string(node["log_level"].as<std::string>());
    }

    if (node["discord"]) {
        config.discord = parse_discord_config(node["discord"]);
    }
    if (node["startup"]) {
        config.startup = parse_startup_config(node["startup"]);
    }
    if (node["sources"]) {
        config.sources = parse_sources_config(node["sources"]);
    }
    if (node["artwork"]) {
        config.artwork = parse_artwork_config(node["artwork"]);
    }
    if (node["deep_link"]) {
        config.deep_link = parse_deep_link_config(node["deep_link"]);
    }

    return config;
}

YAML::Node YamlConfigHelper::to_yaml(const core::ApplicationConfig& config) {
    YAML::Node node;

    node["log_level"] = to_string(config.log_level);

    auto discord = node["discord"];
    discord["client_id"] = config.discord.client_id;
    discord["asset_key"] = config.discord.asset_key;
    discord["show_progress"] = config.discord.show_progress;
    discord["enable_invites"] = config.discord.enable_invites;
    discord["auto_accept_join_requests"] = config.discord.auto_accept_join_requests;
    discord["party_id"] = config.discord.party_id;
    discord["details_format"] = config.discord.details_format;
    discord["state_format"] = config.discord.state_format;
    discord["large_image_text_format"] = config.discord.large_image_text_format;

    auto startup = node["startup"];
    startup["connect_attempts"] = config.startup.connect_attempts;
    startup["initial_delay_ms"] = config.startup.initial_delay.count();
    startup["max_delay_ms"] = config.startup.max_delay.count();

    auto sources = node["sources"];
    sources["poll_interval_seconds"] = config.sources.poll_interval.count();
    sources["media_session"]["enabled"] = config.sources.media_session.enabled;
    sources["media_session"]["player_filter"] = config.sources.media_session.player_filter;
    sources["spotify"]["enabled"] = config.sources.spotify.enabled;
    sources["spotify"]["client_id"] = config.sources.spotify.client_id;
    sources["spotify"]["client_secret"] = config.sources.spotify.client_secret;
    sources["spotify"]["redirect_uri"] = config.sources.spotify.redirect_uri;

    auto artwork = node["artwork"];
    artwork["enabled"] = config.artwork.enabled;
    artwork["upload_url"] = config.artwork.upload_url;
    artwork["max_upload_bytes"] = config.artwork.max_upload_bytes;
    artwork["timeout_seconds"] = config.artwork.timeout.count();

    auto deep_link = node["deep_link"];
    deep_link["web_search_url"] = config.deep_link.web_search_url;
    deep_link["latency_offset_ms"] = config.deep_link.latency_offset.count();
    deep_link["register_discord_launch"] = config.deep_link.register_discord_launch;

    return node;
}

core::DiscordConfig YamlConfigHelper::parse_discord_config(const YAML::Node& node) {
    core::DiscordConfig config;

    read_if_present(node, "client_id", config.client_id);
    read_if_present(node, "asset_key", config.asset_key);
    read_if_present(node, "show_progress", config.show_progress);
    read_if_present(node, "enable_invites", config.enable_invites);
    read_if_present(node, "auto_accept_join_requests", config.auto_accept_join_requests);
    read_if_present(node, "party_id", config.party_id);
    read_if_present(node, "details_format", config.details_format);
    read_if_present(node, "state_format", config.state_format);
    read_if_present(node, "large_image_text_format", config.large_image_text_format);

    return config;
}

core::StartupConfig YamlConfigHelper::parse_startup_config(const YAML::Node& node) {
    core::StartupConfig config;

    read_if_present(node, "connect_attempts", config.connect_attempts);
    read_duration(node, "initial_delay_ms", config.initial_delay);
    read_duration(node, "max_delay_ms", config.max_delay);

    return config;
}

core::SourcesConfig YamlConfigHelper::parse_sources_config(const YAML::Node& node) {
    core::SourcesConfig config;

    read_duration(node, "poll_interval_seconds", config.poll_interval);

    if (const auto media = node["media_session"]) {
        read_if_present(media, "enabled", config.media_session.enabled);
        read_if_present(media, "player_filter", config.media_session.player_filter);
    }

    if (const auto spotify = node["spotify"]) {
        read_if_present(spotify, "enabled", config.spotify.enabled);
        read_if_present(spotify, "client_id", config.spotify.client_id);
        read_if_present(spotify, "client_secret", config.spotify.client_secret);
        read_if_present(spotify, "redirect_uri", config.spotify.redirect_uri);
    }

    return config;
}

core::ArtworkConfig YamlConfigHelper::parse_artwork_config(const YAML::Node& node) {
    core::ArtworkConfig config;

    read_if_present(node, "enabled", config.enabled);
    read_if_present(node, "upload_url", config.upload_url);
    read_if_present(node, "max_upload_bytes", config.max_upload_bytes);
    read_duration(node, "timeout_seconds", config.timeout);

    return config;
}

core::DeepLinkConfig YamlConfigHelper::parse_deep_link_config(const YAML::Node& node) {
    core::DeepLinkConfig config;

    read_if_present(node, "web_search_url", config.web_search_url);
    read_duration(node, "latency_offset_ms", config.latency_offset);
    read_if_present(node, "register_discord_launch", config.register_discord_launch);

    return config;
}

} // namespace utils
} // namespace listen_along
