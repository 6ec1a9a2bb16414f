#pragma once

#include "listen_along/core/models.hpp"
#include <yaml-cpp/yaml.h>
#include <expected>
#include <filesystem>

namespace listen_along {
namespace utils {

class YamlConfigHelper {
public:
    static std::expected<core::ApplicationConfig, core::ConfigError>
    load_from_file(const std::filesystem::path& path);

    static std::expected<void, core::ConfigError>
    save_to_file(const core::ApplicationConfig& config, const std::filesystem::path& path,
                 const std::string& header = {});

    // Missing keys keep their defaults. Throws YAML::Exception on mistyped values.
    static core::ApplicationConfig from_yaml(const YAML::Node& node);
    static YAML::Node to_yaml(const core::ApplicationConfig& config);

private:
    static core::DiscordConfig parse_discord_config(const YAML::Node& node);
    static core::StartupConfig parse_startup_config(const YAML::Node& node);
    static core::SourcesConfig parse_sources_config(const YAML::Node& node);
    static core::ArtworkConfig parse_artwork_config(const YAML::Node& node);
    static core::DeepLinkConfig parse_deep_link_config(const YAML::Node& node);
};

} // namespace utils
} // namespace listen_along
