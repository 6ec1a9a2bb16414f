#include "fakes.hpp"

#include "listen_along/core/application.hpp"
#include "listen_along/core/event_bus.hpp"
#include "listen_along/core/events.hpp"
#include "listen_along/utils/yaml_config.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace listen_along;
using namespace listen_along::testing;
using namespace std::chrono_literals;
using utils::YamlConfigHelper;

namespace {

core::ApplicationConfig valid_config() {
    core::ApplicationConfig config;
    config.discord.client_id = "1234567890";
    return config;
}

void write_file(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

} // namespace

// ============================================================================
// YAML mapping
// ============================================================================

TEST(YamlConfig, MissingKeysKeepDefaults) {
    auto config = YamlConfigHelper::from_yaml(YAML::Load("discord:\n  client_id: \"42\"\n"));

    EXPECT_EQ(config.discord.client_id, "42");
    EXPECT_EQ(config.discord.asset_key, "music");
    EXPECT_EQ(config.startup.connect_attempts, 3);
    EXPECT_EQ(config.sources.poll_interval, 5s);
    EXPECT_EQ(config.artwork.upload_url, "https://catbox.moe/user/api.php");
    EXPECT_EQ(config.deep_link.latency_offset, 1500ms);
    EXPECT_EQ(config.log_level, utils::LogLevel::Info);
}

TEST(YamlConfig, ReadsNestedSections) {
    auto config = YamlConfigHelper::from_yaml(YAML::Load(R"(
log_level: debug
startup:
  connect_attempts: 5
  initial_delay_ms: 250
  max_delay_ms: 2000
sources:
  poll_interval_seconds: 3
  media_session:
    enabled: false
    player_filter: rhythmbox
  spotify:
    enabled: true
    client_id: abc
    client_secret: def
artwork:
  enabled: false
  timeout_seconds: 4
deep_link:
  web_search_url: "https://example.com/?q={query}"
  latency_offset_ms: 900
  register_discord_launch: false
)"));

    EXPECT_EQ(config.log_level, utils::LogLevel::Debug);
    EXPECT_EQ(config.startup.connect_attempts, 5);
    EXPECT_EQ(config.startup.initial_delay, 250ms);
    EXPECT_EQ(config.startup.max_delay, 2000ms);
    EXPECT_EQ(config.sources.poll_interval, 3s);
    EXPECT_FALSE(config.sources.media_session.enabled);
    EXPECT_EQ(config.sources.media_session.player_filter, "rhythmbox");
    EXPECT_TRUE(config.sources.spotify.enabled);
    EXPECT_EQ(config.sources.spotify.client_secret, "def");
    EXPECT_FALSE(config.artwork.enabled);
    EXPECT_EQ(config.artwork.timeout, 4s);
    EXPECT_EQ(config.deep_link.web_search_url, "https://example.com/?q={query}");
    EXPECT_EQ(config.deep_link.latency_offset, 900ms);
    EXPECT_FALSE(config.deep_link.register_discord_launch);
}

TEST(YamlConfig, MistypedValueThrows) {
    EXPECT_THROW(YamlConfigHelper::from_yaml(YAML::Load("startup:\n  connect_attempts: lots\n")),
                 YAML::Exception);
}

TEST(YamlConfig, SavedFileLoadsBack) {
    TempDir dir;
    const auto path = dir.path() / "nested" / "config.yaml";

    auto config = valid_config();
    config.discord.details_format = "{artist} - {title}";
    config.sources.poll_interval = 12s;

    ASSERT_TRUE(YamlConfigHelper::save_to_file(config, path, "# header\n").has_value());

    std::ifstream in(path);
    std::string first_line;
    std::getline(in, first_line);
    EXPECT_EQ(first_line, "# header");

    auto loaded = YamlConfigHelper::load_from_file(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->discord.client_id, "1234567890");
    EXPECT_EQ(loaded->discord.details_format, "{artist} - {title}");
    EXPECT_EQ(loaded->sources.poll_interval, 12s);
}

TEST(YamlConfig, LoadErrors) {
    TempDir dir;

    auto missing = YamlConfigHelper::load_from_file(dir.path() / "absent.yaml");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), core::ConfigError::FileNotFound);

    const auto broken = dir.path() / "broken.yaml";
    write_file(broken, "discord: [unclosed\n");
    auto invalid = YamlConfigHelper::load_from_file(broken);
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error(), core::ConfigError::InvalidFormat);
}

// ============================================================================
// Validation
// ============================================================================

TEST(ConfigValidation, DefaultsNeedClientId) {
    core::ApplicationConfig config;
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), core::ValidationError::EmptyClientId);

    EXPECT_TRUE(valid_config().validate().has_value());
}

TEST(ConfigValidation, RejectsOutOfRangeValues) {
    auto config = valid_config();
    config.discord.client_id = "not-a-number";
    EXPECT_EQ(config.validate().error(), core::ValidationError::InvalidClientId);

    config = valid_config();
    config.startup.connect_attempts = 0;
    EXPECT_EQ(config.validate().error(), core::ValidationError::InvalidConnectAttempts);

    config = valid_config();
    config.sources.poll_interval = 301s;
    EXPECT_EQ(config.validate().error(), core::ValidationError::InvalidPollInterval);

    config = valid_config();
    config.sources.spotify.enabled = true;
    EXPECT_EQ(config.validate().error(), core::ValidationError::MissingSpotifyCredentials);

    config.sources.spotify.client_id = "a";
    config.sources.spotify.client_secret = "b";
    config.sources.spotify.redirect_uri = "localhost:8888";
    EXPECT_EQ(config.validate().error(), core::ValidationError::InvalidUrl);

    config = valid_config();
    config.artwork.upload_url = "ftp://catbox.moe";
    EXPECT_EQ(config.validate().error(), core::ValidationError::InvalidUrl);

    config.artwork.enabled = false;
    EXPECT_TRUE(config.validate().has_value());
}

// ============================================================================
// ConfigManager
// ============================================================================

TEST(ConfigManager, FirstLoadWritesDefaultsWithHeader) {
    TempDir dir;
    const auto path = dir.path() / "config.yaml";

    core::ConfigManager manager(path);
    ASSERT_TRUE(manager.load().has_value());
    EXPECT_TRUE(std::filesystem::exists(path));

    std::ifstream in(path);
    std::string first_line;
    std::getline(in, first_line);
    EXPECT_TRUE(first_line.starts_with("# Listen Along configuration"));
}

TEST(ConfigManager, UpdateValidatesSavesAndPublishes) {
    TempDir dir;
    const auto path = dir.path() / "config.yaml";

    auto bus = std::make_shared<core::EventBus>();
    std::optional<std::string> published_id;
    bus->subscribe<core::events::ConfigurationUpdated>(
        [&](const core::events::ConfigurationUpdated& event) { published_id = event.new_config.discord.client_id; });

    core::ConfigManager manager(path);
    manager.set_event_bus(bus);

    auto rejected = manager.update(core::ApplicationConfig{});
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error(), core::ConfigError::ValidationError);
    EXPECT_FALSE(published_id.has_value());

    ASSERT_TRUE(manager.update(valid_config()).has_value());
    EXPECT_EQ(published_id, "1234567890");
    EXPECT_EQ(manager.get().discord.client_id, "1234567890");

    core::ConfigManager reloaded(path);
    ASSERT_TRUE(reloaded.load().has_value());
    EXPECT_EQ(reloaded.get().discord.client_id, "1234567890");
}

TEST(ConfigManager, BrokenFileKeepsDefaults) {
    TempDir dir;
    const auto path = dir.path() / "config.yaml";
    write_file(path, "sources: {poll_interval_seconds: [\n");

    core::ConfigManager manager(path);
    auto loaded = manager.load();
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error(), core::ConfigError::InvalidFormat);
    EXPECT_EQ(manager.get().sources.poll_interval, 5s);
}
