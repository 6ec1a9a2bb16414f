#include "listen_along/core/application.hpp"
#include "listen_along/core/command_queue.hpp"
#include "listen_along/core/event_bus.hpp"
#include "listen_along/core/events.hpp"
#include "listen_along/core/presence_loop.hpp"
#include "listen_along/core/presence_reconciler.hpp"
#include "listen_along/platform/browser_launcher.hpp"
#include "listen_along/platform/ui_service.hpp"
#include "listen_along/services/artwork/artwork_publisher.hpp"
#include "listen_along/services/deep_link/deep_link_resolver.hpp"
#include "listen_along/services/deep_link/invite.hpp"
#include "listen_along/services/network/http_client.hpp"
#include "listen_along/services/presence/join_listener.hpp"
#include "listen_along/services/presence/presence_session.hpp"
#include "listen_along/services/source/source_adapter.hpp"
#include "listen_along/services/source/spotify_source_adapter.hpp"
#include "listen_along/services/spotify/spotify_auth_storage.hpp"
#include "listen_along/services/spotify/spotify_authenticator.hpp"
#include "listen_along/services/spotify/spotify_client.hpp"
#include "listen_along/utils/logger.hpp"
#ifdef USE_QT_UI
#include "listen_along/services/source/mpris_source_adapter.hpp"
#endif
#include "version.h"

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace listen_along {
namespace core {

std::expected<void, ApplicationError> connect_with_backoff(services::PresenceSession& session,
                                                           const StartupConfig& config,
                                                           const SleepFunction& sleep) {
    const int attempts = std::max(config.connect_attempts, 1);
    auto delay = config.initial_delay;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto result = session.connect();
        if (result) {
            LOG_INFO("Application", "Connected to Discord");
            return {};
        }

        LOG_WARNING("Application", "Discord connect attempt " + std::to_string(attempt) + "/" +
                    std::to_string(attempts) + " failed: " + to_string(result.error()));
        if (attempt == attempts) {
            break;
        }

        if (sleep) {
            sleep(delay);
        }
        delay = std::min(delay * 2, config.max_delay);
    }

    LOG_ERROR("Application", "Could not connect to Discord (is it running?)");
    return std::unexpected(ApplicationError::StartupConnectFailed);
}

class ApplicationImpl : public Application {
public:
    explicit ApplicationImpl(std::shared_ptr<ConfigManager> config)
        : m_config_service(std::move(config)),
          m_event_bus(std::make_shared<EventBus>()),
          m_commands(std::make_shared<CommandQueue>()) {
        LOG_DEBUG("Application", "Application created");
    }

    ~ApplicationImpl() override {
        shutdown();
        LOG_DEBUG("Application", "Application destroyed");
    }

    std::expected<void, ApplicationError> initialize() override {
        if (m_state != ApplicationState::NotInitialized) {
            LOG_WARNING("Application", "Already initialized");
            return std::unexpected(ApplicationError::AlreadyRunning);
        }

        m_state = ApplicationState::Initializing;
        m_config_service->set_event_bus(m_event_bus);
        m_event_bus->publish(events::ApplicationStarting(LISTEN_ALONG_VERSION_STRING));

        const auto& config = m_config_service->get();
        if (auto valid = config.validate(); !valid) {
            LOG_ERROR("Application", "Invalid configuration (" + to_string(valid.error()) + "), edit " +
                      m_config_service->path().string());
            m_state = ApplicationState::Error;
            return std::unexpected(ApplicationError::ConfigurationError);
        }

        try {
            m_http_client = services::create_http_client();
            m_browser = platform::create_browser_launcher();

            initialize_ui_service();
            initialize_presence(config);
            initialize_join_listener(config);
            subscribe_events();

            m_state = ApplicationState::Running;
            LOG_DEBUG("Application", "Initialization complete");
            return {};
        } catch (const std::exception& e) {
            LOG_ERROR("Application", "Initialization failed: " + std::string(e.what()));
            m_state = ApplicationState::Error;
            return std::unexpected(ApplicationError::InitializationFailed);
        }
    }

    std::expected<void, ApplicationError> start() override {
        if (m_state != ApplicationState::Running || !m_loop) {
            LOG_ERROR("Application", "Not initialized");
            return std::unexpected(ApplicationError::InitializationFailed);
        }

        const auto started_at = std::chrono::steady_clock::now();
        const auto& config = m_config_service->get();

        auto connected = connect_with_backoff(*m_session, config.startup,
                                              [](std::chrono::milliseconds delay) {
                                                  std::this_thread::sleep_for(delay);
                                              });
        if (!connected) {
            m_state = ApplicationState::Error;
            return std::unexpected(connected.error());
        }

        initialize_system_tray();

        m_running = true;
        m_loop->start();
        if (m_join_listener) {
            m_join_listener->start();
        }
        start_spotify_authorization();

        m_event_bus->publish(events::ApplicationReady(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at)));
        return {};
    }

    void stop() override {
        if (m_stopped.exchange(true)) {
            return;
        }

        LOG_INFO("Application", "Stopping...");
        m_state = ApplicationState::Stopping;
        m_running = false;
        m_event_bus->publish(events::ApplicationShuttingDown());

        if (m_join_listener) {
            m_join_listener->stop();
        }
        if (m_spotify_auth) {
            m_spotify_auth->shutdown();
        }
        if (m_loop) {
            // Exit is applied after any queued command; the loop clears the presence on its way out
            m_loop->stop();
        } else if (m_session) {
            m_session->disconnect();
        }
    }

    void shutdown() override {
        stop();
        if (m_shut_down.exchange(true)) {
            return;
        }

        cleanup_event_subscriptions();

        if (m_auth_task.valid()) {
            m_auth_task.wait();
        }

        if (m_system_tray) {
            m_system_tray->shutdown();
            m_system_tray.reset();
        }
        if (m_ui_service) {
            m_ui_service->shutdown();
        }

        m_state = ApplicationState::Stopped;
        LOG_INFO("Application", "Shutdown complete");
    }

    ApplicationState get_state() const override {
        return m_state;
    }

    bool is_running() const override {
        return m_running && !m_exit_requested;
    }

    void run_once() override {
        if (m_ui_service) {
            m_ui_service->process_events();
        }
    }

    void quit() override {
        LOG_INFO("Application", "Quitting");
        stop();
        shutdown();
    }

    const ApplicationConfig& get_config() const override {
        return m_config_service->get();
    }

    EventBus& get_event_bus() override {
        return *m_event_bus;
    }

    CommandQueue& get_command_queue() override {
        return *m_commands;
    }

private:
    void initialize_ui_service() {
        m_ui_service = platform::create_ui_service();
        if (!m_ui_service) {
            return;
        }

        if (!m_ui_service->initialize()) {
            LOG_WARNING("Application", "UI initialization failed");
            m_ui_service.reset();
        }
    }

    void initialize_presence(const ApplicationConfig& config) {
        m_session = std::make_shared<services::DiscordPresenceSession>(config.discord.client_id);

        std::shared_ptr<services::ArtworkPublisher> artwork;
        if (config.artwork.enabled) {
            artwork = std::make_shared<services::ArtworkPublisher>(
                std::make_shared<services::CatboxImageHost>(m_http_client, config.artwork));
        }

        m_reconciler = std::make_shared<PresenceReconciler>(
            m_session, artwork,
            services::PresenceBuilder(services::PresenceBuilder::FormatOptions::from_config(config.discord)),
            m_event_bus);

        auto arbitrator = std::make_shared<services::Arbitrator>(build_adapters(config));
        if (arbitrator->adapter_count() == 0) {
            LOG_WARNING("Application", "No track sources enabled, presence will stay empty");
        }

        m_resolver = std::make_shared<services::DeepLinkResolver>(m_playback, m_browser, config.deep_link);

        m_loop = std::make_unique<PresenceLoop>(
            arbitrator, m_reconciler, m_commands,
            std::chrono::duration_cast<std::chrono::milliseconds>(config.sources.poll_interval),
            [this](const std::string& secret) { handle_join(secret); });
    }

    // Priority order: desktop player first, streaming service second.
    std::vector<std::shared_ptr<services::SourceAdapter>> build_adapters(const ApplicationConfig& config) {
        std::vector<std::shared_ptr<services::SourceAdapter>> adapters;

        if (config.sources.media_session.enabled) {
#ifdef USE_QT_UI
            adapters.push_back(std::make_shared<services::MprisSourceAdapter>(config.sources.media_session,
                                                                              m_http_client));
#else
            LOG_INFO("Application", "Media session source needs a Qt build, skipping");
#endif
        }

        const auto& spotify = config.sources.spotify;
        if (spotify.enabled) {
            if (spotify.client_id.empty() || spotify.client_secret.empty()) {
                LOG_WARNING("Application", "Spotify enabled without client_id/client_secret, skipping");
            } else {
                auto storage = std::make_shared<services::SpotifyAuthStorage>(
                    m_config_service->path().parent_path() / "auth.yaml");
                m_spotify_auth = std::make_shared<services::SpotifyAuthenticator>(m_http_client, storage, spotify,
                                                                                  m_browser);
                auto client = std::make_shared<services::SpotifyClient>(m_http_client, m_spotify_auth);
                adapters.push_back(std::make_shared<services::SpotifySourceAdapter>(client));
                m_playback = client;
            }
        }

        return adapters;
    }

    void initialize_join_listener(const ApplicationConfig& config) {
        if (!config.discord.enable_invites) {
            return;
        }

        services::DiscordJoinListener::Options options;
        options.auto_accept = config.discord.auto_accept_join_requests;

        std::weak_ptr<CommandQueue> commands = m_commands;
        m_join_listener = std::make_unique<services::DiscordJoinListener>(
            config.discord.client_id,
            [commands](const std::string& secret) {
                if (auto queue = commands.lock()) {
                    queue->push(Command::join(secret));
                }
            },
            options);
    }

    void start_spotify_authorization() {
        if (!m_spotify_auth || m_spotify_auth->has_credentials()) {
            return;
        }

        LOG_INFO("Application", "Spotify is not authorized yet, opening the browser");
        m_auth_task = std::async(std::launch::async, [auth = m_spotify_auth]() {
            auto result = auth->authorize();
            if (!result) {
                LOG_WARNING("Application", "Spotify authorization failed: " + to_string(result.error()));
            } else {
                LOG_INFO("Application", "Spotify authorized");
            }
        });
    }

    // Runs on the presence loop thread.
    void handle_join(const std::string& secret) {
        m_event_bus->publish(events::JoinReceived(secret));

        auto invite = services::parse_invite(secret);
        if (!invite) {
            LOG_WARNING("Application", "Ignoring malformed invite");
            return;
        }

        const auto action = m_resolver->resolve(*invite);
        LOG_INFO("Application", "Invite " + services::to_string(action));
    }

    void subscribe_events() {
        m_event_subscriptions.push_back(m_event_bus->subscribe<events::SessionStatusChanged>(
            [this](const events::SessionStatusChanged& event) {
                {
                    std::lock_guard lock(m_status_mutex);
                    m_discord_connected = event.connected;
                }
                refresh_tray_status();
            }));

        m_event_subscriptions.push_back(m_event_bus->subscribe<events::TrackPublished>(
            [this](const events::TrackPublished& event) {
                {
                    std::lock_guard lock(m_status_mutex);
                    m_discord_connected = true;
                    m_now_playing = event.track.title + " - " + event.track.artist;
                }
                refresh_tray_status();
            }));

        m_event_subscriptions.push_back(m_event_bus->subscribe<events::PresenceCleared>(
            [this](const events::PresenceCleared& event) {
                LOG_INFO("Application", "Presence cleared (" + event.reason + ")");
                {
                    std::lock_guard lock(m_status_mutex);
                    m_now_playing.clear();
                }
                refresh_tray_status();
            }));

        m_event_subscriptions.push_back(m_event_bus->subscribe<events::ReconcilerStateChanged>(
            [this](const events::ReconcilerStateChanged& event) {
                const bool paused = event.current_state == PresenceState::Paused;
                m_paused = paused;
                if (m_system_tray) {
                    (void)m_system_tray->set_menu_item_label("pause", paused ? "Resume" : "Pause");
                }
                refresh_tray_status();
            }));

        m_event_subscriptions.push_back(m_event_bus->subscribe<events::JoinReceived>(
            [](const events::JoinReceived&) {
                LOG_INFO("Application", "Listen-along invite received");
            }));

        m_event_subscriptions.push_back(m_event_bus->subscribe<events::ConfigurationUpdated>(
            [](const events::ConfigurationUpdated&) {
                LOG_INFO("Application", "Configuration updated, restart to apply");
            }));
    }

    std::string status_text() {
        std::lock_guard lock(m_status_mutex);
        if (!m_discord_connected) {
            return "Discord: disconnected";
        }
        if (m_paused) {
            return "Paused";
        }
        return m_now_playing.empty() ? "Nothing playing" : "Playing: " + m_now_playing;
    }

    void refresh_tray_status() {
        if (!m_system_tray) {
            return;
        }
        const auto text = status_text();
        (void)m_system_tray->set_menu_item_label("status", text);
        (void)m_system_tray->set_tooltip("Listen Along - " + text);
    }

    void initialize_system_tray() {
        if (!m_ui_service || !m_ui_service->supports_system_tray()) {
            return;
        }

        m_system_tray = m_ui_service->create_system_tray();
        if (!m_system_tray || !m_system_tray->initialize()) {
            LOG_WARNING("Application", "System tray initialization failed");
            m_system_tray.reset();
            return;
        }

        setup_tray_menu();
        refresh_tray_status();
        m_system_tray->show();
    }

    void setup_tray_menu() {
        std::vector<platform::MenuItem> menu_items;

        platform::MenuItem status_item("status", "Nothing playing");
        status_item.enabled = false;
        menu_items.push_back(status_item);

        menu_items.push_back(platform::MenuItem::separator());

        menu_items.emplace_back("pause", "Pause", [this]() {
            m_commands->push(Command{m_paused ? Command::Type::Resume : Command::Type::Pause, {}});
        });
        menu_items.emplace_back("clear", "Clear presence", [this]() {
            m_commands->push(Command{Command::Type::Clear, {}});
        });

        menu_items.push_back(platform::MenuItem::separator());

        menu_items.emplace_back("exit", "Exit", [this]() {
            LOG_INFO("Application", "Exit from tray");
            m_exit_requested = true;
        });

        if (!m_system_tray->set_menu(menu_items)) {
            LOG_WARNING("Application", "Tray menu setup failed");
        }
    }

    void cleanup_event_subscriptions() {
        for (auto id : m_event_subscriptions) {
            m_event_bus->unsubscribe(id);
        }
        m_event_subscriptions.clear();
    }

    std::atomic<ApplicationState> m_state{ApplicationState::NotInitialized};
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_exit_requested{false};
    std::atomic<bool> m_stopped{false};
    std::atomic<bool> m_shut_down{false};

    std::shared_ptr<ConfigManager> m_config_service;
    std::shared_ptr<EventBus> m_event_bus;
    std::shared_ptr<CommandQueue> m_commands;

    std::shared_ptr<services::HttpClient> m_http_client;
    std::shared_ptr<platform::BrowserLauncher> m_browser;
    std::shared_ptr<services::DiscordPresenceSession> m_session;
    std::shared_ptr<PresenceReconciler> m_reconciler;
    std::shared_ptr<services::SpotifyAuthenticator> m_spotify_auth;
    std::shared_ptr<services::PlaybackService> m_playback;
    std::shared_ptr<services::DeepLinkResolver> m_resolver;
    std::unique_ptr<PresenceLoop> m_loop;
    std::unique_ptr<services::DiscordJoinListener> m_join_listener;
    std::future<void> m_auth_task;

    std::unique_ptr<platform::UiService> m_ui_service;
    std::unique_ptr<platform::SystemTray> m_system_tray;
    std::vector<EventBus::HandlerId> m_event_subscriptions;

    std::mutex m_status_mutex;
    bool m_discord_connected = true;
    std::string m_now_playing;
    std::atomic<bool> m_paused{false};
};

std::expected<std::unique_ptr<Application>, ApplicationError>
create_application(std::shared_ptr<ConfigManager> config) {
    if (!config) {
        return std::unexpected(ApplicationError::ConfigurationError);
    }

    try {
        return std::make_unique<ApplicationImpl>(std::move(config));
    } catch (const std::exception& e) {
        LOG_ERROR("Application", "Creation failed: " + std::string(e.what()));
        return std::unexpected(ApplicationError::InitializationFailed);
    }
}

} // namespace core
} // namespace listen_along
