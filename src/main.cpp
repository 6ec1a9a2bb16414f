#include "listen_along/core/application.hpp"
#include "listen_along/platform/browser_launcher.hpp"
#include "listen_along/platform/system_service.hpp"
#include "listen_along/services/deep_link/deep_link_resolver.hpp"
#include "listen_along/services/deep_link/invite.hpp"
#include "listen_along/services/network/http_client.hpp"
#include "listen_along/services/presence/discord_ipc.hpp"
#include "listen_along/services/presence/presence_session.hpp"
#include "listen_along/services/spotify/spotify_auth_storage.hpp"
#include "listen_along/services/spotify/spotify_authenticator.hpp"
#include "listen_along/services/spotify/spotify_client.hpp"
#include "listen_along/utils/logger.hpp"
#include "version.h"

#ifdef USE_QT_UI
#include <QApplication>
#include <QTimer>
#endif

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace core = listen_along::core;
namespace services = listen_along::services;
namespace platform = listen_along::platform;
namespace utils = listen_along::utils;

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_CODE = 1;

std::atomic<bool> g_shutdown_requested{false};
core::Application* g_app_instance = nullptr;

void handle_shutdown_signal(int) {
    g_shutdown_requested = true;
}

void register_signal_handlers() {
    std::signal(SIGINT, handle_shutdown_signal);
    std::signal(SIGTERM, handle_shutdown_signal);
#ifdef _WIN32
    std::signal(SIGBREAK, handle_shutdown_signal);
#endif
}

// Last chance to clear the presence when the process leaves through exit()
void release_on_exit() {
    if (g_app_instance) {
        g_app_instance->stop();
        g_app_instance = nullptr;
    }
}

enum class Mode {
    Host,
    Clear,
    RegisterUri,
    Listen,
    Version,
    Help
};

struct Options {
    Mode mode = Mode::Host;
    std::string invite_uri;
    std::string config_path;
};

void print_usage(std::ostream& out) {
    out << "Usage: listen-along [options] [invite-uri]\n"
        << "\n"
        << "Shows the track you are playing as Discord Rich Presence and lets\n"
        << "friends listen along.\n"
        << "\n"
        << "Options:\n"
        << "  --register-uri     register the listenalong:// and discord-<id>:// handlers\n"
        << "  --clear            clear a stuck Rich Presence and exit\n"
        << "  --config <path>    use this configuration file\n"
        << "  --version          print the version and exit\n"
        << "  --help             show this help\n"
        << "\n"
        << "With a listenalong:// or discord-<id>:// argument, resolves the invite\n"
        << "and exits.\n";
}

std::optional<Options> parse_arguments(const std::vector<std::string>& args) {
    Options options;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.mode = Mode::Help;
            return options;
        }
        if (arg == "--version" || arg == "-v") {
            options.mode = Mode::Version;
            return options;
        }
        if (arg == "--register-uri") {
            options.mode = Mode::RegisterUri;
        } else if (arg == "--clear") {
            options.mode = Mode::Clear;
        } else if (arg == "--config") {
            if (i + 1 >= args.size()) {
                std::cerr << "--config needs a path" << std::endl;
                return std::nullopt;
            }
            options.config_path = args[++i];
        } else if (services::looks_like_invite_uri(arg)) {
            if (options.mode == Mode::Host) {
                options.mode = Mode::Listen;
                options.invite_uri = arg;
            }
        } else if (arg.starts_with("-")) {
            std::cerr << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        }
        // Anything else (e.g. Qt's own arguments) is ignored
    }
    return options;
}

std::unique_ptr<utils::Logger> setup_logging(utils::LogLevel level, const std::filesystem::path& config_path) {
    auto logger = std::make_unique<utils::Logger>(level);
    logger->add_sink(std::make_unique<utils::ConsoleSink>(true));

    const auto log_path = config_path.parent_path() / "listen-along.log";
    auto file_sink = std::make_unique<utils::FileSink>(log_path);
    if (file_sink->is_open()) {
        logger->add_sink(std::move(file_sink));
    } else {
        std::cerr << "Could not open log file " << log_path << std::endl;
    }
    return logger;
}

int run_clear(const core::ApplicationConfig& config) {
    if (config.discord.client_id.empty()) {
        std::cerr << "Set discord.client_id in the configuration first." << std::endl;
        return EXIT_FAILURE_CODE;
    }

    services::DiscordPresenceSession session(config.discord.client_id);
    if (auto connected = session.connect(); !connected) {
        std::cerr << "Could not clear (is Discord running?): " << core::to_string(connected.error()) << std::endl;
        return EXIT_FAILURE_CODE;
    }

    if (auto result = session.clear_for_pid(services::DiscordIpc::current_process_id()); !result) {
        LOG_WARNING("Main", "Clearing own activity failed: " + core::to_string(result.error()));
    }
    // Some clients keep the activity under pid 0
    if (auto result = session.clear_for_pid(0); !result) {
        LOG_DEBUG("Main", "Clearing pid 0 failed: " + core::to_string(result.error()));
    }
    session.disconnect();

    std::cout << "Rich Presence cleared. If it persists, restart Discord." << std::endl;
    return EXIT_OK;
}

int run_register_uri(const core::ApplicationConfig& config) {
    auto registrar = platform::UriSchemeRegistrar::create("Listen Along");

    bool ok = true;
    if (auto result = registrar->register_scheme(services::INVITE_SCHEME, "Listen Along invite"); !result) {
        std::cerr << "Could not register " << services::INVITE_SCHEME << "://: "
                  << platform::to_string(result.error()) << std::endl;
        ok = false;
    }

    if (config.deep_link.register_discord_launch) {
        if (config.discord.client_id.empty()) {
            std::cerr << "discord.client_id is not set, skipping the Discord launch handler" << std::endl;
        } else {
            const auto scheme = "discord-" + config.discord.client_id;
            if (auto result = registrar->register_scheme(scheme, "Listen Along (Discord)"); !result) {
                std::cerr << "Could not register " << scheme << "://: " << platform::to_string(result.error())
                          << std::endl;
                ok = false;
            }
        }
    }

    if (ok) {
        std::cout << "URI handlers registered." << std::endl;
    }
    return ok ? EXIT_OK : EXIT_FAILURE_CODE;
}

int run_listener(const core::ApplicationConfig& config, const std::string& uri,
                 const std::filesystem::path& config_path) {
    auto invite = services::parse_invite(uri);
    if (!invite) {
        std::cerr << "Not a listen-along invite: " << uri << std::endl;
        return EXIT_FAILURE_CODE;
    }

    std::shared_ptr<services::HttpClient> http_client = services::create_http_client();
    std::shared_ptr<platform::BrowserLauncher> browser = platform::create_browser_launcher();

    // Playback only with an existing login; the listener never starts an interactive one
    std::shared_ptr<services::PlaybackService> playback;
    const auto& spotify = config.sources.spotify;
    if (spotify.enabled && !spotify.client_id.empty()) {
        auto storage = std::make_shared<services::SpotifyAuthStorage>(config_path.parent_path() / "auth.yaml");
        auto authenticator = std::make_shared<services::SpotifyAuthenticator>(http_client, storage, spotify, browser);
        if (authenticator->has_credentials()) {
            playback = std::make_shared<services::SpotifyClient>(http_client, authenticator);
        }
    }

    services::DeepLinkResolver resolver(playback, browser, config.deep_link);
    const auto action = resolver.resolve(*invite);

    switch (action) {
        case services::DeepLinkAction::Played:
            std::cout << "Playing " << invite->title << std::endl;
            return EXIT_OK;
        case services::DeepLinkAction::OpenedWebSearch:
            std::cout << "Opened a search for " << invite->title << std::endl;
            return EXIT_OK;
        case services::DeepLinkAction::Rejected:
            break;
    }
    std::cerr << "Could not open the invite." << std::endl;
    return EXIT_FAILURE_CODE;
}

int run_host(std::shared_ptr<core::ConfigManager> config_service) {
    auto single_instance = platform::SingleInstanceManager::create("listen-along");
    auto acquired = single_instance->try_acquire_instance();
    if (!acquired || !*acquired) {
        std::cerr << "Another instance of Listen Along is already running." << std::endl;
        return EXIT_FAILURE_CODE;
    }

    auto app_result = core::create_application(std::move(config_service));
    if (!app_result) {
        LOG_ERROR("Main", "Application creation failed: " + core::to_string(app_result.error()));
        return EXIT_FAILURE_CODE;
    }

    auto app = std::move(*app_result);
    g_app_instance = app.get();

    if (auto result = app->initialize(); !result) {
        LOG_ERROR("Main", "Application initialization failed: " + core::to_string(result.error()));
        g_app_instance = nullptr;
        return EXIT_FAILURE_CODE;
    }

    if (auto result = app->start(); !result) {
        LOG_ERROR("Main", "Application start failed: " + core::to_string(result.error()));
        app->shutdown();
        g_app_instance = nullptr;
        return EXIT_FAILURE_CODE;
    }

    std::cout << "\nListen Along v" << LISTEN_ALONG_VERSION_STRING << " running\n"
              << "Press Ctrl+C to exit\n" << std::endl;

#ifdef USE_QT_UI
    QTimer update_timer;
    QObject::connect(&update_timer, &QTimer::timeout, [&app]() {
        if (g_shutdown_requested || !app->is_running()) {
            QApplication::quit();
        }
    });
    update_timer.start(100);
    QApplication::exec();
#else
    while (!g_shutdown_requested && app->is_running()) {
        app->run_once();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
#endif

    LOG_INFO("Main", "Shutting down...");
    app->quit();
    g_app_instance = nullptr;
    single_instance->release_instance();
    return EXIT_OK;
}

#ifdef USE_QT_UI
void setup_qt_application(QApplication& app) {
    app.setApplicationName("Listen Along");
    app.setApplicationDisplayName("Listen Along");
    app.setQuitOnLastWindowClosed(false);
#ifdef Q_OS_LINUX
    app.setDesktopFileName("listen-along");
#endif
}
#endif

} // anonymous namespace

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    auto options = parse_arguments(args);
    if (!options) {
        print_usage(std::cerr);
        return EXIT_FAILURE_CODE;
    }

    switch (options->mode) {
        case Mode::Help:
            print_usage(std::cout);
            return EXIT_OK;
        case Mode::Version:
            std::cout << "listen-along " << LISTEN_ALONG_VERSION_STRING << std::endl;
            return EXIT_OK;
        default:
            break;
    }

#ifdef USE_QT_UI
    QApplication qt_app(argc, argv);
    setup_qt_application(qt_app);
#endif

    auto config_service = std::make_shared<core::ConfigManager>(options->config_path);
    if (auto loaded = config_service->load(); !loaded) {
        std::cerr << "Could not read " << config_service->path() << ", using defaults" << std::endl;
    }

    const auto& config = config_service->get();
    utils::LoggerManager::set_instance(setup_logging(config.log_level, config_service->path()));
    LOG_INFO("Main", std::string("Listen Along v") + LISTEN_ALONG_VERSION_STRING + " starting");
    LOG_DEBUG("Main", "Log level: " + utils::to_string(config.log_level));

    register_signal_handlers();
    std::atexit(release_on_exit);

    try {
        switch (options->mode) {
            case Mode::Clear:
                return run_clear(config);
            case Mode::RegisterUri:
                return run_register_uri(config);
            case Mode::Listen:
                return run_listener(config, options->invite_uri, config_service->path());
            default:
                return run_host(config_service);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Main", "Fatal: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return EXIT_FAILURE_CODE;
    }
}
