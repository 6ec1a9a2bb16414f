#include "listen_along/services/spotify/spotify_authenticator.hpp"
#include "listen_along/services/spotify/spotify_auth_storage.hpp"
#include "listen_along/services/network/http_client.hpp"
#include "listen_along/services/network/request_builder.hpp"
#include "listen_along/platform/browser_launcher.hpp"
#include "listen_along/utils/json_helper.hpp"
#include "listen_along/utils/logger.hpp"
#include "listen_along/utils/url_utils.hpp"

#include <algorithm>
#include <random>
#include <sstream>
#include <iomanip>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace listen_along {
namespace services {

namespace {

#ifdef _WIN32
using socket_t = SOCKET;
constexpr socket_t INVALID_SOCK = INVALID_SOCKET;
void close_socket(socket_t s) { closesocket(s); }
#else
using socket_t = int;
constexpr socket_t INVALID_SOCK = -1;
void close_socket(socket_t s) { close(s); }
#endif

// Closes the socket on scope exit
class ScopedSocket {
public:
    explicit ScopedSocket(socket_t s) : m_socket(s) {}
    ~ScopedSocket() { if (m_socket != INVALID_SOCK) close_socket(m_socket); }
    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    socket_t get() const { return m_socket; }
    bool valid() const { return m_socket != INVALID_SOCK; }

private:
    socket_t m_socket;
};

bool wait_readable(socket_t s, std::chrono::milliseconds timeout) {
#ifdef _WIN32
    WSAPOLLFD pfd{};
    pfd.fd = s;
    pfd.events = POLLRDNORM;
    return WSAPoll(&pfd, 1, static_cast<INT>(timeout.count())) > 0;
#else
    pollfd pfd{};
    pfd.fd = s;
    pfd.events = POLLIN;
    return poll(&pfd, 1, static_cast<int>(timeout.count())) > 0;
#endif
}

std::string random_state() {
    std::random_device rd;
    std::uniform_int_distribution<unsigned> dist(0, 255);
    std::ostringstream oss;
    for (int i = 0; i < 16; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << dist(rd);
    }
    return oss.str();
}

// "GET /callback?code=...&state=... HTTP/1.1" -> query parameters
std::unordered_map<std::string, std::string> parse_request_query(const std::string& request) {
    const auto line_end = request.find("\r\n");
    const auto line = request.substr(0, line_end);
    const auto first_space = line.find(' ');
    const auto second_space = line.find(' ', first_space + 1);
    if (first_space == std::string::npos || second_space == std::string::npos) {
        return {};
    }

    const auto target = line.substr(first_space + 1, second_space - first_space - 1);
    const auto q = target.find('?');
    if (q == std::string::npos) {
        return {};
    }
    return utils::UrlUtils::parse_query_string(target.substr(q + 1));
}

void send_page(socket_t s, const std::string& message) {
    const std::string body = "<html><body><h2>" + message + "</h2>You can close this window.</body></html>";
    const std::string response =
        "HTTP/1.1 200 OK\r\nContent-Type: text/html; charset=utf-8\r\nConnection: close\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
    send(s, response.data(), static_cast<int>(response.size()), 0);
}

} // namespace

SpotifyAuthenticator::SpotifyAuthenticator(std::shared_ptr<HttpClient> http_client,
                                           std::shared_ptr<SpotifyAuthStorage> storage,
                                           core::SpotifyConfig config,
                                           std::shared_ptr<platform::BrowserLauncher> browser_launcher)
    : m_http_client(std::move(http_client))
    , m_storage(std::move(storage))
    , m_config(std::move(config))
    , m_browser_launcher(std::move(browser_launcher)) {
    if (!m_browser_launcher) {
        m_browser_launcher = platform::create_browser_launcher();
    }
}

bool SpotifyAuthenticator::has_credentials() const {
    return !m_storage->get_refresh_token().empty();
}

void SpotifyAuthenticator::invalidate() {
    std::lock_guard lock(m_token_mutex);
    m_access_token.clear();
    m_expires_at = {};
}

void SpotifyAuthenticator::shutdown() {
    m_shutting_down = true;
}

std::string SpotifyAuthenticator::authorization_url(const std::string& state) const {
    return std::string(AUTHORIZE_URL) + "?" + utils::UrlUtils::build_query_string({
        {"client_id", m_config.client_id},
        {"response_type", "code"},
        {"redirect_uri", m_config.redirect_uri},
        {"scope", SCOPES},
        {"state", state}
    });
}

std::expected<std::string, core::PlaybackError> SpotifyAuthenticator::access_token() {
    std::lock_guard lock(m_token_mutex);

    if (!m_access_token.empty() && std::chrono::steady_clock::now() < m_expires_at) {
        return m_access_token;
    }

    const auto refresh_token = m_storage->get_refresh_token();
    if (refresh_token.empty()) {
        return std::unexpected(core::PlaybackError::NotAuthorized);
    }

    LOG_DEBUG("SpotifyAuth", "Refreshing access token");
    auto result = request_token(utils::UrlUtils::build_query_string({
        {"grant_type", "refresh_token"},
        {"refresh_token", refresh_token}
    }));
    if (!result) {
        return std::unexpected(result.error());
    }
    return m_access_token;
}

std::expected<void, core::PlaybackError> SpotifyAuthenticator::authorize(std::chrono::seconds timeout) {
    const auto state = random_state();
    const auto url = authorization_url(state);

    LOG_INFO("SpotifyAuth", "Starting Spotify authorization");
    m_browser_launcher->show_message(
        "Spotify Authorization",
        "A browser window will open so you can allow Listen Along to read and control Spotify playback.");

    if (auto opened = m_browser_launcher->open_url(url); !opened) {
        LOG_WARNING("SpotifyAuth", "Could not open browser, visit manually: " + url);
    }

    auto code = wait_for_code(state, timeout);
    if (!code) {
        return std::unexpected(code.error());
    }

    std::lock_guard lock(m_token_mutex);
    auto result = request_token(utils::UrlUtils::build_query_string({
        {"grant_type", "authorization_code"},
        {"code", *code},
        {"redirect_uri", m_config.redirect_uri}
    }));
    if (result) {
        LOG_INFO("SpotifyAuth", "Spotify authorization complete");
    }
    return result;
}

// Caller holds m_token_mutex
std::expected<void, core::PlaybackError> SpotifyAuthenticator::request_token(const std::string& form_body) {
    auto request = RequestBuilder(TOKEN_URL)
        .method(HttpMethod::POST)
        .form_body(form_body)
        .basic_auth(m_config.client_id, m_config.client_secret)
        .build();

    auto response = m_http_client->execute(request);
    if (!response) {
        LOG_WARNING("SpotifyAuth", "Token request failed: " + to_string(response.error()));
        return std::unexpected(core::PlaybackError::NetworkError);
    }
    if (response->status() == 400 || response->status() == 401) {
        LOG_WARNING("SpotifyAuth", "Spotify rejected the token request, re-authorization required");
        m_storage->clear();
        return std::unexpected(core::PlaybackError::NotAuthorized);
    }
    if (!response->is_success()) {
        LOG_WARNING("SpotifyAuth", "Token request returned HTTP " + std::to_string(response->status()));
        return std::unexpected(core::PlaybackError::ServerError);
    }

    auto parsed = utils::JsonHelper::safe_parse(response->body);
    if (!parsed) {
        LOG_ERROR("SpotifyAuth", "Failed to parse token response: " + parsed.error());
        return std::unexpected(core::PlaybackError::ServerError);
    }

    auto token = utils::JsonHelper::get_required<std::string>(*parsed, "access_token");
    if (!token) {
        LOG_ERROR("SpotifyAuth", token.error());
        return std::unexpected(core::PlaybackError::ServerError);
    }

    const auto expires_in = utils::JsonHelper::get_optional<int>(*parsed, "expires_in", 3600);
    m_access_token = *token;
    // Refresh a minute early
    m_expires_at = std::chrono::steady_clock::now() + std::chrono::seconds(std::max(expires_in - 60, 0));

    const auto refresh = utils::JsonHelper::get_optional<std::string>(*parsed, "refresh_token", "");
    if (!refresh.empty()) {
        m_storage->set_refresh_token(refresh);
    }
    return {};
}

std::expected<std::string, core::PlaybackError> SpotifyAuthenticator::wait_for_code(
        const std::string& state, std::chrono::seconds timeout) {
    const auto port = utils::UrlUtils::get_port(m_config.redirect_uri).value_or(80);

#ifdef _WIN32
    WSADATA wsa{};
    if (WSAStartup(MAKEWORD(2, 2), &wsa) != 0) {
        return std::unexpected(core::PlaybackError::NetworkError);
    }
    struct WsaCleanup { ~WsaCleanup() { WSACleanup(); } } wsa_cleanup;
#endif

    ScopedSocket listener(socket(AF_INET, SOCK_STREAM, 0));
    if (!listener.valid()) {
        return std::unexpected(core::PlaybackError::NetworkError);
    }

    int reuse = 1;
    setsockopt(listener.get(), SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&reuse), sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<std::uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (bind(listener.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        listen(listener.get(), 1) != 0) {
        LOG_ERROR("SpotifyAuth", "Cannot listen on port " + std::to_string(port) + " for the redirect");
        return std::unexpected(core::PlaybackError::NetworkError);
    }

    LOG_INFO("SpotifyAuth", "Waiting for Spotify redirect on port " + std::to_string(port));
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (std::chrono::steady_clock::now() < deadline) {
        if (m_shutting_down) {
            return std::unexpected(core::PlaybackError::NotAuthorized);
        }
        if (!wait_readable(listener.get(), std::chrono::milliseconds(250))) {
            continue;
        }

        ScopedSocket client(accept(listener.get(), nullptr, nullptr));
        if (!client.valid() || !wait_readable(client.get(), std::chrono::seconds(5))) {
            continue;
        }

        char buffer[4096];
        const auto received = recv(client.get(), buffer, sizeof(buffer) - 1, 0);
        if (received <= 0) {
            continue;
        }

        const auto params = parse_request_query(std::string(buffer, static_cast<std::size_t>(received)));
        const auto code = params.find("code");
        const auto returned_state = params.find("state");

        if (params.contains("error")) {
            send_page(client.get(), "Authorization was denied.");
            LOG_WARNING("SpotifyAuth", "Authorization denied: " + params.at("error"));
            return std::unexpected(core::PlaybackError::NotAuthorized);
        }
        if (code == params.end() || returned_state == params.end() || returned_state->second != state) {
            // Favicon requests and stray connections
            continue;
        }

        send_page(client.get(), "Listen Along is connected to Spotify.");
        return code->second;
    }

    LOG_ERROR("SpotifyAuth", "Timed out waiting for Spotify authorization");
    return std::unexpected(core::PlaybackError::NotAuthorized);
}

} // namespace services
} // namespace listen_along
