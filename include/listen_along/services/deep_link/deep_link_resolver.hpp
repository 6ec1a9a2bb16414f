#pragma once

#include "listen_along/core/models.hpp"
#include "listen_along/services/deep_link/invite.hpp"
#include "listen_along/services/deep_link/playback_service.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace listen_along {
namespace platform {
    class BrowserLauncher;
}
namespace services {

enum class DeepLinkAction {
    Played,           // playback started on the streaming service
    OpenedWebSearch,  // fell back to a web search in the browser
    Rejected          // nothing usable in the invite, or the browser failed too
};

std::string to_string(DeepLinkAction action);

/**
 * @brief Turns an inbound listen-along invite into local playback.
 *
 * One playback attempt on the streaming service, then one fallback to a
 * web search. Never loops.
 */
class DeepLinkResolver {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    DeepLinkResolver(std::shared_ptr<PlaybackService> playback,
                     std::shared_ptr<platform::BrowserLauncher> browser,
                     core::DeepLinkConfig config,
                     Clock clock = std::chrono::system_clock::now);

    DeepLinkAction resolve(const InvitePayload& invite);

    // Template with {query} replaced by the URL-encoded "title artist".
    std::string web_search_url(const InvitePayload& invite) const;

    // Where the host is in the track now, plus the configured latency offset.
    std::chrono::milliseconds playback_offset(const InvitePayload& invite) const;

private:
    std::shared_ptr<PlaybackService> m_playback;
    std::shared_ptr<platform::BrowserLauncher> m_browser;
    core::DeepLinkConfig m_config;
    Clock m_clock;

    bool try_playback(const InvitePayload& invite);
};

} // namespace services
} // namespace listen_along
