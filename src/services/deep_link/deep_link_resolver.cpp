#include "listen_along/services/deep_link/deep_link_resolver.hpp"
#include "listen_along/platform/browser_launcher.hpp"
#include "listen_along/utils/logger.hpp"
#include "listen_along/utils/url_utils.hpp"
#include <algorithm>

namespace listen_along {
namespace services {

std::string to_string(DeepLinkAction action) {
    switch (action) {
        case DeepLinkAction::Played: return "played";
        case DeepLinkAction::OpenedWebSearch: return "opened web search";
        case DeepLinkAction::Rejected: return "rejected";
    }
    return "unknown";
}

DeepLinkResolver::DeepLinkResolver(std::shared_ptr<PlaybackService> playback,
                                   std::shared_ptr<platform::BrowserLauncher> browser,
                                   core::DeepLinkConfig config,
                                   Clock clock)
    : m_playback(std::move(playback))
    , m_browser(std::move(browser))
    , m_config(std::move(config))
    , m_clock(std::move(clock)) {}

std::chrono::milliseconds DeepLinkResolver::playback_offset(const InvitePayload& invite) const {
    auto offset = m_config.latency_offset;
    if (invite.started_at) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(m_clock() - *invite.started_at);
        if (elapsed.count() > 0) {
            offset += elapsed;
        }
    }
    return std::max(offset, std::chrono::milliseconds(0));
}

std::string DeepLinkResolver::web_search_url(const InvitePayload& invite) const {
    std::string query = invite.title;
    if (!invite.artist.empty()) {
        query += " " + invite.artist;
    }

    auto url = m_config.web_search_url;
    const std::string placeholder = "{query}";
    const auto encoded = utils::UrlUtils::encode(query);
    if (auto pos = url.find(placeholder); pos != std::string::npos) {
        url.replace(pos, placeholder.size(), encoded);
    } else {
        url += encoded;
    }
    return url;
}

DeepLinkAction DeepLinkResolver::resolve(const InvitePayload& invite) {
    if (invite.title.empty()) {
        LOG_WARNING("DeepLink", "Invite carries no track title");
        return DeepLinkAction::Rejected;
    }

    LOG_INFO("DeepLink", "Resolving invite for " + invite.title +
             (invite.artist.empty() ? std::string{} : " by " + invite.artist));

    if (try_playback(invite)) {
        return DeepLinkAction::Played;
    }

    if (!m_browser) {
        return DeepLinkAction::Rejected;
    }

    const auto url = web_search_url(invite);
    auto opened = m_browser->open_url(url);
    if (!opened) {
        LOG_ERROR("DeepLink", "Could not open web search: " + platform::to_string(opened.error()));
        return DeepLinkAction::Rejected;
    }
    return DeepLinkAction::OpenedWebSearch;
}

bool DeepLinkResolver::try_playback(const InvitePayload& invite) {
    if (!m_playback || !m_playback->has_active_session()) {
        LOG_DEBUG("DeepLink", "No authorized streaming session, using web search");
        return false;
    }

    std::string uri;
    if (invite.spotify_track_id) {
        uri = m_playback->track_uri(*invite.spotify_track_id);
    } else {
        auto found = m_playback->find_track(invite.title, invite.artist);
        if (!found) {
            LOG_INFO("DeepLink", "Track lookup failed: " + core::to_string(found.error()));
            return false;
        }
        uri = *found;
    }

    auto played = m_playback->start_playback(uri, playback_offset(invite));
    if (!played) {
        LOG_INFO("DeepLink", "Playback failed: " + core::to_string(played.error()));
        return false;
    }
    return true;
}

} // namespace services
} // namespace listen_along
