#include "fakes.hpp"

#include "listen_along/services/deep_link/deep_link_resolver.hpp"

#include <gtest/gtest.h>

using namespace listen_along;
using namespace listen_along::testing;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;
using ::testing::StrictMock;

namespace {

const auto NOW = std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'100));
const std::string SPOTIFY_ID = "4uLU6hMCjMI75M1A2tKUQC";

services::InvitePayload invite_for(std::string title, std::string artist) {
    services::InvitePayload invite;
    invite.title = std::move(title);
    invite.artist = std::move(artist);
    invite.started_at = NOW - 100s;
    return invite;
}

struct ResolverFixture : ::testing::Test {
    std::shared_ptr<StrictMock<MockPlaybackService>> playback = std::make_shared<StrictMock<MockPlaybackService>>();
    std::shared_ptr<StrictMock<MockBrowserLauncher>> browser = std::make_shared<StrictMock<MockBrowserLauncher>>();
    core::DeepLinkConfig config;

    services::DeepLinkResolver make_resolver(bool with_playback = true) {
        return services::DeepLinkResolver(with_playback ? playback : nullptr, browser, config,
                                          [] { return NOW; });
    }
};

} // namespace

TEST_F(ResolverFixture, PlaysByTrackIdWithOffset) {
    auto invite = invite_for("Song A", "Artist X");
    invite.spotify_track_id = SPOTIFY_ID;

    EXPECT_CALL(*playback, has_active_session()).WillOnce(Return(true));
    EXPECT_CALL(*playback, start_playback("spotify:track:" + SPOTIFY_ID, std::chrono::milliseconds(101'500)))
        .WillOnce(Return(std::expected<void, core::PlaybackError>{}));

    EXPECT_EQ(make_resolver().resolve(invite), services::DeepLinkAction::Played);
}

TEST_F(ResolverFixture, SearchesWhenNoTrackId) {
    auto invite = invite_for("Song A", "Artist X");

    EXPECT_CALL(*playback, has_active_session()).WillOnce(Return(true));
    EXPECT_CALL(*playback, find_track("Song A", "Artist X"))
        .WillOnce(Return(std::string("spotify:track:found")));
    EXPECT_CALL(*playback, start_playback("spotify:track:found", _))
        .WillOnce(Return(std::expected<void, core::PlaybackError>{}));

    EXPECT_EQ(make_resolver().resolve(invite), services::DeepLinkAction::Played);
}

TEST_F(ResolverFixture, NoSessionOpensWebSearch) {
    EXPECT_CALL(*playback, has_active_session()).WillOnce(Return(false));
    EXPECT_CALL(*browser, open_url("https://open.spotify.com/search/Song%20A%20Artist%20X"))
        .WillOnce(Return(std::expected<void, platform::BrowserLaunchError>{}));

    EXPECT_EQ(make_resolver().resolve(invite_for("Song A", "Artist X")),
              services::DeepLinkAction::OpenedWebSearch);
}

TEST_F(ResolverFixture, NoPlaybackServiceOpensWebSearch) {
    EXPECT_CALL(*browser, open_url(_)).WillOnce(Return(std::expected<void, platform::BrowserLaunchError>{}));

    EXPECT_EQ(make_resolver(false).resolve(invite_for("Song A", "Artist X")),
              services::DeepLinkAction::OpenedWebSearch);
}

TEST_F(ResolverFixture, FailedPlaybackFallsBackOnce) {
    EXPECT_CALL(*playback, has_active_session()).WillOnce(Return(true));
    EXPECT_CALL(*playback, find_track(_, _)).WillOnce(Return(std::string("spotify:track:x")));
    EXPECT_CALL(*playback, start_playback(_, _))
        .WillOnce(Return(std::unexpected(core::PlaybackError::NoActiveDevice)));
    EXPECT_CALL(*browser, open_url(_)).WillOnce(Return(std::expected<void, platform::BrowserLaunchError>{}));

    EXPECT_EQ(make_resolver().resolve(invite_for("Song A", "Artist X")),
              services::DeepLinkAction::OpenedWebSearch);
}

TEST_F(ResolverFixture, TrackNotFoundFallsBack) {
    EXPECT_CALL(*playback, has_active_session()).WillOnce(Return(true));
    EXPECT_CALL(*playback, find_track(_, _)).WillOnce(Return(std::unexpected(core::PlaybackError::TrackNotFound)));
    EXPECT_CALL(*browser, open_url(_)).WillOnce(Return(std::expected<void, platform::BrowserLaunchError>{}));

    EXPECT_EQ(make_resolver().resolve(invite_for("Song A", "Artist X")),
              services::DeepLinkAction::OpenedWebSearch);
}

TEST_F(ResolverFixture, BrowserFailureRejects) {
    EXPECT_CALL(*browser, open_url(_))
        .WillOnce(Return(std::unexpected(platform::BrowserLaunchError::LaunchFailed)));

    EXPECT_EQ(make_resolver(false).resolve(invite_for("Song A", "Artist X")),
              services::DeepLinkAction::Rejected);
}

TEST_F(ResolverFixture, EmptyTitleRejectsWithoutCalls) {
    auto invite = invite_for("", "Artist X");
    invite.spotify_track_id = SPOTIFY_ID;

    EXPECT_EQ(make_resolver().resolve(invite), services::DeepLinkAction::Rejected);
}

TEST_F(ResolverFixture, WebSearchTemplate) {
    config.web_search_url = "https://music.example/find?q={query}&src=invite";
    auto resolver = make_resolver();

    EXPECT_EQ(resolver.web_search_url(invite_for("Ünï", "")), "https://music.example/find?q=%C3%9Cn%C3%AF&src=invite");

    config.web_search_url = "https://music.example/search/";
    EXPECT_EQ(make_resolver().web_search_url(invite_for("A B", "C")), "https://music.example/search/A%20B%20C");
}

TEST_F(ResolverFixture, PlaybackOffset) {
    auto resolver = make_resolver();

    EXPECT_EQ(resolver.playback_offset(invite_for("x", "y")), 101'500ms);

    services::InvitePayload no_start;
    EXPECT_EQ(resolver.playback_offset(no_start), 1500ms);

    services::InvitePayload future;
    future.started_at = NOW + 10s;
    EXPECT_EQ(resolver.playback_offset(future), 1500ms);
}
