#include "fakes.hpp"

#include "listen_along/core/event_bus.hpp"
#include "listen_along/core/events.hpp"

#include <gtest/gtest.h>

using namespace listen_along;
using namespace listen_along::testing;

// ============================================================================
// Track identity
// ============================================================================

TEST(TrackIdentity, IgnoresPositionAlbumAndArtwork) {
    auto a = make_track("Song", "Artist");
    auto b = a;
    b.position_ms = 99'000;
    b.album = "Live at Somewhere";
    b.artwork_bytes = bytes_of("png");
    b.is_playing = false;

    EXPECT_TRUE(core::same_track(a, b));
}

TEST(TrackIdentity, SourceTitleAndArtistMatter) {
    const auto base = make_track("Song", "Artist");
    EXPECT_FALSE(core::same_track(base, make_track("Song", "Other")));
    EXPECT_FALSE(core::same_track(base, make_track("Other", "Artist")));
    EXPECT_FALSE(core::same_track(base, make_track("Song", "Artist", core::SourceId::FallbackSource)));
}

TEST(TrackIdentity, OptionalComparison) {
    std::optional<core::TrackSnapshot> none;
    std::optional<core::TrackSnapshot> some = make_track("Song", "Artist");

    EXPECT_TRUE(core::same_track(none, none));
    EXPECT_FALSE(core::same_track(none, some));
    EXPECT_FALSE(core::same_track(some, none));
    EXPECT_TRUE(core::same_track(some, some));
}

TEST(ArtworkCacheKey, StableAndIndependentOfBytes) {
    auto a = make_track("Song", "Artist");
    auto b = a;
    b.artwork_bytes = bytes_of("different");

    const auto key = core::artwork_cache_key(a);
    EXPECT_EQ(key, core::artwork_cache_key(b));
    EXPECT_TRUE(key.starts_with("media-session-"));
    EXPECT_EQ(key.size(), std::string("media-session-").size() + 16);
}

TEST(ArtworkCacheKey, FieldBoundariesMatter) {
    EXPECT_NE(core::artwork_cache_key(make_track("ab", "c")),
              core::artwork_cache_key(make_track("a", "bc")));
    EXPECT_TRUE(core::artwork_cache_key(make_track("a", "b", core::SourceId::FallbackSource))
                    .starts_with("spotify-"));
}

TEST(EnumNames, Strings) {
    EXPECT_EQ(core::to_string(core::SourceId::PrimarySource), "media-session");
    EXPECT_EQ(core::to_string(core::SourceId::FallbackSource), "spotify");
    EXPECT_FALSE(core::to_string(core::SessionError::NotConnected).empty());
    EXPECT_FALSE(core::to_string(core::ApplicationError::StartupConnectFailed).empty());
}

// ============================================================================
// EventBus
// ============================================================================

TEST(EventBus, DeliversByType) {
    core::EventBus bus;
    std::vector<std::string> seen;

    bus.subscribe<core::events::PresenceCleared>(
        [&](const core::events::PresenceCleared& event) { seen.push_back("cleared:" + event.reason); });
    bus.subscribe<core::events::JoinReceived>(
        [&](const core::events::JoinReceived& event) { seen.push_back("join:" + event.secret); });

    bus.publish(core::events::PresenceCleared("idle"));
    bus.publish(core::events::JoinReceived("s"));

    EXPECT_EQ(seen, (std::vector<std::string>{"cleared:idle", "join:s"}));
}

TEST(EventBus, UnsubscribeAndClear) {
    core::EventBus bus;
    int calls = 0;
    auto id = bus.subscribe<core::events::PresenceCleared>(
        [&](const core::events::PresenceCleared&) { ++calls; });
    bus.subscribe<core::events::PresenceCleared>(
        [&](const core::events::PresenceCleared&) { ++calls; });
    EXPECT_EQ(bus.subscriber_count<core::events::PresenceCleared>(), 2u);

    bus.unsubscribe(id);
    bus.publish(core::events::PresenceCleared{});
    EXPECT_EQ(calls, 1);

    bus.clear();
    bus.publish(core::events::PresenceCleared{});
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bus.subscriber_count<core::events::PresenceCleared>(), 0u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    core::EventBus bus;
    bool second_called = false;
    bus.subscribe<core::events::PresenceCleared>(
        [](const core::events::PresenceCleared&) { throw std::runtime_error("boom"); });
    bus.subscribe<core::events::PresenceCleared>(
        [&](const core::events::PresenceCleared&) { second_called = true; });

    EXPECT_NO_THROW(bus.publish(core::events::PresenceCleared{}));
    EXPECT_TRUE(second_called);
}
