#include "fakes.hpp"

#include "listen_along/core/events.hpp"
#include "listen_along/core/presence_reconciler.hpp"

#include <gtest/gtest.h>

using namespace listen_along;
using namespace listen_along::testing;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

const auto FIXED_NOW = std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000));

struct ReconcilerFixture : ::testing::Test {
    std::shared_ptr<FakePresenceSession> session = std::make_shared<FakePresenceSession>();
    std::shared_ptr<NiceMock<MockImageHost>> host = std::make_shared<NiceMock<MockImageHost>>();
    std::shared_ptr<services::ArtworkPublisher> artwork = std::make_shared<services::ArtworkPublisher>(host);
    std::shared_ptr<core::EventBus> bus = std::make_shared<core::EventBus>();

    std::unique_ptr<core::PresenceReconciler> make_reconciler(core::PublishedState initial = {}) {
        return std::make_unique<core::PresenceReconciler>(
            session, artwork, services::PresenceBuilder{}, bus, std::move(initial),
            [] { return FIXED_NOW; });
    }
};

core::TrackSnapshot with_artwork(core::TrackSnapshot track, const std::string& bytes = "jpeg") {
    track.artwork_bytes = bytes_of(bytes);
    return track;
}

} // namespace

// ============================================================================
// Tick scenarios
// ============================================================================

TEST_F(ReconcilerFixture, FiveTickScenario) {
    auto primary = std::make_shared<FakeSourceAdapter>("mpris", core::SourceId::PrimarySource);
    auto fallback = std::make_shared<FakeSourceAdapter>("spotify", core::SourceId::FallbackSource);
    services::Arbitrator arbitrator({fallback, primary});

    const auto song_a = with_artwork(make_track("Song A", "Artist X"));
    primary->will_play(song_a);
    primary->will_play(song_a);
    primary->will_idle();

    fallback->will_play(make_track("Song B", "Artist Y", core::SourceId::FallbackSource));
    fallback->will_idle();

    EXPECT_CALL(*host, upload(_))
        .Times(1)
        .WillOnce(Return(std::string("https://files.catbox.moe/a.jpg")));

    auto reconciler = make_reconciler();

    // Tick 1: one update, with artwork
    reconciler->tick(arbitrator.select());
    ASSERT_EQ(session->update_calls, 1);
    EXPECT_EQ(session->updates.back().details, "Song A");
    EXPECT_EQ(session->updates.back().large_image_key, "https://files.catbox.moe/a.jpg");
    EXPECT_EQ(reconciler->state(), core::PresenceState::Active);

    // Tick 2: identical snapshot
    reconciler->tick(arbitrator.select());
    EXPECT_EQ(session->remote_calls(), 1);

    // Tick 3: primary idle, fallback playing
    reconciler->tick(arbitrator.select());
    ASSERT_EQ(session->update_calls, 2);
    EXPECT_EQ(session->updates.back().details, "Song B");
    EXPECT_EQ(session->updates.back().large_image_key, "music");
    EXPECT_EQ(session->clear_calls, 0);

    // Tick 4: nothing anywhere
    reconciler->tick(arbitrator.select());
    EXPECT_EQ(session->clear_calls, 1);
    EXPECT_EQ(session->update_calls, 2);
    EXPECT_EQ(reconciler->state(), core::PresenceState::Idle);
    EXPECT_FALSE(reconciler->published().last_snapshot.has_value());

    // Tick 5: still nothing
    reconciler->tick(arbitrator.select());
    EXPECT_EQ(session->remote_calls(), 3);
}

TEST_F(ReconcilerFixture, IdenticalSnapshotsProduceOneUpdate) {
    auto reconciler = make_reconciler();
    auto track = make_track("Hurt", "Johnny Cash");

    for (int i = 0; i < 10; ++i) {
        track.position_ms = i * 5000;  // position alone never re-sends
        reconciler->tick(track);
    }

    EXPECT_EQ(session->update_calls, 1);
    EXPECT_EQ(session->clear_calls, 0);
}

TEST_F(ReconcilerFixture, ClearIsSentOncePerTransition) {
    auto reconciler = make_reconciler();
    reconciler->tick(make_track("Hurt", "Johnny Cash"));

    for (int i = 0; i < 5; ++i) {
        reconciler->tick(std::nullopt);
    }
    EXPECT_EQ(session->clear_calls, 1);

    reconciler->tick(make_track("One", "U2"));
    reconciler->tick(std::nullopt);
    reconciler->tick(std::nullopt);
    EXPECT_EQ(session->clear_calls, 2);
}

TEST_F(ReconcilerFixture, FailedClearOnLiveConnectionIsRetried) {
    auto reconciler = make_reconciler();
    reconciler->tick(make_track("Song A", "Artist X"));

    session->clear_error = core::SessionError::Timeout;
    reconciler->tick(std::nullopt);
    EXPECT_EQ(session->clear_calls, 1);
    EXPECT_EQ(session->successful_clears, 0);
    EXPECT_EQ(session->connect_calls, 0);
    EXPECT_TRUE(reconciler->published().last_snapshot.has_value());
    EXPECT_EQ(reconciler->state(), core::PresenceState::Active);

    reconciler->tick(std::nullopt);
    EXPECT_EQ(session->clear_calls, 2);
    EXPECT_EQ(session->successful_clears, 1);
    EXPECT_FALSE(reconciler->published().last_snapshot.has_value());
    EXPECT_EQ(reconciler->state(), core::PresenceState::Idle);

    reconciler->tick(std::nullopt);
    EXPECT_EQ(session->clear_calls, 2);
}

TEST_F(ReconcilerFixture, FailedClearOnClosedConnectionForgetsTrack) {
    auto reconciler = make_reconciler();
    reconciler->tick(make_track("Song A", "Artist X"));

    session->connected = false;
    session->connect_succeeds = false;
    reconciler->tick(std::nullopt);

    EXPECT_EQ(session->clear_calls, 1);
    EXPECT_EQ(session->connect_calls, 1);
    EXPECT_FALSE(reconciler->published().last_snapshot.has_value());
    EXPECT_EQ(reconciler->state(), core::PresenceState::Idle);

    reconciler->tick(std::nullopt);
    EXPECT_EQ(session->clear_calls, 1);
    EXPECT_EQ(session->connect_calls, 1);
}

TEST_F(ReconcilerFixture, NothingPlayingFromStartSendsNothing) {
    auto reconciler = make_reconciler();
    reconciler->tick(std::nullopt);
    reconciler->tick(std::nullopt);

    EXPECT_EQ(session->remote_calls(), 0);
    EXPECT_EQ(reconciler->state(), core::PresenceState::Idle);
}

TEST_F(ReconcilerFixture, SourceChangeWithSameTitleIsANewTrack) {
    auto reconciler = make_reconciler();
    reconciler->tick(make_track("Song", "Artist", core::SourceId::PrimarySource));
    reconciler->tick(make_track("Song", "Artist", core::SourceId::FallbackSource));

    EXPECT_EQ(session->update_calls, 2);
}

TEST_F(ReconcilerFixture, InjectedPublishedStateSuppressesFirstUpdate) {
    core::PublishedState initial;
    initial.last_snapshot = make_track("Song A", "Artist X");
    initial.connected = true;

    auto reconciler = make_reconciler(initial);
    EXPECT_EQ(reconciler->state(), core::PresenceState::Active);

    reconciler->tick(make_track("Song A", "Artist X"));
    EXPECT_EQ(session->remote_calls(), 0);
}

// ============================================================================
// Pause / resume
// ============================================================================

TEST_F(ReconcilerFixture, PausedIgnoresTicksUntilResume) {
    auto reconciler = make_reconciler();
    reconciler->tick(make_track("Song A", "Artist X"));
    ASSERT_EQ(session->update_calls, 1);

    reconciler->pause();
    EXPECT_EQ(reconciler->state(), core::PresenceState::Paused);

    reconciler->tick(make_track("Song B", "Artist Y"));
    reconciler->tick(std::nullopt);
    reconciler->tick(make_track("Song C", "Artist Z"));
    EXPECT_EQ(session->remote_calls(), 1);

    reconciler->resume();
    EXPECT_EQ(reconciler->state(), core::PresenceState::Active);

    // Unchanged from what was last published: still a no-op
    reconciler->tick(make_track("Song A", "Artist X"));
    EXPECT_EQ(session->remote_calls(), 1);

    reconciler->tick(make_track("Song B", "Artist Y"));
    EXPECT_EQ(session->update_calls, 2);
}

TEST_F(ReconcilerFixture, ResumeWithNothingPublishedGoesIdle) {
    auto reconciler = make_reconciler();
    reconciler->pause();
    reconciler->resume();
    EXPECT_EQ(reconciler->state(), core::PresenceState::Idle);
}

TEST_F(ReconcilerFixture, ResumeWhenNotPausedIsIgnored) {
    auto reconciler = make_reconciler();
    reconciler->tick(make_track("Song A", "Artist X"));

    int transitions = 0;
    bus->subscribe<core::events::ReconcilerStateChanged>(
        [&](const core::events::ReconcilerStateChanged&) { ++transitions; });

    reconciler->resume();
    EXPECT_EQ(transitions, 0);
    EXPECT_EQ(reconciler->state(), core::PresenceState::Active);
}

// ============================================================================
// Disconnection
// ============================================================================

TEST_F(ReconcilerFixture, NotConnectedReconnectsOnceAndRetriesOnce) {
    auto reconciler = make_reconciler();
    session->connected = false;

    reconciler->tick(make_track("Song A", "Artist X"));

    EXPECT_EQ(session->connect_calls, 1);
    EXPECT_EQ(session->update_calls, 2);
    ASSERT_EQ(session->updates.size(), 1u);
    EXPECT_TRUE(reconciler->published().connected);
    EXPECT_EQ(reconciler->state(), core::PresenceState::Active);
}

TEST_F(ReconcilerFixture, RetryFailureStopsAndReportsDisconnected) {
    auto reconciler = make_reconciler();
    reconciler->tick(make_track("Song A", "Artist X"));
    ASSERT_TRUE(reconciler->published().connected);

    std::vector<bool> statuses;
    bus->subscribe<core::events::SessionStatusChanged>(
        [&](const core::events::SessionStatusChanged& event) { statuses.push_back(event.connected); });

    // First update and the retry after reconnect both find the pipe closed
    session->dropped_calls = 2;
    session->connect_calls = 0;
    session->update_calls = 0;

    reconciler->tick(make_track("Song B", "Artist Y"));

    EXPECT_EQ(session->connect_calls, 1);
    EXPECT_EQ(session->update_calls, 2);
    EXPECT_EQ(session->clear_calls, 0);
    EXPECT_FALSE(reconciler->published().connected);
    ASSERT_FALSE(statuses.empty());
    EXPECT_FALSE(statuses.back());

    // The failed update left the published track alone
    ASSERT_TRUE(reconciler->published().last_snapshot.has_value());
    EXPECT_EQ(reconciler->published().last_snapshot->title, "Song A");

    // Next tick tries again and succeeds
    reconciler->tick(make_track("Song B", "Artist Y"));
    EXPECT_EQ(session->updates.back().details, "Song B");
    EXPECT_TRUE(reconciler->published().connected);
}

TEST_F(ReconcilerFixture, FailedReconnectMakesNoFurtherCalls) {
    auto reconciler = make_reconciler();
    session->connected = false;
    session->connect_succeeds = false;

    reconciler->tick(make_track("Song A", "Artist X"));

    EXPECT_EQ(session->connect_calls, 1);
    EXPECT_EQ(session->update_calls, 1);
    EXPECT_FALSE(reconciler->published().last_snapshot.has_value());
    EXPECT_EQ(reconciler->state(), core::PresenceState::Idle);
}

TEST_F(ReconcilerFixture, ClosedSessionRepublishesCurrentTrack) {
    EXPECT_CALL(*host, upload(_))
        .Times(1)
        .WillOnce(Return(std::string("https://files.catbox.moe/a.jpg")));

    auto reconciler = make_reconciler();
    const auto track = with_artwork(make_track("Song A", "Artist X"));
    reconciler->tick(track);
    ASSERT_EQ(session->updates.size(), 1u);

    std::vector<bool> statuses;
    bus->subscribe<core::events::SessionStatusChanged>(
        [&](const core::events::SessionStatusChanged& event) { statuses.push_back(event.connected); });

    // Discord restarted while the same song kept playing
    session->connected = false;
    reconciler->tick(track);

    EXPECT_EQ(session->connect_calls, 1);
    ASSERT_EQ(session->updates.size(), 2u);
    EXPECT_EQ(session->updates.back().details, "Song A");
    EXPECT_EQ(session->updates.back().large_image_key, "https://files.catbox.moe/a.jpg");
    EXPECT_TRUE(reconciler->published().connected);
    EXPECT_EQ(statuses, (std::vector<bool>{false, true}));

    reconciler->tick(track);
    EXPECT_EQ(session->updates.size(), 2u);
}

TEST_F(ReconcilerFixture, SilentDropIsFoundByPeriodicPing) {
    auto reconciler = make_reconciler();
    const auto track = make_track("Song A", "Artist X");
    reconciler->tick(track);

    session->silently_dropped = true;
    for (int i = 1; i < core::PresenceReconciler::LIVENESS_CHECK_TICKS; ++i) {
        reconciler->tick(track);
    }
    EXPECT_EQ(session->ping_calls, 0);
    EXPECT_EQ(session->updates.size(), 1u);

    reconciler->tick(track);
    EXPECT_EQ(session->ping_calls, 1);
    EXPECT_EQ(session->connect_calls, 1);
    EXPECT_EQ(session->updates.size(), 2u);
    EXPECT_TRUE(reconciler->published().connected);
}

TEST_F(ReconcilerFixture, UnansweredPingKeepsPresence) {
    class SlowSession : public FakePresenceSession {
    public:
        std::expected<void, core::SessionError> ping() override {
            ++ping_calls;
            return std::unexpected(core::SessionError::Timeout);
        }
    };
    auto slow = std::make_shared<SlowSession>();
    core::PresenceReconciler reconciler(slow, nullptr, services::PresenceBuilder{});

    const auto track = make_track("Song A", "Artist X");
    for (int i = 0; i <= core::PresenceReconciler::LIVENESS_CHECK_TICKS; ++i) {
        reconciler.tick(track);
    }

    EXPECT_EQ(slow->ping_calls, 1);
    EXPECT_EQ(slow->connect_calls, 0);
    EXPECT_EQ(slow->update_calls, 1);
}

TEST_F(ReconcilerFixture, OtherSessionErrorsDoNotReconnect) {
    class FailingSession : public FakePresenceSession {
    public:
        std::expected<void, core::SessionError> update(const services::PresenceData&) override {
            ++update_calls;
            return std::unexpected(core::SessionError::InvalidPayload);
        }
    };
    auto failing = std::make_shared<FailingSession>();
    core::PresenceReconciler reconciler(failing, nullptr, services::PresenceBuilder{});

    reconciler.tick(make_track("Song A", "Artist X"));

    EXPECT_EQ(failing->connect_calls, 0);
    EXPECT_EQ(failing->update_calls, 1);
}

// ============================================================================
// Artwork
// ============================================================================

TEST_F(ReconcilerFixture, ArtworkFailureDoesNotBlockUpdate) {
    EXPECT_CALL(*host, upload(_)).WillOnce(Return(std::unexpected(core::UploadError::TransportFailed)));

    auto reconciler = make_reconciler();
    reconciler->tick(with_artwork(make_track("Song A", "Artist X")));

    ASSERT_EQ(session->update_calls, 1);
    EXPECT_EQ(session->updates.back().large_image_key, "music");
    EXPECT_FALSE(reconciler->published().artwork_url.has_value());
}

TEST_F(ReconcilerFixture, ArtworkRetryIsCapped) {
    EXPECT_CALL(*host, upload(_))
        .Times(1 + core::PresenceReconciler::MAX_ARTWORK_RETRIES)
        .WillRepeatedly(Return(std::unexpected(core::UploadError::TransportFailed)));

    auto reconciler = make_reconciler();
    const auto track = with_artwork(make_track("Song A", "Artist X"));
    for (int i = 0; i < 10; ++i) {
        reconciler->tick(track);
    }

    EXPECT_EQ(session->update_calls, 1);
    EXPECT_EQ(reconciler->artwork_retries(), core::PresenceReconciler::MAX_ARTWORK_RETRIES);
}

TEST_F(ReconcilerFixture, SuccessfulArtworkRetrySendsOneUpdate) {
    EXPECT_CALL(*host, upload(_))
        .WillOnce(Return(std::unexpected(core::UploadError::TransportFailed)))
        .WillOnce(Return(std::string("https://files.catbox.moe/late.jpg")));

    auto reconciler = make_reconciler();
    const auto track = with_artwork(make_track("Song A", "Artist X"));
    reconciler->tick(track);
    reconciler->tick(track);
    reconciler->tick(track);
    reconciler->tick(track);

    ASSERT_EQ(session->update_calls, 2);
    EXPECT_EQ(session->updates.back().large_image_key, "https://files.catbox.moe/late.jpg");
    EXPECT_EQ(reconciler->published().artwork_url, "https://files.catbox.moe/late.jpg");
}

TEST_F(ReconcilerFixture, PublishesTrackEvent) {
    std::vector<std::string> published;
    bus->subscribe<core::events::TrackPublished>(
        [&](const core::events::TrackPublished& event) { published.push_back(event.track.title); });

    auto reconciler = make_reconciler();
    reconciler->tick(make_track("Song A", "Artist X"));
    reconciler->tick(make_track("Song A", "Artist X"));

    EXPECT_EQ(published, std::vector<std::string>{"Song A"});
}

// ============================================================================
// Clear / shutdown commands
// ============================================================================

TEST_F(ReconcilerFixture, ClearResetsAndDisconnects) {
    auto reconciler = make_reconciler();
    reconciler->tick(make_track("Song A", "Artist X"));

    reconciler->clear();

    EXPECT_EQ(session->successful_clears, 1);
    EXPECT_EQ(session->disconnect_calls, 1);
    EXPECT_FALSE(session->connected);
    EXPECT_FALSE(reconciler->published().last_snapshot.has_value());
    EXPECT_FALSE(reconciler->published().connected);
    EXPECT_EQ(reconciler->state(), core::PresenceState::Idle);

    // Lazy reconnect on the next track
    reconciler->tick(make_track("Song A", "Artist X"));
    EXPECT_EQ(session->connect_calls, 1);
    EXPECT_EQ(session->updates.size(), 2u);
}

TEST_F(ReconcilerFixture, UserClearIsNotReportedAsDisconnection) {
    auto reconciler = make_reconciler();
    reconciler->tick(make_track("Song A", "Artist X"));

    std::vector<bool> statuses;
    std::vector<std::string> cleared;
    bus->subscribe<core::events::SessionStatusChanged>(
        [&](const core::events::SessionStatusChanged& event) { statuses.push_back(event.connected); });
    bus->subscribe<core::events::PresenceCleared>(
        [&](const core::events::PresenceCleared& event) { cleared.push_back(event.reason); });

    reconciler->clear();
    EXPECT_TRUE(statuses.empty());
    EXPECT_EQ(cleared, std::vector<std::string>{"cleared by user"});

    reconciler->tick(make_track("Song B", "Artist Y"));
    EXPECT_EQ(statuses, std::vector<bool>{true});
}

TEST_F(ReconcilerFixture, ClearWhilePausedLeavesPause) {
    auto reconciler = make_reconciler();
    reconciler->tick(make_track("Song A", "Artist X"));
    reconciler->pause();

    reconciler->clear();
    EXPECT_EQ(reconciler->state(), core::PresenceState::Idle);
}

TEST_F(ReconcilerFixture, ShutdownClearsOnceAndIsIdempotent) {
    auto reconciler = make_reconciler();
    reconciler->tick(make_track("Song A", "Artist X"));

    reconciler->shutdown();
    reconciler->shutdown();

    EXPECT_EQ(session->clear_calls, 1);
    EXPECT_EQ(session->disconnect_calls, 1);

    // Nothing happens after shutdown
    reconciler->tick(make_track("Song B", "Artist Y"));
    reconciler->clear();
    EXPECT_EQ(session->update_calls, 1);
    EXPECT_EQ(session->disconnect_calls, 1);
}

TEST_F(ReconcilerFixture, ShutdownWithNothingPublishedOnlyDisconnects) {
    auto reconciler = make_reconciler();
    reconciler->shutdown();

    EXPECT_EQ(session->clear_calls, 0);
    EXPECT_EQ(session->disconnect_calls, 1);
}
