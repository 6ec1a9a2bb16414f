#include "fakes.hpp"

#include <gtest/gtest.h>

using namespace listen_along;
using namespace listen_along::testing;

namespace {

struct ArbitratorFixture : ::testing::Test {
    std::shared_ptr<FakeSourceAdapter> primary =
        std::make_shared<FakeSourceAdapter>("mpris", core::SourceId::PrimarySource);
    std::shared_ptr<FakeSourceAdapter> fallback =
        std::make_shared<FakeSourceAdapter>("spotify", core::SourceId::FallbackSource);
};

} // namespace

TEST_F(ArbitratorFixture, PrimaryPlayingWinsOverFallback) {
    primary->will_play(make_track("Local", "Artist"));
    fallback->will_play(make_track("Remote", "Artist", core::SourceId::FallbackSource));

    services::Arbitrator arbitrator({primary, fallback});
    auto selected = arbitrator.select();

    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(selected->title, "Local");
    EXPECT_EQ(selected->source_id, core::SourceId::PrimarySource);
    EXPECT_EQ(fallback->probe_calls, 0);
}

TEST_F(ArbitratorFixture, PriorityDoesNotDependOnRegistrationOrder) {
    primary->will_play(make_track("Local", "Artist"));
    fallback->will_play(make_track("Remote", "Artist", core::SourceId::FallbackSource));

    services::Arbitrator arbitrator({fallback, primary});

    for (int i = 0; i < 5; ++i) {
        auto selected = arbitrator.select();
        ASSERT_TRUE(selected.has_value());
        EXPECT_NE(selected->source_id, core::SourceId::FallbackSource);
    }
}

TEST_F(ArbitratorFixture, FallbackUsedWhenPrimaryIdle) {
    primary->will_idle();
    fallback->will_play(make_track("Remote", "Artist", core::SourceId::FallbackSource));

    services::Arbitrator arbitrator({primary, fallback});
    auto selected = arbitrator.select();

    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(selected->title, "Remote");
}

TEST_F(ArbitratorFixture, PrimaryErrorFallsThrough) {
    primary->will_fail(core::AdapterProbeError::TransportFailed);
    fallback->will_play(make_track("Remote", "Artist", core::SourceId::FallbackSource));

    services::Arbitrator arbitrator({primary, fallback});
    auto selected = arbitrator.select();

    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(selected->title, "Remote");
    EXPECT_EQ(primary->probe_calls, 1);
}

TEST_F(ArbitratorFixture, PausedSnapshotIsSkipped) {
    primary->will_play(make_track("Paused", "Artist", core::SourceId::PrimarySource, false));
    fallback->will_play(make_track("Remote", "Artist", core::SourceId::FallbackSource));

    services::Arbitrator arbitrator({primary, fallback});
    auto selected = arbitrator.select();

    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(selected->title, "Remote");
}

TEST_F(ArbitratorFixture, OnlyPausedYieldsNothing) {
    primary->will_play(make_track("Paused", "Artist", core::SourceId::PrimarySource, false));
    fallback->will_play(make_track("Also paused", "Artist", core::SourceId::FallbackSource, false));

    services::Arbitrator arbitrator({primary, fallback});
    EXPECT_FALSE(arbitrator.select().has_value());
}

TEST_F(ArbitratorFixture, NothingFromAnyAdapter) {
    primary->will_fail(core::AdapterProbeError::Unavailable);
    fallback->will_fail(core::AdapterProbeError::Unauthorized);

    services::Arbitrator arbitrator({primary, fallback});
    EXPECT_FALSE(arbitrator.select().has_value());
    EXPECT_EQ(primary->probe_calls, 1);
    EXPECT_EQ(fallback->probe_calls, 1);
}

TEST_F(ArbitratorFixture, NullAdaptersAreDropped) {
    services::Arbitrator arbitrator({nullptr, fallback, nullptr});
    EXPECT_EQ(arbitrator.adapter_count(), 1u);
    EXPECT_FALSE(arbitrator.select().has_value());
}

TEST(ArbitratorEmpty, NoAdapters) {
    services::Arbitrator arbitrator(std::vector<std::shared_ptr<services::SourceAdapter>>{});
    EXPECT_EQ(arbitrator.adapter_count(), 0u);
    EXPECT_FALSE(arbitrator.select().has_value());
}
