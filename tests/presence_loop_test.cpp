#include "fakes.hpp"

#include "listen_along/core/application.hpp"
#include "listen_along/core/command_queue.hpp"
#include "listen_along/core/presence_loop.hpp"
#include "listen_along/core/presence_reconciler.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace listen_along;
using namespace listen_along::testing;
using namespace std::chrono_literals;

// ============================================================================
// CommandQueue
// ============================================================================

TEST(CommandQueue, FifoOrder) {
    core::CommandQueue queue;
    queue.push(core::Command{core::Command::Type::Pause, {}});
    queue.push(core::Command::join("secret"));
    EXPECT_EQ(queue.size(), 2u);

    auto first = queue.try_pop();
    auto second = queue.try_pop();
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->type, core::Command::Type::Pause);
    EXPECT_EQ(second->type, core::Command::Type::Join);
    EXPECT_EQ(second->payload, "secret");
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(CommandQueue, WaitTimesOut) {
    core::CommandQueue queue;
    const auto start = core::CommandQueue::Clock::now();
    EXPECT_FALSE(queue.wait_pop_until(start + 20ms).has_value());
    EXPECT_GE(core::CommandQueue::Clock::now() - start, 20ms);
}

TEST(CommandQueue, WaitWakesOnPush) {
    core::CommandQueue queue;
    std::jthread producer([&queue] {
        std::this_thread::sleep_for(10ms);
        queue.push(core::Command{core::Command::Type::Clear, {}});
    });

    auto command = queue.wait_pop_until(core::CommandQueue::Clock::now() + 5s);
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->type, core::Command::Type::Clear);
}

TEST(CommandQueue, TypeNames) {
    EXPECT_EQ(core::to_string(core::Command::Type::Tick), "tick");
    EXPECT_EQ(core::to_string(core::Command::Type::Exit), "exit");
}

// ============================================================================
// PresenceLoop
// ============================================================================

namespace {

struct LoopFixture : ::testing::Test {
    std::shared_ptr<FakeSourceAdapter> adapter =
        std::make_shared<FakeSourceAdapter>("mpris", core::SourceId::PrimarySource);
    std::shared_ptr<FakePresenceSession> session = std::make_shared<FakePresenceSession>();
    std::shared_ptr<services::Arbitrator> arbitrator =
        std::make_shared<services::Arbitrator>(std::vector<std::shared_ptr<services::SourceAdapter>>{adapter});
    std::shared_ptr<core::PresenceReconciler> reconciler =
        std::make_shared<core::PresenceReconciler>(session, nullptr, services::PresenceBuilder{});
    std::shared_ptr<core::CommandQueue> commands = std::make_shared<core::CommandQueue>();
    std::vector<std::string> joins;

    std::unique_ptr<core::PresenceLoop> make_loop(std::chrono::milliseconds interval = 1h) {
        return std::make_unique<core::PresenceLoop>(
            arbitrator, reconciler, commands, interval,
            [this](const std::string& secret) { joins.push_back(secret); });
    }
};

class ThrowingAdapter : public services::SourceAdapter {
public:
    std::expected<std::optional<core::TrackSnapshot>, core::AdapterProbeError> probe() override {
        throw std::runtime_error("dbus went away");
    }
    std::string name() const override { return "throwing"; }
    core::SourceId source_id() const override { return core::SourceId::PrimarySource; }
};

} // namespace

TEST_F(LoopFixture, ApplyRoutesCommands) {
    auto loop = make_loop();
    adapter->will_play(make_track("Song A", "Artist X"));

    EXPECT_TRUE(loop->apply({core::Command::Type::Tick, {}}));
    EXPECT_EQ(session->update_calls, 1);

    EXPECT_TRUE(loop->apply({core::Command::Type::Pause, {}}));
    EXPECT_EQ(reconciler->state(), core::PresenceState::Paused);

    EXPECT_TRUE(loop->apply({core::Command::Type::Resume, {}}));
    EXPECT_EQ(reconciler->state(), core::PresenceState::Active);

    EXPECT_TRUE(loop->apply(core::Command::join("listenalong://sync?track=x")));
    EXPECT_EQ(joins, std::vector<std::string>{"listenalong://sync?track=x"});

    EXPECT_TRUE(loop->apply({core::Command::Type::Clear, {}}));
    EXPECT_EQ(reconciler->state(), core::PresenceState::Idle);
    EXPECT_EQ(session->disconnect_calls, 1);

    EXPECT_FALSE(loop->apply({core::Command::Type::Exit, {}}));
}

TEST_F(LoopFixture, TickFaultIsContained) {
    arbitrator = std::make_shared<services::Arbitrator>(
        std::vector<std::shared_ptr<services::SourceAdapter>>{std::make_shared<ThrowingAdapter>()});
    auto loop = make_loop();

    EXPECT_NO_THROW(loop->run_tick());
    EXPECT_EQ(session->remote_calls(), 0);
}

TEST_F(LoopFixture, StopWithoutStartReleasesPresence) {
    auto loop = make_loop();
    adapter->will_play(make_track("Song A", "Artist X"));
    loop->run_tick();

    loop->stop();
    EXPECT_EQ(session->clear_calls, 1);
    EXPECT_EQ(session->disconnect_calls, 1);

    loop->stop();
    EXPECT_EQ(session->clear_calls, 1);
}

TEST_F(LoopFixture, WorkerTicksAndReleasesOnStop) {
    adapter->will_play(make_track("Song A", "Artist X"));
    auto loop = make_loop();

    // Queued ahead of the Exit that stop() pushes
    commands->push(core::Command{core::Command::Type::Tick, {}});
    loop->start();
    EXPECT_TRUE(loop->is_running());

    loop->stop();
    EXPECT_FALSE(loop->is_running());
    EXPECT_EQ(session->update_calls, 1);
    EXPECT_EQ(session->clear_calls, 1);
    EXPECT_EQ(session->disconnect_calls, 1);
}

TEST_F(LoopFixture, CommandsRunOnWorker) {
    auto loop = make_loop();
    loop->start();

    commands->push(core::Command::join("first"));
    commands->push(core::Command::join("second"));
    loop->stop();

    EXPECT_EQ(joins, (std::vector<std::string>{"first", "second"}));
}

TEST_F(LoopFixture, DestructorReleases) {
    adapter->will_play(make_track("Song A", "Artist X"));
    {
        auto loop = make_loop();
        loop->run_tick();
    }
    EXPECT_EQ(session->clear_calls, 1);
}

// ============================================================================
// Startup connect
// ============================================================================

TEST(ConnectWithBackoff, DoublesDelayUpToMaximum) {
    FakePresenceSession session;
    session.connected = false;
    session.connect_succeeds = false;

    core::StartupConfig config;
    config.connect_attempts = 5;
    config.initial_delay = 1000ms;
    config.max_delay = 3000ms;

    std::vector<std::chrono::milliseconds> sleeps;
    auto result = core::connect_with_backoff(session, config,
        [&sleeps](std::chrono::milliseconds delay) { sleeps.push_back(delay); });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), core::ApplicationError::StartupConnectFailed);
    EXPECT_EQ(session.connect_calls, 5);
    EXPECT_EQ(sleeps, (std::vector<std::chrono::milliseconds>{1000ms, 2000ms, 3000ms, 3000ms}));
}

TEST(ConnectWithBackoff, StopsAtFirstSuccess) {
    class EventuallyConnects : public FakePresenceSession {
    public:
        std::expected<void, core::SessionError> connect() override {
            ++connect_calls;
            if (connect_calls < 2) {
                return std::unexpected(core::SessionError::ConnectFailed);
            }
            connected = true;
            return {};
        }
    };

    EventuallyConnects session;
    std::vector<std::chrono::milliseconds> sleeps;
    auto result = core::connect_with_backoff(session, core::StartupConfig{},
        [&sleeps](std::chrono::milliseconds delay) { sleeps.push_back(delay); });

    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(session.connect_calls, 2);
    EXPECT_EQ(sleeps, std::vector<std::chrono::milliseconds>{1000ms});
}

TEST(ConnectWithBackoff, AtLeastOneAttempt) {
    FakePresenceSession session;
    session.connect_succeeds = false;

    core::StartupConfig config;
    config.connect_attempts = 0;
    auto result = core::connect_with_backoff(session, config, nullptr);

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(session.connect_calls, 1);
}
