#include "listen_along/services/presence/discord_ipc.hpp"
#include "listen_along/services/presence/join_listener.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace listen_along;
using nlohmann::json;

using JoinEvent = services::DiscordJoinListener::JoinEvent;

// ============================================================================
// Join message parsing
// ============================================================================

TEST(JoinEventParse, NullEventIsIgnored) {
    const json message = json::parse(R"({"cmd":"X","evt":null,"nonce":"1"})");

    JoinEvent event;
    EXPECT_NO_THROW(event = services::DiscordJoinListener::parse_event(message));
    EXPECT_EQ(event.kind, JoinEvent::Kind::None);
}

TEST(JoinEventParse, UnrelatedEventIsIgnored) {
    const json message = {{"cmd", "DISPATCH"}, {"evt", "READY"}, {"data", json::object()}};
    EXPECT_EQ(services::DiscordJoinListener::parse_event(message).kind, JoinEvent::Kind::None);
}

TEST(JoinEventParse, JoinCarriesSecret) {
    const json message = {{"cmd", "DISPATCH"}, {"evt", "ACTIVITY_JOIN"}, {"data", {{"secret", "la1:abc"}}}};

    const auto event = services::DiscordJoinListener::parse_event(message);
    EXPECT_EQ(event.kind, JoinEvent::Kind::Join);
    EXPECT_EQ(event.secret, "la1:abc");
}

TEST(JoinEventParse, JoinWithNullDataHasEmptySecret) {
    const json null_data = json::parse(R"({"cmd":"DISPATCH","evt":"ACTIVITY_JOIN","data":null})");
    const json null_secret = json::parse(R"({"cmd":"DISPATCH","evt":"ACTIVITY_JOIN","data":{"secret":null}})");

    const auto first = services::DiscordJoinListener::parse_event(null_data);
    EXPECT_EQ(first.kind, JoinEvent::Kind::Join);
    EXPECT_TRUE(first.secret.empty());

    const auto second = services::DiscordJoinListener::parse_event(null_secret);
    EXPECT_EQ(second.kind, JoinEvent::Kind::Join);
    EXPECT_TRUE(second.secret.empty());
}

TEST(JoinEventParse, JoinRequestCarriesUser) {
    const json message = {
        {"cmd", "DISPATCH"},
        {"evt", "ACTIVITY_JOIN_REQUEST"},
        {"data", {{"user", {{"id", "123456"}, {"username", "friend"}}}}}
    };

    const auto event = services::DiscordJoinListener::parse_event(message);
    EXPECT_EQ(event.kind, JoinEvent::Kind::JoinRequest);
    EXPECT_EQ(event.user_id, "123456");
    EXPECT_EQ(event.username, "friend");
}

TEST(JoinEventParse, JoinRequestWithNullUserFields) {
    const json message = json::parse(
        R"({"cmd":"DISPATCH","evt":"ACTIVITY_JOIN_REQUEST","data":{"user":{"id":null,"username":null}}})");

    const auto event = services::DiscordJoinListener::parse_event(message);
    EXPECT_EQ(event.kind, JoinEvent::Kind::JoinRequest);
    EXPECT_TRUE(event.user_id.empty());
    EXPECT_EQ(event.username, "?");
}

// ============================================================================
// Dispatches that arrive while a command waits for its reply
// ============================================================================

TEST(DispatchBacklog, KeepsDispatchFrames) {
    services::DispatchBacklog backlog;
    const json dispatch = {{"cmd", "DISPATCH"}, {"evt", "ACTIVITY_JOIN"}, {"data", {{"secret", "s"}}}};

    EXPECT_TRUE(backlog.keep(dispatch));
    ASSERT_EQ(backlog.size(), 1u);

    const auto popped = backlog.pop();
    ASSERT_TRUE(popped.has_value());
    EXPECT_EQ(*popped, dispatch);
    EXPECT_TRUE(backlog.empty());
    EXPECT_FALSE(backlog.pop().has_value());
}

TEST(DispatchBacklog, DropsStaleReplies) {
    services::DispatchBacklog backlog;

    EXPECT_FALSE(backlog.keep({{"cmd", "SET_ACTIVITY"}, {"nonce", "old"}}));
    EXPECT_FALSE(backlog.keep(json::parse(R"({"cmd":null,"evt":null})")));
    EXPECT_TRUE(backlog.empty());
}

TEST(DispatchBacklog, ReplaysInArrivalOrder) {
    services::DispatchBacklog backlog;
    backlog.keep({{"cmd", "DISPATCH"}, {"evt", "ACTIVITY_JOIN_REQUEST"}});
    backlog.keep({{"cmd", "DISPATCH"}, {"evt", "ACTIVITY_JOIN"}});

    EXPECT_EQ(backlog.pop()->at("evt"), "ACTIVITY_JOIN_REQUEST");
    EXPECT_EQ(backlog.pop()->at("evt"), "ACTIVITY_JOIN");
}

TEST(DispatchBacklog, DropsOldestWhenFull) {
    services::DispatchBacklog backlog;
    for (std::size_t i = 0; i <= services::DispatchBacklog::MAX_PENDING; ++i) {
        backlog.keep({{"cmd", "DISPATCH"}, {"evt", "ACTIVITY_JOIN"}, {"data", {{"secret", std::to_string(i)}}}});
    }

    EXPECT_EQ(backlog.size(), services::DispatchBacklog::MAX_PENDING);
    EXPECT_EQ(backlog.pop()->at("data").at("secret"), "1");
}
