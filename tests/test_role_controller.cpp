#include <tandem/core/manual_scheduler.hpp>
#include <tandem/player/clock_player.hpp>
#include <tandem/sync/role_controller.hpp>

#include <gtest/gtest.h>

#include <vector>

#include "test_helpers.hpp"

using namespace tandem;
using namespace tandem::sync;
using tandem::test::RecordingTransport;

class RoleControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        player.load("movie.mkv");
        broadcaster.setPlayer(&player);
        conn = roles.roleChanged.connectScoped([this](Role r) { transitions.push_back(r); });
    }

    ManualScheduler scheduler;
    RecordingTransport transport;
    tandem::player::ClockPlayer player{scheduler};
    SnapshotBroadcaster broadcaster{scheduler, scheduler, transport, Milliseconds(1500)};
    RoleController roles{"alice", broadcaster};
    std::vector<Role> transitions;
    ScopedConnection conn;
};

TEST_F(RoleControllerTest, StartsUninitialized) {
    EXPECT_EQ(roles.role(), Role::Uninitialized);
    EXPECT_FALSE(roles.isHost());
    EXPECT_FALSE(roles.hostId().has_value());
    EXPECT_FALSE(broadcaster.running());
}

TEST_F(RoleControllerTest, BecomingHostStartsBroadcasting) {
    EXPECT_TRUE(roles.onHostChanged("alice"));

    EXPECT_EQ(roles.role(), Role::Host);
    EXPECT_EQ(roles.hostId(), "alice");
    EXPECT_TRUE(broadcaster.running());
    EXPECT_EQ(transitions, (std::vector<Role>{Role::Host}));
}

TEST_F(RoleControllerTest, AnotherHostMakesUsPeer) {
    EXPECT_TRUE(roles.onHostChanged("bob"));

    EXPECT_EQ(roles.role(), Role::Peer);
    EXPECT_FALSE(broadcaster.running());
}

TEST_F(RoleControllerTest, LosingHostStopsBroadcastImmediately) {
    roles.onHostChanged("alice");
    scheduler.advance(Milliseconds(1500));
    ASSERT_EQ(transport.sent.size(), 1u);

    roles.onHostChanged("bob");
    scheduler.advance(Milliseconds(6000));

    EXPECT_EQ(transport.sent.size(), 1u);
    EXPECT_EQ(transitions, (std::vector<Role>{Role::Host, Role::Peer}));
}

TEST_F(RoleControllerTest, RepeatedAnnouncementIsNoTransition) {
    roles.onHostChanged("bob");
    EXPECT_FALSE(roles.onHostChanged("carol"));

    EXPECT_EQ(roles.hostId(), "carol");
    EXPECT_EQ(transitions.size(), 1u);
}

TEST_F(RoleControllerTest, DirectAssignment) {
    EXPECT_TRUE(roles.setRole(Role::Host));
    EXPECT_FALSE(roles.setRole(Role::Host));
    EXPECT_TRUE(roles.setRole(Role::Uninitialized));
    EXPECT_FALSE(broadcaster.running());
}
