#include <gtest/gtest.h>

#include "net/SessionLifecycle.hpp"
#include "net/HostRegistry.hpp"
#include "net/IdentityCache.hpp"
#include "FakePlatform.hpp"

using namespace std::chrono_literals;
using hostlink::SessionPhase;
using hostlink::Status;

namespace {

    constexpr hostlink::PeerId kGroup = 109775240000000077ULL;

    class SessionLifecycleTest : public ::testing::Test {
    protected:
        void SetUp() override { fake.install(binder); }

        FakePlatform fake;
        CapabilityBinder binder;
        IdentityCache identity{ binder };
        ManualClock clock;
        HostLinkConfig cfg;
        HostRegistry registry{ identity, clock.fn(), 30s };
        SessionLifecycle session{ binder, identity, registry, cfg, clock.fn() };
    };

} // namespace

TEST_F(SessionLifecycleTest, HostingPublishesPresenceAndGroup) {
    ASSERT_EQ(session.startHosting(), Status::Ok);

    const auto st = session.state();
    EXPECT_EQ(st.phase, SessionPhase::Hosting);
    EXPECT_EQ(st.selfHostId, fake.localId);
    EXPECT_EQ(st.groupId, fake.nextGroupId);
    EXPECT_EQ(st.lobbyToken, std::to_string(fake.nextGroupId));
    EXPECT_TRUE(st.isGroupOwner);
    EXPECT_TRUE(session.isHosting());

    EXPECT_EQ(fake.myPresence["status"], "In Game");
    EXPECT_EQ(fake.myPresence["steam_display"], "#Status_InGame");
    EXPECT_EQ(fake.myPresence["hostlink_status"], "hosting");
    EXPECT_EQ(fake.myPresence["hostlink_version"], "1.0");
    EXPECT_EQ(fake.myPresence["connect"], st.lobbyToken);

    ASSERT_EQ(fake.createGroupArgs.size(), 1u);
    EXPECT_EQ(fake.createGroupArgs[0].first, 2);
    EXPECT_EQ(fake.createGroupArgs[0].second, 50);
    EXPECT_TRUE(fake.groupJoinable[st.groupId]);
    EXPECT_EQ(fake.groupData[st.groupId]["host_id"], std::to_string(fake.localId));
    EXPECT_EQ(fake.groupData[st.groupId]["version"], "1.0");

    EXPECT_EQ(registry.selfHostId(), fake.localId);
}

TEST_F(SessionLifecycleTest, SecondHostRequestIsRejected) {
    ASSERT_EQ(session.startHosting(), Status::Ok);
    EXPECT_EQ(session.startHosting(), Status::NotReady);
    EXPECT_EQ(session.startJoining(kGroup), Status::NotReady);
    EXPECT_EQ(fake.createGroupCalls, 1);
    EXPECT_TRUE(fake.joinCalls.empty());
}

TEST_F(SessionLifecycleTest, HostingWithoutLocalIdFails) {
    fake.localId = 0;
    EXPECT_EQ(session.startHosting(), Status::NotReady);
    EXPECT_EQ(session.phase(), SessionPhase::Idle);
    EXPECT_TRUE(fake.myPresence.empty());
    EXPECT_EQ(fake.createGroupCalls, 0);
}

TEST_F(SessionLifecycleTest, HostingSurvivesGroupFailureAndRetries) {
    fake.createGroupWorks = false;
    ASSERT_EQ(session.startHosting(), Status::Ok);
    EXPECT_EQ(session.phase(), SessionPhase::Hosting);
    EXPECT_EQ(session.state().groupId, hostlink::kNoPeer);
    EXPECT_EQ(fake.myPresence.count("connect"), 0u);

    clock.advance(4s);
    EXPECT_EQ(session.broadcastAvailability(), Status::Ok);
    EXPECT_EQ(fake.createGroupCalls, 1);

    fake.createGroupWorks = true;
    clock.advance(1s);
    EXPECT_EQ(session.broadcastAvailability(), Status::Ok);
    EXPECT_EQ(fake.createGroupCalls, 2);
    EXPECT_EQ(session.state().groupId, fake.nextGroupId);

    clock.advance(10s);
    session.broadcastAvailability();
    EXPECT_EQ(fake.createGroupCalls, 2);
}

TEST_F(SessionLifecycleTest, HeartbeatKeepsSelfEntry) {
    ASSERT_EQ(session.startHosting(), Status::Ok);

    for (int i = 0; i < 10; ++i) {
        clock.advance(10s);
        session.broadcastAvailability();
    }
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(SessionLifecycleTest, BroadcastRequiresHosting) {
    EXPECT_EQ(session.broadcastAvailability(), Status::NotReady);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(SessionLifecycleTest, JoinSucceeds) {
    ASSERT_EQ(session.startJoining(kGroup), Status::Ok);

    const auto st = session.state();
    EXPECT_EQ(st.phase, SessionPhase::Active);
    EXPECT_EQ(st.groupId, kGroup);
    EXPECT_EQ(st.lobbyToken, std::to_string(kGroup));
    EXPECT_FALSE(st.isGroupOwner);
    EXPECT_EQ(fake.myPresence["status"], "Joining Game");
    EXPECT_EQ(fake.myPresence["steam_display"], "#Status_JoiningGame");
    ASSERT_EQ(fake.joinCalls.size(), 1u);
    EXPECT_EQ(fake.joinCalls[0], kGroup);
}

TEST_F(SessionLifecycleTest, FailedJoinReturnsToIdle) {
    fake.joinSucceeds = false;

    EXPECT_EQ(session.startJoining(kGroup), Status::OperationFailed);
    EXPECT_EQ(session.phase(), SessionPhase::Idle);
    EXPECT_EQ(session.state().groupId, hostlink::kNoPeer);
    EXPECT_TRUE(fake.myPresence.empty());
    EXPECT_EQ(fake.clearPresenceCalls, 1);
}

TEST_F(SessionLifecycleTest, JoinWithoutBindingReturnsToIdle) {
    CapabilityBinder bare;
    IdentityCache bareIdentity(bare);
    HostRegistry bareRegistry(bareIdentity, clock.fn());
    SessionLifecycle bareSession(bare, bareIdentity, bareRegistry, cfg, clock.fn());

    EXPECT_EQ(bareSession.startJoining(kGroup), Status::BindingUnresolved);
    EXPECT_EQ(bareSession.phase(), SessionPhase::Idle);
}

TEST_F(SessionLifecycleTest, JoinZeroIsRejected) {
    EXPECT_EQ(session.startJoining(hostlink::kNoPeer), Status::NotReady);
    EXPECT_TRUE(fake.joinCalls.empty());
}

TEST_F(SessionLifecycleTest, StopFromIdleIsANoOp) {
    EXPECT_EQ(session.stopSession(), Status::Ok);
    EXPECT_EQ(session.stopSession(), Status::Ok);
    EXPECT_EQ(fake.clearPresenceCalls, 0);
    EXPECT_TRUE(fake.leaveCalls.empty());
}

TEST_F(SessionLifecycleTest, StopWhileHostingReleasesEverything) {
    ASSERT_EQ(session.startHosting(), Status::Ok);
    const auto group = session.state().groupId;

    EXPECT_EQ(session.stopSession(), Status::Ok);
    EXPECT_EQ(session.phase(), SessionPhase::Idle);
    EXPECT_EQ(session.state().groupId, hostlink::kNoPeer);
    EXPECT_TRUE(fake.myPresence.empty());
    ASSERT_EQ(fake.leaveCalls.size(), 1u);
    EXPECT_EQ(fake.leaveCalls[0], group);
    EXPECT_EQ(registry.selfHostId(), hostlink::kNoPeer);
    EXPECT_EQ(registry.size(), 0u);

    // Can host again afterwards
    EXPECT_EQ(session.startHosting(), Status::Ok);
}

TEST_F(SessionLifecycleTest, StopAfterJoinLeavesGroup) {
    ASSERT_EQ(session.startJoining(kGroup), Status::Ok);
    EXPECT_EQ(session.stopSession(), Status::Ok);
    ASSERT_EQ(fake.leaveCalls.size(), 1u);
    EXPECT_EQ(fake.leaveCalls[0], kGroup);
    EXPECT_EQ(session.phase(), SessionPhase::Idle);
}
