#include <gtest/gtest.h>

#include "net/HostRegistry.hpp"
#include "net/IdentityCache.hpp"
#include "FakePlatform.hpp"

using namespace std::chrono_literals;
using hostlink::kNoPeer;

namespace {

    constexpr hostlink::PeerId kAlice = 76561197960265729ULL;
    constexpr hostlink::PeerId kBob = 76561197960265730ULL;
    constexpr hostlink::PeerId kCarol = 76561197960265731ULL;

    class HostRegistryTest : public ::testing::Test {
    protected:
        void SetUp() override { fake.install(binder); }

        FakePlatform fake;
        CapabilityBinder binder;
        IdentityCache identity{ binder };
        ManualClock clock;
        HostRegistry registry{ identity, clock.fn(), 30s };
    };

} // namespace

TEST_F(HostRegistryTest, StaleEntriesArePurged) {
    registry.upsert(kAlice, "Alice's session", 1);

    clock.advance(30s);
    EXPECT_EQ(registry.activeHosts().size(), 1u);

    clock.advance(1s);
    EXPECT_TRUE(registry.activeHosts().empty());
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.bestAvailableHost(), kNoPeer);
}

TEST_F(HostRegistryTest, RefreshKeepsEntryAlive) {
    registry.upsert(kAlice, "Alice's session", 1);
    clock.advance(20s);
    registry.upsert(kAlice, "Alice's session", 2);
    clock.advance(20s);

    hostlink::HostInfo h;
    ASSERT_TRUE(registry.lookup(kAlice, h));
    EXPECT_EQ(h.playerCount, 2);
    EXPECT_TRUE(h.isActive);
}

TEST_F(HostRegistryTest, MostRecentlySeenHostWins) {
    registry.upsert(kAlice, "A", 1);
    clock.advance(1s);
    registry.upsert(kBob, "B", 1);
    EXPECT_EQ(registry.bestAvailableHost(), kBob);

    clock.advance(1s);
    registry.upsert(kAlice, "A", 1);
    EXPECT_EQ(registry.bestAvailableHost(), kAlice);
}

TEST_F(HostRegistryTest, TiesGoToLowestId) {
    registry.upsert(kBob, "B", 1);
    registry.upsert(kAlice, "A", 1);
    EXPECT_EQ(registry.bestAvailableHost(), kAlice);
}

TEST_F(HostRegistryTest, RefreshOnAFrozenClockStillMovesLastSeenForward) {
    registry.upsert(kAlice, "A", 1);
    registry.upsert(kBob, "B", 1);
    registry.upsert(kBob, "B", 1);

    hostlink::HostInfo a, b;
    ASSERT_TRUE(registry.lookup(kAlice, a));
    ASSERT_TRUE(registry.lookup(kBob, b));
    EXPECT_GT(b.lastSeen, a.lastSeen);
    EXPECT_EQ(registry.bestAvailableHost(), kBob);
}

TEST_F(HostRegistryTest, InviteTakesPriority) {
    registry.upsert(kAlice, "A", 1);
    registry.setInvite(kCarol, "109775240000000001");
    clock.advance(1s);
    registry.upsert(kBob, "B", 1);

    EXPECT_EQ(registry.bestAvailableHost(), kCarol);

    hostlink::HostInfo c;
    ASSERT_TRUE(registry.lookup(kCarol, c));
    EXPECT_EQ(c.sessionName, "Friend's Session");

    registry.clearInvite();
    registry.clearInvite();
    EXPECT_FALSE(registry.invite().has_value());
    EXPECT_EQ(registry.bestAvailableHost(), kBob);
}

TEST_F(HostRegistryTest, InviteDoesNotRenameKnownHost) {
    registry.upsert(kAlice, "Alice's session", 3);
    registry.setInvite(kAlice, "");

    hostlink::HostInfo h;
    ASSERT_TRUE(registry.lookup(kAlice, h));
    EXPECT_EQ(h.sessionName, "Alice's session");
    EXPECT_EQ(h.playerCount, 3);
}

TEST_F(HostRegistryTest, ZeroInviterIsIgnored) {
    registry.setInvite(kNoPeer, "x");
    EXPECT_FALSE(registry.invite().has_value());
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(HostRegistryTest, SelfIsNeverReturned) {
    ASSERT_TRUE(registry.registerSelfAsHost("Mine"));
    EXPECT_EQ(registry.selfHostId(), fake.localId);
    EXPECT_EQ(registry.size(), 1u);

    EXPECT_TRUE(registry.activeHosts().empty());
    EXPECT_EQ(registry.bestAvailableHost(), kNoPeer);

    hostlink::HostInfo h;
    EXPECT_FALSE(registry.lookup(fake.localId, h));

    registry.setInvite(fake.localId, "");
    EXPECT_EQ(registry.bestAvailableHost(), kNoPeer);

    registry.upsert(kAlice, "A", 1);
    EXPECT_EQ(registry.bestAvailableHost(), kAlice);
}

TEST_F(HostRegistryTest, SelfEntryHeartbeat) {
    ASSERT_TRUE(registry.registerSelfAsHost("Mine"));

    clock.advance(31s);
    registry.activeHosts(); // purges the self entry
    EXPECT_EQ(registry.size(), 0u);

    EXPECT_TRUE(registry.refreshSelf());
    EXPECT_EQ(registry.size(), 1u);

    registry.unregisterSelfAsHost();
    EXPECT_EQ(registry.selfHostId(), kNoPeer);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(HostRegistry, SelfRegistrationNeedsLocalId) {
    CapabilityBinder binder;
    IdentityCache identity(binder);
    HostRegistry registry(identity);

    EXPECT_FALSE(registry.registerSelfAsHost());
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(HostRegistryTest, ConnectTokenIsKeptWhenRefreshedWithoutOne) {
    registry.upsert(kAlice, "A", 1, "109775240000000005");
    registry.upsert(kAlice, "A", 1);

    hostlink::HostInfo h;
    ASSERT_TRUE(registry.lookup(kAlice, h));
    EXPECT_EQ(h.connectToken, "109775240000000005");
}
