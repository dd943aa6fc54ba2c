#include <gtest/gtest.h>

#include "net/PresenceScanner.hpp"
#include "net/HostRegistry.hpp"
#include "net/IdentityCache.hpp"
#include "FakePlatform.hpp"

using namespace std::chrono_literals;
using hostlink::FriendActivity;
using hostlink::classifyPresence;

namespace {

    constexpr hostlink::PeerId kAlice = 76561197960265729ULL;
    constexpr hostlink::PeerId kBob = 76561197960265730ULL;
    constexpr hostlink::PeerId kCarol = 76561197960265731ULL;

    class PresenceScannerTest : public ::testing::Test {
    protected:
        void SetUp() override { fake.install(binder); }

        FakePlatform fake;
        CapabilityBinder binder;
        IdentityCache identity{ binder };
        ManualClock clock;
        HostLinkConfig cfg;
        HostRegistry registry{ identity, clock.fn(), 30s };
        PresenceScanner scanner{ binder, identity, registry, cfg, clock.fn() };
    };

} // namespace

TEST(ClassifyPresence, HostingPaths) {
    EXPECT_EQ(classifyPresence("hosting", "", ""), FriendActivity::Hosting);
    EXPECT_EQ(classifyPresence("", "1.0", "109775240000000001"), FriendActivity::Hosting);
    EXPECT_EQ(classifyPresence("menu", "1.0", "109775240000000001"), FriendActivity::Hosting);

    EXPECT_EQ(classifyPresence("menu", "1.0", ""), FriendActivity::Playing);
    EXPECT_EQ(classifyPresence("", "1.0", ""), FriendActivity::NotRunning);
    EXPECT_EQ(classifyPresence("", "", "109775240000000001"), FriendActivity::NotRunning);
}

TEST_F(PresenceScannerTest, FindsHostingFriends) {
    FakePlatform::makeHost(fake.addFriend(kAlice, "Alice"), "109775240000000011");

    auto& bob = fake.addFriend(kBob, "Bob");
    bob.presence["hostlink_status"] = "menu";

    ASSERT_TRUE(scanner.scan());

    const auto hosts = registry.activeHosts();
    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts[0].peerId, kAlice);
    EXPECT_EQ(hosts[0].sessionName, "Alice's session");
    EXPECT_EQ(hosts[0].playerCount, 1);
    EXPECT_EQ(hosts[0].connectToken, "109775240000000011");

    const auto& s = scanner.lastStats();
    EXPECT_EQ(s.friendsSeen, 2);
    EXPECT_EQ(s.playingTarget, 2);
    EXPECT_EQ(s.hosting, 1);
    EXPECT_EQ(s.added, 1);
}

TEST_F(PresenceScannerTest, VersionAndConnectWithoutMarkerCountAsHosting) {
    auto& carol = fake.addFriend(kCarol, "Carol");
    carol.presence["hostlink_version"] = "1.0";
    carol.presence["connect"] = "109775240000000012";

    ASSERT_TRUE(scanner.scan());
    hostlink::HostInfo h;
    EXPECT_TRUE(registry.lookup(kCarol, h));
}

TEST_F(PresenceScannerTest, OfflineOrOtherGameIsSkipped) {
    auto& alice = fake.addFriend(kAlice, "Alice");
    FakePlatform::makeHost(alice);
    alice.online = false;

    auto& bob = fake.addFriend(kBob, "Bob");
    FakePlatform::makeHost(bob);
    bob.inGame = false;

    ASSERT_TRUE(scanner.scan());
    EXPECT_TRUE(registry.activeHosts().empty());
    EXPECT_EQ(scanner.lastStats().friendsSeen, 2);
    EXPECT_EQ(scanner.lastStats().playingTarget, 0);
}

TEST_F(PresenceScannerTest, LocalIdInFriendListIsSkipped) {
    FakePlatform::makeHost(fake.addFriend(fake.localId, "Me"));

    ASSERT_TRUE(scanner.scan());
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(scanner.lastStats().friendsSeen, 0);
}

TEST_F(PresenceScannerTest, MissingNameFallsBackToId) {
    FakePlatform::makeHost(fake.addFriend(kAlice, ""));

    ASSERT_TRUE(scanner.scan());
    hostlink::HostInfo h;
    ASSERT_TRUE(registry.lookup(kAlice, h));
    EXPECT_EQ(h.sessionName, std::to_string(kAlice) + "'s session");
}

TEST_F(PresenceScannerTest, ScansAreRateLimited) {
    FakePlatform::makeHost(fake.addFriend(kAlice, "Alice"));

    EXPECT_TRUE(scanner.scan());
    EXPECT_FALSE(scanner.scan());
    clock.advance(2999ms);
    EXPECT_FALSE(scanner.scan());
    EXPECT_EQ(fake.friendCountCalls, 1);

    clock.advance(1ms);
    EXPECT_TRUE(scanner.scan());
    EXPECT_EQ(fake.friendCountCalls, 2);
    EXPECT_EQ(scanner.lastStats().added, 0); // already known
}

TEST_F(PresenceScannerTest, StoppedHostIsLeftForExpiry) {
    auto& alice = fake.addFriend(kAlice, "Alice");
    FakePlatform::makeHost(alice);
    ASSERT_TRUE(scanner.scan());

    fake.friends[0].presence.clear();
    clock.advance(10s);
    ASSERT_TRUE(scanner.scan());
    EXPECT_EQ(registry.activeHosts().size(), 1u);

    clock.advance(21s);
    EXPECT_TRUE(registry.activeHosts().empty());
}

TEST(PresenceScanner, NoFriendListMeansNoScan) {
    CapabilityBinder binder;
    IdentityCache identity(binder);
    HostRegistry registry(identity);
    HostLinkConfig cfg;
    PresenceScanner scanner(binder, identity, registry, cfg);

    EXPECT_FALSE(scanner.scan());
    EXPECT_EQ(registry.size(), 0u);
}
