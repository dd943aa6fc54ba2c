#pragma once
#include <unordered_map>
#include <vector>
#include <string>
#include <optional>
#include <chrono>

#include "DiscoveryTypes.hpp"

class IdentityCache;

// Candidate hosts keyed by peer id. Entries expire on their own; the local
// identity may be stored (self entry) but is never handed back to callers.
class HostRegistry {
public:
    using Clock = hostlink::Clock;

    explicit HostRegistry(IdentityCache& identity,
        hostlink::NowFn now = hostlink::steadyNow(),
        std::chrono::seconds ttl = kDefaultTTL);

    void upsert(hostlink::PeerId peer, const std::string& sessionName, int playerCount,
        const std::string& connectToken = {});

    // Invite flow
    void setInvite(hostlink::PeerId inviter, const std::string& lobbyToken);
    void clearInvite();
    std::optional<hostlink::InviteRecord> invite() const { return m_invite; }

    // Invite first, then the most recently seen host. kNoPeer if nobody qualifies.
    hostlink::PeerId bestAvailableHost();

    // Purges stale entries, returns copies of the rest (unordered).
    std::vector<hostlink::HostInfo> activeHosts();
    bool lookup(hostlink::PeerId peer, hostlink::HostInfo& out);

    // Self entry, toggled by the session lifecycle.
    bool registerSelfAsHost(const std::string& sessionName = "My Session");
    void unregisterSelfAsHost();
    bool refreshSelf(); // heartbeat; re-creates the entry if it was purged
    hostlink::PeerId selfHostId() const { return m_selfHostId; }

    size_t size() const { return m_hosts.size(); }

private:
    void cleanupExpired();
    void touch(hostlink::HostInfo& h, bool existed);

private:
    IdentityCache& m_identity;
    hostlink::NowFn m_now;
    std::chrono::seconds m_ttl;

    std::unordered_map<hostlink::PeerId, hostlink::HostInfo> m_hosts;
    std::optional<hostlink::InviteRecord> m_invite;

    hostlink::PeerId m_selfHostId{ hostlink::kNoPeer };
    std::string m_selfName{ "My Session" };

private:
    static constexpr std::chrono::seconds kDefaultTTL{ 30 };
};
