#pragma once
#include <functional>
#include <string>
#include <unordered_set>

#include "DiscoveryTypes.hpp"

class CapabilityBinder;
class IdentityCache;
class SessionLifecycle;

// Host-side join detection. The platform has no join push event we can rely
// on, so each poll diffs the member list against the previous poll.
class MembershipTracker {
public:
    using MemberJoinedFn = std::function<void(hostlink::PeerId peer, const std::string& groupToken)>;

    MembershipTracker(CapabilityBinder& binder, IdentityCache& identity, const SessionLifecycle& session);

    void setObserver(MemberJoinedFn fn) { m_onJoined = std::move(fn); }

    // Returns the number of join events raised.
    int poll();

    std::unordered_set<hostlink::PeerId> members() const { return m_members; }

private:
    CapabilityBinder& m_binder;
    IdentityCache& m_identity;
    const SessionLifecycle& m_session;

    MemberJoinedFn m_onJoined;

    hostlink::PeerId m_trackedGroup{ hostlink::kNoPeer };
    std::unordered_set<hostlink::PeerId> m_members;
};
