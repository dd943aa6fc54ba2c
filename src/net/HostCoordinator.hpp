#pragma once
#include <string>
#include <vector>

#include "HostLinkConfig.hpp"
#include "CapabilityBinder.hpp"
#include "IdentityCache.hpp"
#include "HostRegistry.hpp"
#include "PresenceScanner.hpp"
#include "SessionLifecycle.hpp"
#include "MembershipTracker.hpp"

// Owns the discovery components and exposes what the overlay / invite
// handlers call. Platform backends register their call shapes on binder().
class HostCoordinator {
public:
    explicit HostCoordinator(const HostLinkConfig& cfg = {}, hostlink::NowFn now = hostlink::steadyNow());

    HostCoordinator(const HostCoordinator&) = delete;
    HostCoordinator& operator=(const HostCoordinator&) = delete;

    CapabilityBinder& binder() { return m_binder; }

    // Platform invite callback
    void onInviteReceived(hostlink::PeerId inviterId, const std::string& lobbyToken);

    hostlink::Status requestAutoJoin();
    hostlink::Status requestJoin(hostlink::PeerId hostOrGroupId);
    hostlink::Status requestHost();
    hostlink::Status requestStop();

    // Call once per frame / timer tick.
    void tick();

    void onMemberJoined(MembershipTracker::MemberJoinedFn fn) { m_members.setObserver(std::move(fn)); }

    hostlink::Status sendData(hostlink::PeerId peer, const std::string& bytes, int channel = 0);

    std::vector<hostlink::HostInfo> activeHosts() { return m_registry.activeHosts(); }
    hostlink::SessionState state() const { return m_session.state(); }
    hostlink::PeerId localId() { return m_identity.localId(); }

    const HostRegistry& registry() const { return m_registry; }
    const PresenceScanner& scanner() const { return m_scanner; }

private:
    HostLinkConfig m_cfg;
    CapabilityBinder m_binder;
    IdentityCache m_identity;
    HostRegistry m_registry;
    PresenceScanner m_scanner;
    SessionLifecycle m_session;
    MembershipTracker m_members;
};
