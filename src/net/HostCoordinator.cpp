#include "HostCoordinator.hpp"
#include <iostream>

using hostlink::PeerId;
using hostlink::Status;

HostCoordinator::HostCoordinator(const HostLinkConfig& cfg, hostlink::NowFn now)
    : m_cfg(cfg)
    , m_binder()
    , m_identity(m_binder)
    , m_registry(m_identity, now, m_cfg.hostTTL)
    , m_scanner(m_binder, m_identity, m_registry, m_cfg, now)
    , m_session(m_binder, m_identity, m_registry, m_cfg, now)
    , m_members(m_binder, m_identity, m_session) {
}

void HostCoordinator::onInviteReceived(PeerId inviterId, const std::string& lobbyToken) {
    std::cout << "[Session] Invite from " << inviterId << " (lobby \"" << lobbyToken << "\")\n";
    m_registry.setInvite(inviterId, lobbyToken);
}

Status HostCoordinator::requestAutoJoin() {
    // A pending invite survives a request that cannot join right now.
    if (m_session.phase() != hostlink::SessionPhase::Idle) {
        std::cerr << "[Session] Cannot auto-join while " << hostlink::phaseName(m_session.phase()) << "\n";
        return Status::NotReady;
    }

    const PeerId host = m_registry.bestAvailableHost();
    if (host == hostlink::kNoPeer) {
        std::cerr << "[Session] No available hosts for automatic joining\n";
        return Status::NotReady;
    }

    // Prefer a concrete group: the invite's lobby, then the host's advertised
    // connect token, then the host id itself.
    PeerId target = host;
    PeerId group = hostlink::kNoPeer;
    hostlink::HostInfo info{};

    const auto inv = m_registry.invite();
    if (inv && inv->inviterId == host &&
        hostlink::normalizeIdentifier(hostlink::textValue(inv->lobbyToken), group) == Status::Ok) {
        target = group;
    }
    else if (m_registry.lookup(host, info) &&
        hostlink::normalizeIdentifier(hostlink::textValue(info.connectToken), group) == Status::Ok) {
        target = group;
    }

    m_registry.clearInvite();

    std::cout << "[Session] Auto-selected host " << host << " -> joining " << target << "\n";
    return m_session.startJoining(target);
}

Status HostCoordinator::requestJoin(PeerId hostOrGroupId) {
    if (hostOrGroupId == hostlink::kNoPeer) return Status::NotReady;
    if (m_session.phase() != hostlink::SessionPhase::Idle) {
        std::cerr << "[Session] Cannot join while " << hostlink::phaseName(m_session.phase()) << "\n";
        return Status::NotReady;
    }

    m_registry.clearInvite();
    return m_session.startJoining(hostOrGroupId);
}

Status HostCoordinator::requestHost() {
    return m_session.startHosting();
}

Status HostCoordinator::requestStop() {
    return m_session.stopSession();
}

void HostCoordinator::tick() {
    if (m_binder.hasOperation(hostlink::ops::kRunCallbacks)) {
        m_binder.invoke(hostlink::ops::kRunCallbacks);
    }

    m_scanner.scan();
    m_members.poll();

    if (m_session.isHosting()) m_session.broadcastAvailability();
}

Status HostCoordinator::sendData(PeerId peer, const std::string& bytes, int channel) {
    const auto r = m_binder.invoke(hostlink::ops::kSendData,
        { hostlink::idValue(peer), hostlink::textValue(bytes), hostlink::intValue(channel) });
    if (!r.ok()) return r.status;

    bool sent = false;
    if (!hostlink::asFlag(r.value, sent) || !sent) return Status::OperationFailed;
    return Status::Ok;
}
