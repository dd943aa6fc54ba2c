#include "HostRegistry.hpp"
#include "IdentityCache.hpp"
#include <iostream>

using hostlink::PeerId;
using hostlink::kNoPeer;

HostRegistry::HostRegistry(IdentityCache& identity, hostlink::NowFn now, std::chrono::seconds ttl)
    : m_identity(identity)
    , m_now(std::move(now))
    , m_ttl(ttl) {
}

void HostRegistry::touch(hostlink::HostInfo& h, bool existed) {
    const auto now = m_now();

    // lastSeen must move forward on every refresh, even on a coarse clock
    if (existed && now <= h.lastSeen) h.lastSeen += Clock::duration(1);
    else h.lastSeen = now;

    h.isActive = true;
}

void HostRegistry::upsert(PeerId peer, const std::string& sessionName, int playerCount, const std::string& connectToken) {
    if (peer == kNoPeer) return;

    auto it = m_hosts.find(peer);
    const bool existed = (it != m_hosts.end());

    hostlink::HostInfo& h = existed ? it->second : m_hosts[peer];
    h.peerId = peer;
    h.sessionName = sessionName;
    h.playerCount = playerCount > 0 ? playerCount : 1;
    if (!connectToken.empty()) h.connectToken = connectToken;

    touch(h, existed);
}

void HostRegistry::setInvite(PeerId inviter, const std::string& lobbyToken) {
    if (inviter == kNoPeer) return;

    m_invite = hostlink::InviteRecord{ inviter, lobbyToken };

    if (m_hosts.find(inviter) == m_hosts.end()) {
        upsert(inviter, "Friend's Session", 1);
        std::cout << "[Registry] Added host from invite: " << inviter << "\n";
    }
}

void HostRegistry::clearInvite() {
    m_invite.reset();
}

void HostRegistry::cleanupExpired() {
    const auto now = m_now();

    for (auto it = m_hosts.begin(); it != m_hosts.end(); ) {
        if (now - it->second.lastSeen > m_ttl) {
            it = m_hosts.erase(it);
            continue;
        }
        ++it;
    }
}

PeerId HostRegistry::bestAvailableHost() {
    cleanupExpired();

    const PeerId me = m_identity.localId();

    if (m_invite && m_invite->inviterId != me && m_invite->inviterId != m_selfHostId) {
        return m_invite->inviterId;
    }

    PeerId best = kNoPeer;
    Clock::time_point mostRecent{};

    for (const auto& kv : m_hosts) {
        const auto& h = kv.second;
        if (!h.isActive) continue;
        if (h.peerId == me || h.peerId == m_selfHostId) continue;

        const bool newer = (best == kNoPeer) || (h.lastSeen > mostRecent) ||
            (h.lastSeen == mostRecent && h.peerId < best);
        if (newer) {
            best = h.peerId;
            mostRecent = h.lastSeen;
        }
    }

    return best;
}

std::vector<hostlink::HostInfo> HostRegistry::activeHosts() {
    cleanupExpired();

    const PeerId me = m_identity.localId();

    std::vector<hostlink::HostInfo> out;
    out.reserve(m_hosts.size());
    for (const auto& kv : m_hosts) {
        if (kv.second.isActive && kv.first != me) out.push_back(kv.second);
    }
    return out;
}

bool HostRegistry::lookup(PeerId peer, hostlink::HostInfo& out) {
    cleanupExpired();

    if (peer == m_identity.localId()) return false;

    auto it = m_hosts.find(peer);
    if (it == m_hosts.end()) return false;

    out = it->second;
    return true;
}

bool HostRegistry::registerSelfAsHost(const std::string& sessionName) {
    const PeerId me = m_identity.localId();
    if (me == kNoPeer) {
        std::cerr << "[Registry] Cannot register as host - local id not available\n";
        return false;
    }

    m_selfHostId = me;
    m_selfName = sessionName;
    upsert(me, m_selfName, 1);
    return true;
}

void HostRegistry::unregisterSelfAsHost() {
    if (m_selfHostId != kNoPeer) {
        m_hosts.erase(m_selfHostId);
        std::cout << "[Registry] Unregistered as host: " << m_selfHostId << "\n";
    }
    m_selfHostId = kNoPeer;
}

bool HostRegistry::refreshSelf() {
    if (m_selfHostId == kNoPeer) return registerSelfAsHost(m_selfName);

    auto it = m_hosts.find(m_selfHostId);
    if (it == m_hosts.end()) {
        upsert(m_selfHostId, m_selfName, 1);
        return true;
    }

    touch(it->second, true);
    return true;
}
