#include "PresenceScanner.hpp"
#include "CapabilityBinder.hpp"
#include "IdentityCache.hpp"
#include "HostRegistry.hpp"
#include <iostream>

using hostlink::PeerId;

namespace hostlink {

FriendActivity classifyPresence(const std::string& status, const std::string& version, const std::string& connect) {
    // Two independent ways to be a host; do not fold one into the other.
    if (status == presence::kHostingValue) return FriendActivity::Hosting;
    if (!version.empty() && !connect.empty()) return FriendActivity::Hosting;

    if (!status.empty()) return FriendActivity::Playing;
    return FriendActivity::NotRunning;
}

} // namespace hostlink

PresenceScanner::PresenceScanner(CapabilityBinder& binder, IdentityCache& identity, HostRegistry& registry,
    const HostLinkConfig& cfg, hostlink::NowFn now)
    : m_binder(binder)
    , m_identity(identity)
    , m_registry(registry)
    , m_cfg(cfg)
    , m_now(std::move(now)) {
}

std::string PresenceScanner::readPresence(PeerId friendId, const char* key, const std::string& name) {
    const auto r = m_binder.invoke(hostlink::ops::kFriendPresence,
        { hostlink::idValue(friendId), hostlink::textValue(key) });

    std::string out;
    if (!r.ok() || !hostlink::asText(r.value, out)) {
        std::cerr << "[Scanner] Could not read presence '" << key << "' for " << name
            << " (" << hostlink::statusName(r.status) << ")\n";
        return {};
    }
    return out;
}

bool PresenceScanner::scan() {
    const auto now = m_now();
    if (m_hasScanned && now - m_lastScan < m_cfg.scanInterval) return false;

    m_hasScanned = true;
    m_lastScan = now;
    m_stats = Stats{};

    const auto countRes = m_binder.invoke(hostlink::ops::kFriendCount);
    int64_t count = 0;
    if (!countRes.ok() || !hostlink::asInt(countRes.value, count) || count < 0) {
        return false;
    }

    const PeerId me = m_identity.localId();

    for (int64_t i = 0; i < count; ++i) {
        const auto at = m_binder.invoke(hostlink::ops::kFriendAt, { hostlink::intValue(i) });
        PeerId id = hostlink::kNoPeer;
        if (!at.ok() || hostlink::normalizeIdentifier(at.value, id) != hostlink::Status::Ok) continue;
        if (id == me) continue;

        ++m_stats.friendsSeen;

        bool online = false;
        bool inGame = false;
        const auto onlineRes = m_binder.invoke(hostlink::ops::kFriendOnline, { hostlink::idValue(id) });
        if (!onlineRes.ok() || !hostlink::asFlag(onlineRes.value, online) || !online) continue;
        const auto gameRes = m_binder.invoke(hostlink::ops::kFriendInGame, { hostlink::idValue(id) });
        if (!gameRes.ok() || !hostlink::asFlag(gameRes.value, inGame) || !inGame) continue;

        ++m_stats.playingTarget;

        std::string name;
        const auto nameRes = m_binder.invoke(hostlink::ops::kFriendName, { hostlink::idValue(id) });
        if (!nameRes.ok() || !hostlink::asText(nameRes.value, name) || name.empty()) {
            name = std::to_string(id);
        }

        const std::string status = readPresence(id, hostlink::presence::kHostMarker, name);
        const std::string version = readPresence(id, hostlink::presence::kVersionMarker, name);
        const std::string connect = readPresence(id, hostlink::presence::kConnect, name);

        const auto activity = hostlink::classifyPresence(status, version, connect);
        if (activity != hostlink::FriendActivity::Hosting) continue;

        ++m_stats.hosting;

        hostlink::HostInfo existing{};
        const bool known = m_registry.lookup(id, existing);
        m_registry.upsert(id, name + m_cfg.sessionNameSuffix, 1, connect);

        if (!known) {
            ++m_stats.added;
            std::cout << "[Scanner] " << name << " (" << id << ") is hosting (status: " << status
                << ", version: " << version << ")\n";
        }
    }

    if (m_stats.added > 0) {
        std::cout << "[Scanner] Friend scan: " << m_stats.playingTarget << " in game, "
            << m_stats.hosting << " hosting, " << m_stats.added << " new\n";
    }
    return true;
}
