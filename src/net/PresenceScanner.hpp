#pragma once
#include <string>
#include <cstdint>

#include "DiscoveryTypes.hpp"
#include "HostLinkConfig.hpp"

class CapabilityBinder;
class IdentityCache;
class HostRegistry;

namespace hostlink {

    enum class FriendActivity : uint8_t {
        NotRunning = 0,  // in the game, no HostLink presence at all
        Playing = 1,     // HostLink presence present, not hosting
        Hosting = 2,
    };

    // Explicit marker, or the version+connect pair some hosts set without it.
    FriendActivity classifyPresence(const std::string& status, const std::string& version, const std::string& connect);

} // namespace hostlink

// Sweeps the friends list for players advertising a joinable session and
// feeds them into the registry. Never retires entries; TTL does that.
class PresenceScanner {
public:
    struct Stats {
        int friendsSeen{ 0 };
        int playingTarget{ 0 };
        int hosting{ 0 };
        int added{ 0 };
    };

    PresenceScanner(CapabilityBinder& binder, IdentityCache& identity, HostRegistry& registry,
        const HostLinkConfig& cfg, hostlink::NowFn now = hostlink::steadyNow());

    // Returns false when rate limited or the friends list is unavailable.
    bool scan();

    const Stats& lastStats() const { return m_stats; }

private:
    std::string readPresence(hostlink::PeerId friendId, const char* key, const std::string& name);

private:
    CapabilityBinder& m_binder;
    IdentityCache& m_identity;
    HostRegistry& m_registry;
    const HostLinkConfig& m_cfg;
    hostlink::NowFn m_now;

    bool m_hasScanned{ false };
    hostlink::Clock::time_point m_lastScan{};
    Stats m_stats{};
};
