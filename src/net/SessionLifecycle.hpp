#pragma once
#include <string>

#include "DiscoveryTypes.hpp"
#include "HostLinkConfig.hpp"

class CapabilityBinder;
class IdentityCache;
class HostRegistry;

// Idle -> Hosting, Idle -> Joining -> Active, anything -> Idle.
// A failed transition leaves the state exactly as it was.
class SessionLifecycle {
public:
    SessionLifecycle(CapabilityBinder& binder, IdentityCache& identity, HostRegistry& registry,
        const HostLinkConfig& cfg, hostlink::NowFn now = hostlink::steadyNow());

    hostlink::Status startHosting();
    hostlink::Status startJoining(hostlink::PeerId hostOrGroupId);
    hostlink::Status stopSession();

    // Hosting heartbeat. Also retries group creation while ungrouped.
    hostlink::Status broadcastAvailability();

    hostlink::SessionState state() const { return m_state; }
    hostlink::SessionPhase phase() const { return m_state.phase; }
    bool isHosting() const { return m_state.phase == hostlink::SessionPhase::Hosting; }

private:
    hostlink::Status createGroup();
    bool setPresence(const char* key, const std::string& value);
    void clearPresence();

private:
    CapabilityBinder& m_binder;
    IdentityCache& m_identity;
    HostRegistry& m_registry;
    const HostLinkConfig& m_cfg;
    hostlink::NowFn m_now;

    hostlink::SessionState m_state{};
    hostlink::Clock::time_point m_lastGroupAttempt{};
};
