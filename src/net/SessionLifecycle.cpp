#include "SessionLifecycle.hpp"
#include "CapabilityBinder.hpp"
#include "IdentityCache.hpp"
#include "HostRegistry.hpp"
#include <iostream>

using hostlink::PeerId;
using hostlink::SessionPhase;
using hostlink::Status;

SessionLifecycle::SessionLifecycle(CapabilityBinder& binder, IdentityCache& identity, HostRegistry& registry,
    const HostLinkConfig& cfg, hostlink::NowFn now)
    : m_binder(binder)
    , m_identity(identity)
    , m_registry(registry)
    , m_cfg(cfg)
    , m_now(std::move(now)) {
}

bool SessionLifecycle::setPresence(const char* key, const std::string& value) {
    const auto r = m_binder.invoke(hostlink::ops::kSetPresence,
        { hostlink::textValue(key), hostlink::textValue(value) });

    bool ok = false;
    if (!r.ok() || !hostlink::asFlag(r.value, ok) || !ok) {
        std::cerr << "[Session] Could not set presence " << key << "=" << value
            << " (" << hostlink::statusName(r.ok() ? Status::OperationFailed : r.status) << ")\n";
        return false;
    }
    return true;
}

void SessionLifecycle::clearPresence() {
    const auto r = m_binder.invoke(hostlink::ops::kClearPresence);
    if (!r.ok()) {
        std::cerr << "[Session] Could not clear presence (" << hostlink::statusName(r.status) << ")\n";
    }
}

Status SessionLifecycle::createGroup() {
    m_lastGroupAttempt = m_now();

    const auto r = m_binder.invoke(hostlink::ops::kCreateGroup, {
        hostlink::intValue((int64_t)m_cfg.groupVisibility),
        hostlink::intValue(m_cfg.maxMembers) });

    if (!r.ok()) {
        std::cerr << "[Session] Could not create session group (" << hostlink::statusName(r.status)
            << "); hosting via presence only\n";
        return r.status;
    }

    PeerId groupId = hostlink::kNoPeer;
    const Status st = hostlink::normalizeIdentifier(r.value, groupId);
    if (st != Status::Ok) {
        std::cerr << "[Session] Could not extract group id from " << hostlink::describe(r.value) << "\n";
        return st;
    }

    m_state.groupId = groupId;
    m_state.lobbyToken = std::to_string(groupId);
    m_state.isGroupOwner = true;

    bool joinable = false;
    const auto j = m_binder.invoke(hostlink::ops::kSetGroupJoinable,
        { hostlink::idValue(groupId), hostlink::flagValue(true) });
    if (!j.ok() || !hostlink::asFlag(j.value, joinable) || !joinable) {
        std::cerr << "[Session] Group " << groupId << " could not be made joinable\n";
    }

    const auto meta = [&](const char* key, const std::string& value) {
        bool ok = false;
        const auto d = m_binder.invoke(hostlink::ops::kSetGroupData,
            { hostlink::idValue(groupId), hostlink::textValue(key), hostlink::textValue(value) });
        if (!d.ok() || !hostlink::asFlag(d.value, ok) || !ok) {
            std::cerr << "[Session] Could not set group data " << key << "\n";
        }
    };
    meta(hostlink::groupdata::kHostId, std::to_string(m_state.selfHostId));
    meta(hostlink::groupdata::kVersion, m_cfg.version);

    setPresence(hostlink::presence::kConnect, m_state.lobbyToken);

    std::cout << "[Session] Hosting joinable group " << groupId << "\n";
    return Status::Ok;
}

Status SessionLifecycle::startHosting() {
    if (m_state.phase != SessionPhase::Idle) {
        std::cerr << "[Session] Cannot host while " << hostlink::phaseName(m_state.phase) << "\n";
        return Status::NotReady;
    }

    const PeerId me = m_identity.localId();
    if (me == hostlink::kNoPeer) {
        std::cerr << "[Session] Cannot start hosting - local id not available\n";
        return Status::NotReady;
    }

    setPresence(hostlink::presence::kStatus, hostlink::presence::kInGame);
    setPresence(hostlink::presence::kDisplay, hostlink::presence::kInGameToken);
    setPresence(hostlink::presence::kHostMarker, hostlink::presence::kHostingValue);
    setPresence(hostlink::presence::kVersionMarker, m_cfg.version);

    if (!m_registry.registerSelfAsHost(m_cfg.selfSessionName)) {
        clearPresence();
        return Status::NotReady;
    }

    m_state = hostlink::SessionState{};
    m_state.phase = SessionPhase::Hosting;
    m_state.selfHostId = me;

    // Without a group we still host; friends find us through presence and
    // broadcastAvailability() keeps trying.
    createGroup();

    std::cout << "[Session] Hosting as " << me << "\n";
    return Status::Ok;
}

Status SessionLifecycle::startJoining(PeerId hostOrGroupId) {
    if (hostOrGroupId == hostlink::kNoPeer) return Status::NotReady;
    if (m_state.phase != SessionPhase::Idle) {
        std::cerr << "[Session] Cannot join while " << hostlink::phaseName(m_state.phase) << "\n";
        return Status::NotReady;
    }

    m_state.phase = SessionPhase::Joining;

    setPresence(hostlink::presence::kStatus, hostlink::presence::kJoining);
    setPresence(hostlink::presence::kDisplay, hostlink::presence::kJoiningToken);
    std::cout << "[Session] Joining session with host/group " << hostOrGroupId << "\n";

    const auto r = m_binder.invoke(hostlink::ops::kJoinGroup, { hostlink::idValue(hostOrGroupId) });

    bool joined = false;
    if (!r.ok() || !hostlink::asFlag(r.value, joined) || !joined) {
        const Status st = r.ok() ? Status::OperationFailed : r.status;
        std::cerr << "[Session] Join of " << hostOrGroupId << " failed (" << hostlink::statusName(st) << ")\n";
        clearPresence();
        m_state = hostlink::SessionState{};
        return st;
    }

    m_state.phase = SessionPhase::Active;
    m_state.groupId = hostOrGroupId;
    m_state.lobbyToken = std::to_string(hostOrGroupId);
    m_state.isGroupOwner = false;

    std::cout << "[Session] Joined " << hostOrGroupId << "\n";
    return Status::Ok;
}

Status SessionLifecycle::stopSession() {
    if (m_state.phase == SessionPhase::Idle && m_state.groupId == hostlink::kNoPeer) {
        return Status::Ok;
    }

    clearPresence();

    if (m_state.groupId != hostlink::kNoPeer) {
        const auto r = m_binder.invoke(hostlink::ops::kLeaveGroup, { hostlink::idValue(m_state.groupId) });
        if (r.ok()) std::cout << "[Session] Left group " << m_state.groupId << "\n";
        else std::cerr << "[Session] Leave group failed (" << hostlink::statusName(r.status) << ")\n";
    }

    m_registry.unregisterSelfAsHost();
    m_state = hostlink::SessionState{};

    std::cout << "[Session] Stopped multiplayer session\n";
    return Status::Ok;
}

Status SessionLifecycle::broadcastAvailability() {
    if (m_state.phase != SessionPhase::Hosting) return Status::NotReady;

    m_registry.refreshSelf();

    if (m_state.groupId == hostlink::kNoPeer && m_now() - m_lastGroupAttempt >= m_cfg.groupRetryInterval) {
        createGroup();
    }
    return Status::Ok;
}
