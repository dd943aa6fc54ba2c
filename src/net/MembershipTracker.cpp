#include "MembershipTracker.hpp"
#include "CapabilityBinder.hpp"
#include "IdentityCache.hpp"
#include "SessionLifecycle.hpp"
#include <iostream>

using hostlink::PeerId;

MembershipTracker::MembershipTracker(CapabilityBinder& binder, IdentityCache& identity, const SessionLifecycle& session)
    : m_binder(binder)
    , m_identity(identity)
    , m_session(session) {
}

int MembershipTracker::poll() {
    const auto st = m_session.state();

    if (st.phase != hostlink::SessionPhase::Hosting || !st.isGroupOwner || st.groupId == hostlink::kNoPeer) {
        if (m_trackedGroup != hostlink::kNoPeer) {
            m_members.clear();
            m_trackedGroup = hostlink::kNoPeer;
        }
        return 0;
    }

    if (st.groupId != m_trackedGroup) {
        m_members.clear();
        m_trackedGroup = st.groupId;
    }

    const auto countRes = m_binder.invoke(hostlink::ops::kGroupMemberCount, { hostlink::idValue(st.groupId) });
    int64_t count = 0;
    if (!countRes.ok() || !hostlink::asInt(countRes.value, count) || count < 0) {
        std::cerr << "[Members] Could not read member count of " << st.groupId
            << " (" << hostlink::statusName(countRes.status) << ")\n";
        return 0;
    }

    std::unordered_set<PeerId> current;
    for (int64_t i = 0; i < count; ++i) {
        const auto r = m_binder.invoke(hostlink::ops::kGroupMemberAt,
            { hostlink::idValue(st.groupId), hostlink::intValue(i) });

        PeerId id = hostlink::kNoPeer;
        if (!r.ok() || hostlink::normalizeIdentifier(r.value, id) != hostlink::Status::Ok) {
            std::cerr << "[Members] Skipping member #" << i << " (" << hostlink::describe(r.value) << ")\n";
            continue;
        }
        current.insert(id);
    }

    const PeerId me = m_identity.localId();

    int joined = 0;
    for (PeerId id : current) {
        if (m_members.count(id) || id == me) continue;

        ++joined;
        std::cout << "[Members] Player joined group " << st.lobbyToken << ": " << id << "\n";
        if (m_onJoined) m_onJoined(id, st.lobbyToken);
    }

    m_members = std::move(current);
    return joined;
}
