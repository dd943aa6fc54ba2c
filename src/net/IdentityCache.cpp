#include "IdentityCache.hpp"
#include "CapabilityBinder.hpp"
#include <iostream>

hostlink::PeerId IdentityCache::localId() {
    if (m_cached != hostlink::kNoPeer) return m_cached;

    const auto r = m_binder.invoke(hostlink::ops::kLocalId);

    hostlink::Status st = r.status;
    hostlink::PeerId id = hostlink::kNoPeer;
    if (r.ok()) st = hostlink::normalizeIdentifier(r.value, id);

    if (st != hostlink::Status::Ok) {
        // Only the first failure is worth a line; callers poll this every tick.
        if (!m_warned) {
            std::cerr << "[Identity] Local id unavailable (" << hostlink::statusName(st) << ", got "
                << hostlink::describe(r.value) << ")\n";
            m_warned = true;
        }
        return hostlink::kNoPeer;
    }

    m_cached = id;
    std::cout << "[Identity] Local id " << id << "\n";
    return m_cached;
}
