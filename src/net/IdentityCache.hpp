#pragma once
#include "BindValue.hpp"

class CapabilityBinder;

// Local participant id, looked up through the binder once and then memoized.
// Returns hostlink::kNoPeer while the platform cannot tell us who we are.
class IdentityCache {
public:
    explicit IdentityCache(CapabilityBinder& binder) : m_binder(binder) {}

    hostlink::PeerId localId();
    bool isKnown() const { return m_cached != hostlink::kNoPeer; }

private:
    CapabilityBinder& m_binder;
    hostlink::PeerId m_cached{ hostlink::kNoPeer };
    bool m_warned{ false };
};
