#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "BindValue.hpp"

namespace hostlink {

    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    inline NowFn steadyNow() {
        return [] { return Clock::now(); };
    }

    struct HostInfo {
        PeerId      peerId{ kNoPeer };
        std::string sessionName;
        int         playerCount{ 1 };
        Clock::time_point lastSeen{};
        bool        isActive{ false };
        std::string connectToken; // presence "connect" value seen for this host, if any
    };

    // Last platform invite. A new invite replaces the old one.
    struct InviteRecord {
        PeerId      inviterId{ kNoPeer };
        std::string lobbyToken;
    };

    enum class SessionPhase : uint8_t {
        Idle = 0,
        Hosting = 1,
        Joining = 2,
        Active = 3,
    };

    inline const char* phaseName(SessionPhase p) {
        switch (p) {
        case SessionPhase::Idle: return "Idle";
        case SessionPhase::Hosting: return "Hosting";
        case SessionPhase::Joining: return "Joining";
        case SessionPhase::Active: return "Active";
        }
        return "?";
    }

    struct SessionState {
        SessionPhase phase{ SessionPhase::Idle };
        PeerId       selfHostId{ kNoPeer };   // valid while Hosting
        std::string  lobbyToken;              // set once a group exists
        PeerId       groupId{ kNoPeer };      // numeric form of lobbyToken
        bool         isGroupOwner{ false };
    };

} // namespace hostlink
