#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include "PlatformOps.hpp"

struct HostLinkConfig {
    // Discovery
    std::chrono::milliseconds scanInterval{ 3000 };   // floor between friend sweeps
    std::chrono::seconds hostTTL{ 30 };                // registry staleness limit

    // Session group
    hostlink::GroupVisibility groupVisibility{ hostlink::GroupVisibility::Public };
    int32_t maxMembers{ 50 };
    std::chrono::seconds groupRetryInterval{ 5 };      // re-create a missing group while hosting

    // Presence
    std::string version{ "1.0" };                      // published as the version marker
    std::string sessionNameSuffix{ "'s session" };     // "<friend name>'s session"
    std::string selfSessionName{ "My Session" };
};
