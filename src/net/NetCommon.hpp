#pragma once
#include <string>

#include <steam/steamnetworkingsockets.h>
#include <steam/isteamnetworkingsockets.h>
#include <steam/steamnetworkingtypes.h>
#include <steam/isteamnetworkingutils.h>
#include <steam/steam_api_common.h>

class CapabilityBinder;

struct NetRuntimeConfig {
    ESteamNetworkingSocketsDebugOutputType debugLevel = k_ESteamNetworkingSocketsDebugOutputType_Warning;
};

// GameNetworkingSockets bootstrap. Also offers the local identity as a
// fallback shape for the "local-id" operation.
class NetRuntime {
public:
    ~NetRuntime() { shutdown(); }

    bool init(const NetRuntimeConfig& cfg = {});
    void shutdown();

    bool isUp() const { return m_iface != nullptr; }
    ISteamNetworkingSockets* iface() const { return m_iface; }

    // Call once per frame/tick.
    void pumpCallbacks();

    bool localIdentity(SteamNetworkingIdentity& out) const;

    // Registers after the platform backend so it is only used when the
    // platform's own user id call is missing.
    void registerShapes(CapabilityBinder& binder);

private:
    static void s_debugOutput(ESteamNetworkingSocketsDebugOutputType type, const char* msg);

private:
    ISteamNetworkingSockets* m_iface{ nullptr };
};
