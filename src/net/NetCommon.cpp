#include "NetCommon.hpp"
#include "CapabilityBinder.hpp"
#include <iostream>

void NetRuntime::s_debugOutput(ESteamNetworkingSocketsDebugOutputType type, const char* msg) {
    // msg already includes newline usually
    if (type <= k_ESteamNetworkingSocketsDebugOutputType_Error) std::cerr << "[GNS] " << msg;
    else std::cout << "[GNS] " << msg;
}

bool NetRuntime::init(const NetRuntimeConfig& cfg) {
    if (m_iface) return true;

    SteamDatagramErrMsg errMsg{};
    if (!GameNetworkingSockets_Init(nullptr, errMsg)) {
        std::cerr << "[Net] GameNetworkingSockets_Init failed: " << errMsg << "\n";
        return false;
    }

    m_iface = SteamNetworkingSockets();
    if (!m_iface) {
        std::cerr << "[Net] SteamNetworkingSockets() returned null\n";
        GameNetworkingSockets_Kill();
        return false;
    }

    SteamNetworkingUtils()->SetDebugOutputFunction(cfg.debugLevel, &NetRuntime::s_debugOutput);
    std::cout << "[Net] GameNetworkingSockets up\n";
    return true;
}

void NetRuntime::shutdown() {
    if (!m_iface) return;
    m_iface = nullptr;
    GameNetworkingSockets_Kill();
}

void NetRuntime::pumpCallbacks() {
    if (m_iface) m_iface->RunCallbacks();
}

bool NetRuntime::localIdentity(SteamNetworkingIdentity& out) const {
    if (!m_iface) return false;
    out.Clear();
    return m_iface->GetIdentity(&out);
}

void NetRuntime::registerShapes(CapabilityBinder& binder) {
    binder.addShape(hostlink::ops::kLocalId, "gns:ISteamNetworkingSockets::GetIdentity",
        [this]() -> CapabilityBinder::Invoker {
            if (!m_iface) throw hostlink::BindingError("networking runtime not initialized");
            return [this](const hostlink::Args&) -> hostlink::Value {
                SteamNetworkingIdentity ident;
                if (!localIdentity(ident)) return hostlink::Value{};
                return hostlink::Value{ std::in_place_type<SteamNetworkingIdentity>, ident };
            };
        });
}
