#include "SteamFlatBackend.hpp"
#include "CapabilityBinder.hpp"

#include <dlfcn.h>
#include <iostream>
#include <thread>
#include <vector>

#include <steam/steamnetworkingtypes.h>

using hostlink::Args;
using hostlink::BindingError;
using hostlink::Value;
using hostlink::argFlag;
using hostlink::argId;
using hostlink::argInt;
using hostlink::argText;
using hostlink::flagValue;
using hostlink::idValue;
using hostlink::intValue;
using hostlink::textValue;
namespace ops = hostlink::ops;

namespace {

    using Clock = std::chrono::steady_clock;

    // Flat C entry points. Interface methods take the interface pointer first.
    using AccessorFn              = void* (*)();
    using GetHSteamUserFn         = int32_t(*)();
    using FindOrCreateInterfaceFn = void* (*)(int32_t, const char*);
    using BoolFn                  = bool(*)();
    using InitFlatFn              = int(*)(char*);
    using VoidFn                  = void(*)();

    using GetSteamIdFn            = uint64_t(*)(void*);
    using GetAppIdFn              = uint32_t(*)(void*);
    using SetRichPresenceFn       = bool(*)(void*, const char*, const char*);
    using ClearRichPresenceFn     = void(*)(void*);
    using GetFriendCountFn        = int(*)(void*, int);
    using GetFriendByIndexFn      = uint64_t(*)(void*, int, int);
    using GetFriendPersonaNameFn  = const char* (*)(void*, uint64_t);
    using GetFriendPersonaStateFn = int(*)(void*, uint64_t);
    using GetFriendRichPresenceFn = const char* (*)(void*, uint64_t, const char*);
    using CreateLobbyFn           = uint64_t(*)(void*, int, int);
    using JoinLobbyFn             = uint64_t(*)(void*, uint64_t);
    using LeaveLobbyFn            = void(*)(void*, uint64_t);
    using SetLobbyJoinableFn      = bool(*)(void*, uint64_t, bool);
    using SetLobbyDataFn          = bool(*)(void*, uint64_t, const char*, const char*);
    using GetNumLobbyMembersFn    = int(*)(void*, uint64_t);
    using GetLobbyMemberFn        = uint64_t(*)(void*, uint64_t, int);
    using IsApiCallCompletedFn    = bool(*)(void*, uint64_t, bool*);
    using GetApiCallResultFn      = bool(*)(void*, uint64_t, void*, int, int, bool*);
    using SendP2PPacketFn         = bool(*)(void*, uint64_t, const void*, uint32_t, int, int);
    using SendMessageToUserFn     = int(*)(void*, const SteamNetworkingIdentity&, const void*, uint32_t, int, int);

    struct FriendGameInfo {
        uint64_t gameId;
        uint32_t gameIp;
        uint16_t gamePort;
        uint16_t queryPort;
        uint64_t lobbyId;
    };
    using GetFriendGamePlayedFn = bool(*)(void*, uint64_t, FriendGameInfo*);

    // Callback structs use the platform's small packing on Linux/macOS.
#if defined(_WIN32)
#pragma pack(push, 8)
#else
#pragma pack(push, 4)
#endif
    struct LobbyCreatedResult {
        int32_t  result;
        uint64_t lobbyId;
    };

    struct LobbyEnterResult {
        uint64_t lobbyId;
        uint32_t chatPermissions;
        bool     locked;
        uint32_t enterResponse;
    };
#pragma pack(pop)

    static constexpr int kLobbyEnterCallback   = 504;
    static constexpr int kLobbyCreatedCallback = 513;

    static constexpr int32_t kResultOK          = 1;
    static constexpr uint32_t kEnterSuccess     = 1;
    static constexpr int kFriendFlagImmediate   = 0x04;
    static constexpr int kP2PSendReliable       = 2;

    const char* safeText(const char* s) { return s ? s : ""; }

    struct IfaceDesc {
        std::vector<const char*> accessors; // SteamAPI_SteamXxx_vNNN
        std::vector<const char*> versions;  // for FindOrCreateUserInterface
        bool userScoped;
    };

    const IfaceDesc& ifaceDesc(int which) {
        static const IfaceDesc descs[] = {
            // User
            { { "SteamAPI_SteamUser_v023", "SteamAPI_SteamUser_v022", "SteamAPI_SteamUser_v021" },
              { "SteamUser023", "SteamUser022", "SteamUser021", "SteamUser020" }, true },
            // Friends
            { { "SteamAPI_SteamFriends_v017" },
              { "SteamFriends017", "SteamFriends015" }, true },
            // Matchmaking
            { { "SteamAPI_SteamMatchmaking_v009" },
              { "SteamMatchMaking009" }, true },
            // Utils
            { { "SteamAPI_SteamUtils_v010", "SteamAPI_SteamUtils_v009" },
              { "SteamUtils010", "SteamUtils009" }, false },
            // Networking
            { { "SteamAPI_SteamNetworking_v006" },
              { "SteamNetworking006", "SteamNetworking005" }, true },
            // Messages
            { { "SteamAPI_SteamNetworkingMessages_SteamAPI_v002" },
              { "SteamNetworkingMessages002" }, true },
        };
        return descs[which];
    }

    const char* ifaceName(int which) {
        static const char* names[] = { "ISteamUser", "ISteamFriends", "ISteamMatchmaking",
            "ISteamUtils", "ISteamNetworking", "ISteamNetworkingMessages" };
        return names[which];
    }

} // namespace

SteamFlatBackend::SteamFlatBackend(SteamBackendConfig cfg)
    : m_cfg(std::move(cfg)) {
}

SteamFlatBackend::~SteamFlatBackend() {
    stop();
    if (m_lib) {
        dlclose(m_lib);
        m_lib = nullptr;
    }
}

bool SteamFlatBackend::load() {
    if (m_lib) return true;

    std::vector<std::string> candidates;
    if (!m_cfg.libraryPath.empty()) candidates.push_back(m_cfg.libraryPath);
    candidates.push_back("libsteam_api.so");
    candidates.push_back("./libsteam_api.so");

    for (const auto& path : candidates) {
        m_lib = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
        if (m_lib) {
            std::cout << "[Steam] Loaded " << path << "\n";
            return true;
        }
        const char* err = dlerror();
        std::cout << "[Steam] dlopen " << path << ": " << safeText(err) << "\n";
    }

    std::cerr << "[Steam] No platform client library found\n";
    return false;
}

void* SteamFlatBackend::symbol(const char* name) const {
    if (!m_lib) return nullptr;
    return dlsym(m_lib, name);
}

template <class Fn>
Fn SteamFlatBackend::require(const char* name) const {
    void* p = symbol(name);
    if (!p) throw BindingError(std::string("symbol ") + name + " not exported");
    return reinterpret_cast<Fn>(p);
}

void* SteamFlatBackend::iface(Iface which) {
    const int key = (int)which;
    auto it = m_ifaces.find(key);
    if (it != m_ifaces.end()) return it->second;

    const IfaceDesc& desc = ifaceDesc(key);
    void* p = nullptr;

    for (const char* acc : desc.accessors) {
        if (auto fn = reinterpret_cast<AccessorFn>(symbol(acc))) {
            p = fn();
            if (p) break;
        }
    }

    if (!p) {
        auto findOrCreate = reinterpret_cast<FindOrCreateInterfaceFn>(symbol("SteamInternal_FindOrCreateUserInterface"));
        auto getUser = reinterpret_cast<GetHSteamUserFn>(symbol("SteamAPI_GetHSteamUser"));
        if (findOrCreate && (getUser || !desc.userScoped)) {
            const int32_t user = desc.userScoped ? getUser() : 0;
            for (const char* ver : desc.versions) {
                p = findOrCreate(user, ver);
                if (p) break;
            }
        }
    }

    if (!p) throw BindingError(std::string(ifaceName(key)) + " unavailable");

    m_ifaces[key] = p;
    return p;
}

uint32_t SteamFlatBackend::appId() {
    if (m_cfg.appId != 0) return m_cfg.appId;
    auto fn = require<GetAppIdFn>("SteamAPI_ISteamUtils_GetAppID");
    m_cfg.appId = fn(iface(Iface::Utils));
    return m_cfg.appId;
}

bool SteamFlatBackend::awaitCall(uint64_t call, int callbackId, void* out, int size) {
    if (call == 0) return false; // k_uAPICallInvalid

    void* utils = iface(Iface::Utils);
    auto isDone = require<IsApiCallCompletedFn>("SteamAPI_ISteamUtils_IsAPICallCompleted");
    auto getResult = require<GetApiCallResultFn>("SteamAPI_ISteamUtils_GetAPICallResult");
    auto pump = reinterpret_cast<VoidFn>(symbol("SteamAPI_RunCallbacks"));

    const auto deadline = Clock::now() + m_cfg.callTimeout;
    for (;;) {
        bool failed = false;
        if (isDone(utils, call, &failed)) {
            if (failed) return false;
            return getResult(utils, call, out, size, callbackId, &failed) && !failed;
        }
        if (Clock::now() >= deadline) {
            std::cerr << "[Steam] Call " << call << " (callback " << callbackId << ") timed out\n";
            return false;
        }
        if (pump) pump();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

template <class Fn, class Make>
void SteamFlatBackend::addFlat(CapabilityBinder& b, const char* op, const char* sym, Iface which, Make make) {
    b.addShape(op, sym, [this, sym, which, make]() -> CapabilityBinder::Invoker {
        Fn fn = require<Fn>(sym);
        void* self = iface(which);
        return make(fn, self);
    });
}

void SteamFlatBackend::registerShapes(CapabilityBinder& b) {
    registerRuntime(b);
    registerIdentity(b);
    registerPresence(b);
    registerGroups(b);
    registerFriends(b);
    registerTransport(b);
}

void SteamFlatBackend::registerRuntime(CapabilityBinder& b) {
    // Newest first. InitFlat reports a reason string.
    b.addShape(ops::kPlatformInit, "SteamAPI_InitFlat", [this]() -> CapabilityBinder::Invoker {
        auto fn = require<InitFlatFn>("SteamAPI_InitFlat");
        return [fn](const Args&) -> Value {
            char err[1024]{};
            const int rc = fn(err);
            if (rc != 0) std::cerr << "[Steam] Init failed (" << rc << "): " << err << "\n";
            return flagValue(rc == 0);
        };
    });
    for (const char* name : { "SteamAPI_InitSafe", "SteamAPI_Init" }) {
        b.addShape(ops::kPlatformInit, name, [this, name]() -> CapabilityBinder::Invoker {
            auto fn = require<BoolFn>(name);
            return [fn](const Args&) -> Value { return flagValue(fn()); };
        });
    }

    b.addShape(ops::kRunCallbacks, "SteamAPI_RunCallbacks", [this]() -> CapabilityBinder::Invoker {
        auto fn = require<VoidFn>("SteamAPI_RunCallbacks");
        return [fn](const Args&) -> Value { fn(); return Value{}; };
    });
}

void SteamFlatBackend::registerIdentity(CapabilityBinder& b) {
    addFlat<GetSteamIdFn>(b, ops::kLocalId, "SteamAPI_ISteamUser_GetSteamID", Iface::User,
        [](GetSteamIdFn fn, void* self) -> CapabilityBinder::Invoker {
            return [fn, self](const Args&) -> Value { return idValue(fn(self)); };
        });
}

void SteamFlatBackend::registerPresence(CapabilityBinder& b) {
    addFlat<SetRichPresenceFn>(b, ops::kSetPresence, "SteamAPI_ISteamFriends_SetRichPresence", Iface::Friends,
        [](SetRichPresenceFn fn, void* self) -> CapabilityBinder::Invoker {
            return [fn, self](const Args& a) -> Value {
                return flagValue(fn(self, argText(a, 0).c_str(), argText(a, 1).c_str()));
            };
        });

    addFlat<ClearRichPresenceFn>(b, ops::kClearPresence, "SteamAPI_ISteamFriends_ClearRichPresence", Iface::Friends,
        [](ClearRichPresenceFn fn, void* self) -> CapabilityBinder::Invoker {
            return [fn, self](const Args&) -> Value { fn(self); return Value{}; };
        });
}

void SteamFlatBackend::registerGroups(CapabilityBinder& b) {
    // Create: waits for LobbyCreated_t and hands back the record as the client reports it.
    addFlat<CreateLobbyFn>(b, ops::kCreateGroup, "SteamAPI_ISteamMatchmaking_CreateLobby", Iface::Matchmaking,
        [this](CreateLobbyFn fn, void* self) -> CapabilityBinder::Invoker {
            iface(Iface::Utils);
            return [this, fn, self](const Args& a) -> Value {
                const uint64_t call = fn(self, (int)argInt(a, 0), (int)argInt(a, 1));
                LobbyCreatedResult res{};
                if (!awaitCall(call, kLobbyCreatedCallback, &res, (int)sizeof(res))) return Value{};
                if (res.result != kResultOK) {
                    std::cerr << "[Steam] CreateLobby result " << res.result << "\n";
                    return Value{};
                }
                hostlink::FieldRecord rec;
                rec.typeName = "LobbyCreated_t";
                rec.fields.push_back({ "m_ulSteamIDLobby", res.lobbyId });
                return Value{ std::in_place_type<hostlink::FieldRecord>, std::move(rec) };
            };
        });

    // Join: full round trip when ISteamUtils is around, request-only otherwise.
    addFlat<JoinLobbyFn>(b, ops::kJoinGroup, "SteamAPI_ISteamMatchmaking_JoinLobby", Iface::Matchmaking,
        [this](JoinLobbyFn fn, void* self) -> CapabilityBinder::Invoker {
            iface(Iface::Utils);
            return [this, fn, self](const Args& a) -> Value {
                const uint64_t call = fn(self, argId(a, 0));
                LobbyEnterResult res{};
                if (!awaitCall(call, kLobbyEnterCallback, &res, (int)sizeof(res))) return flagValue(false);
                return flagValue(res.enterResponse == kEnterSuccess);
            };
        });
    b.addShape(ops::kJoinGroup, "SteamAPI_ISteamMatchmaking_JoinLobby (request only)",
        [this]() -> CapabilityBinder::Invoker {
            auto fn = require<JoinLobbyFn>("SteamAPI_ISteamMatchmaking_JoinLobby");
            void* self = iface(Iface::Matchmaking);
            return [fn, self](const Args& a) -> Value { return flagValue(fn(self, argId(a, 0)) != 0); };
        });

    addFlat<LeaveLobbyFn>(b, ops::kLeaveGroup, "SteamAPI_ISteamMatchmaking_LeaveLobby", Iface::Matchmaking,
        [](LeaveLobbyFn fn, void* self) -> CapabilityBinder::Invoker {
            return [fn, self](const Args& a) -> Value { fn(self, argId(a, 0)); return Value{}; };
        });

    addFlat<SetLobbyJoinableFn>(b, ops::kSetGroupJoinable, "SteamAPI_ISteamMatchmaking_SetLobbyJoinable", Iface::Matchmaking,
        [](SetLobbyJoinableFn fn, void* self) -> CapabilityBinder::Invoker {
            return [fn, self](const Args& a) -> Value { return flagValue(fn(self, argId(a, 0), argFlag(a, 1))); };
        });

    addFlat<SetLobbyDataFn>(b, ops::kSetGroupData, "SteamAPI_ISteamMatchmaking_SetLobbyData", Iface::Matchmaking,
        [](SetLobbyDataFn fn, void* self) -> CapabilityBinder::Invoker {
            return [fn, self](const Args& a) -> Value {
                return flagValue(fn(self, argId(a, 0), argText(a, 1).c_str(), argText(a, 2).c_str()));
            };
        });

    addFlat<GetNumLobbyMembersFn>(b, ops::kGroupMemberCount, "SteamAPI_ISteamMatchmaking_GetNumLobbyMembers", Iface::Matchmaking,
        [](GetNumLobbyMembersFn fn, void* self) -> CapabilityBinder::Invoker {
            return [fn, self](const Args& a) -> Value { return intValue(fn(self, argId(a, 0))); };
        });

    addFlat<GetLobbyMemberFn>(b, ops::kGroupMemberAt, "SteamAPI_ISteamMatchmaking_GetLobbyMemberByIndex", Iface::Matchmaking,
        [](GetLobbyMemberFn fn, void* self) -> CapabilityBinder::Invoker {
            return [fn, self](const Args& a) -> Value { return idValue(fn(self, argId(a, 0), (int)argInt(a, 1))); };
        });
}

void SteamFlatBackend::registerFriends(CapabilityBinder& b) {
    addFlat<GetFriendCountFn>(b, ops::kFriendCount, "SteamAPI_ISteamFriends_GetFriendCount", Iface::Friends,
        [](GetFriendCountFn fn, void* self) -> CapabilityBinder::Invoker {
            return [fn, self](const Args&) -> Value { return intValue(fn(self, kFriendFlagImmediate)); };
        });

    addFlat<GetFriendByIndexFn>(b, ops::kFriendAt, "SteamAPI_ISteamFriends_GetFriendByIndex", Iface::Friends,
        [](GetFriendByIndexFn fn, void* self) -> CapabilityBinder::Invoker {
            return [fn, self](const Args& a) -> Value {
                return idValue(fn(self, (int)argInt(a, 0), kFriendFlagImmediate));
            };
        });

    addFlat<GetFriendPersonaNameFn>(b, ops::kFriendName, "SteamAPI_ISteamFriends_GetFriendPersonaName", Iface::Friends,
        [](GetFriendPersonaNameFn fn, void* self) -> CapabilityBinder::Invoker {
            return [fn, self](const Args& a) -> Value { return textValue(safeText(fn(self, argId(a, 0)))); };
        });

    // EPersonaState: 0 is offline
    addFlat<GetFriendPersonaStateFn>(b, ops::kFriendOnline, "SteamAPI_ISteamFriends_GetFriendPersonaState", Iface::Friends,
        [](GetFriendPersonaStateFn fn, void* self) -> CapabilityBinder::Invoker {
            return [fn, self](const Args& a) -> Value { return flagValue(fn(self, argId(a, 0)) != 0); };
        });

    addFlat<GetFriendGamePlayedFn>(b, ops::kFriendInGame, "SteamAPI_ISteamFriends_GetFriendGamePlayed", Iface::Friends,
        [this](GetFriendGamePlayedFn fn, void* self) -> CapabilityBinder::Invoker {
            const uint32_t app = appId();
            if (app == 0) throw BindingError("own app id unknown");
            return [fn, self, app](const Args& a) -> Value {
                FriendGameInfo info{};
                if (!fn(self, argId(a, 0), &info)) return flagValue(false);
                return flagValue((uint32_t)(info.gameId & 0xFFFFFFu) == app);
            };
        });
    // Rich presence is only visible between players of the same app.
    addFlat<GetFriendRichPresenceFn>(b, ops::kFriendInGame, "SteamAPI_ISteamFriends_GetFriendRichPresence(status)", Iface::Friends,
        [](GetFriendRichPresenceFn fn, void* self) -> CapabilityBinder::Invoker {
            return [fn, self](const Args& a) -> Value {
                return flagValue(*safeText(fn(self, argId(a, 0), hostlink::presence::kStatus)) != '\0');
            };
        });

    addFlat<GetFriendRichPresenceFn>(b, ops::kFriendPresence, "SteamAPI_ISteamFriends_GetFriendRichPresence", Iface::Friends,
        [](GetFriendRichPresenceFn fn, void* self) -> CapabilityBinder::Invoker {
            return [fn, self](const Args& a) -> Value {
                return textValue(safeText(fn(self, argId(a, 0), argText(a, 1).c_str())));
            };
        });
}

void SteamFlatBackend::registerTransport(CapabilityBinder& b) {
    addFlat<SendMessageToUserFn>(b, ops::kSendData, "SteamAPI_ISteamNetworkingMessages_SendMessageToUser", Iface::Messages,
        [](SendMessageToUserFn fn, void* self) -> CapabilityBinder::Invoker {
            return [fn, self](const Args& a) -> Value {
                SteamNetworkingIdentity remote;
                remote.Clear();
                remote.SetSteamID64(argId(a, 0));
                const std::string& bytes = argText(a, 1);
                const int rc = fn(self, remote, bytes.data(), (uint32_t)bytes.size(),
                    k_nSteamNetworkingSend_Reliable, (int)argInt(a, 2));
                return flagValue(rc == kResultOK);
            };
        });

    addFlat<SendP2PPacketFn>(b, ops::kSendData, "SteamAPI_ISteamNetworking_SendP2PPacket", Iface::Networking,
        [](SendP2PPacketFn fn, void* self) -> CapabilityBinder::Invoker {
            return [fn, self](const Args& a) -> Value {
                const std::string& bytes = argText(a, 1);
                return flagValue(fn(self, argId(a, 0), bytes.data(), (uint32_t)bytes.size(),
                    kP2PSendReliable, (int)argInt(a, 2)));
            };
        });
}

bool SteamFlatBackend::start(CapabilityBinder& binder) {
    if (m_started) return true;

    const auto r = binder.invoke(ops::kPlatformInit);
    bool ok = false;
    if (!r.ok() || !hostlink::asFlag(r.value, ok) || !ok) {
        std::cerr << "[Steam] Platform init failed (" << hostlink::statusName(r.status) << ")\n";
        return false;
    }

    m_started = true;
    std::cout << "[Steam] Platform client initialized (" << binder.workingShapeLabel(ops::kPlatformInit) << ")\n";
    return true;
}

void SteamFlatBackend::stop() {
    if (!m_started) return;
    m_started = false;
    m_ifaces.clear();

    if (auto fn = reinterpret_cast<VoidFn>(symbol("SteamAPI_Shutdown"))) fn();
}
