#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>

class CapabilityBinder;

struct SteamBackendConfig {
    std::string libraryPath;                         // empty: search default names
    uint32_t appId{ 0 };                             // 0: ask the client for it
    std::chrono::milliseconds callTimeout{ 1000 };   // async call results (create/join group)
};

// Loads the platform client library at runtime and registers call shapes for
// every logical operation. Several SDK generations are supported side by side;
// the binder picks whichever symbols the loaded library actually exports.
//
// Must outlive any CapabilityBinder it registered shapes on.
class SteamFlatBackend {
public:
    explicit SteamFlatBackend(SteamBackendConfig cfg = {});
    ~SteamFlatBackend();

    SteamFlatBackend(const SteamFlatBackend&) = delete;
    SteamFlatBackend& operator=(const SteamFlatBackend&) = delete;

    // dlopen the client library. Returns false if no candidate could be opened.
    bool load();
    bool isLoaded() const { return m_lib != nullptr; }

    void registerShapes(CapabilityBinder& binder);

    // Runs "platform-init" through the binder.
    bool start(CapabilityBinder& binder);
    void stop();

private:
    enum class Iface { User, Friends, Matchmaking, Utils, Networking, Messages };

    void* symbol(const char* name) const;          // nullptr when missing
    template <class Fn> Fn require(const char* name) const;

    // Shape whose bind step looks up `sym` and the interface pointer.
    template <class Fn, class Make>
    void addFlat(CapabilityBinder& b, const char* op, const char* sym, Iface which, Make make);

    // Resolves the interface pointer through the versioned flat accessors,
    // then through FindOrCreateUserInterface. Throws BindingError.
    void* iface(Iface which);

    uint32_t appId();

    // Waits for an async call result while pumping callbacks.
    bool awaitCall(uint64_t call, int callbackId, void* out, int size);

    void registerIdentity(CapabilityBinder& b);
    void registerPresence(CapabilityBinder& b);
    void registerGroups(CapabilityBinder& b);
    void registerFriends(CapabilityBinder& b);
    void registerTransport(CapabilityBinder& b);
    void registerRuntime(CapabilityBinder& b);

private:
    SteamBackendConfig m_cfg;
    void* m_lib{ nullptr };
    bool m_started{ false };
    std::unordered_map<int, void*> m_ifaces;
};
