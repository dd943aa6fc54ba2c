#pragma once
#include <cstdint>

namespace hostlink {

    // Logical platform operations. Each name maps to one CapabilityBinder entry.
    namespace ops {
        static constexpr const char* kLocalId          = "local-id";
        static constexpr const char* kSendData         = "send-data";
        static constexpr const char* kSetPresence      = "set-presence";      // (key, value) -> bool
        static constexpr const char* kClearPresence    = "clear-presence";
        static constexpr const char* kCreateGroup      = "create-group";      // (visibility, maxMembers) -> group id
        static constexpr const char* kJoinGroup        = "join-group";        // (groupId) -> bool
        static constexpr const char* kLeaveGroup       = "leave-group";       // (groupId)
        static constexpr const char* kSetGroupJoinable = "set-group-joinable"; // (groupId, bool) -> bool
        static constexpr const char* kSetGroupData     = "set-group-data";    // (groupId, key, value) -> bool
        static constexpr const char* kGroupMemberCount = "group-member-count"; // (groupId) -> int
        static constexpr const char* kGroupMemberAt    = "group-member-at";   // (groupId, index) -> id
        static constexpr const char* kFriendCount      = "friend-count";      // () -> int
        static constexpr const char* kFriendAt         = "friend-at";         // (index) -> id
        static constexpr const char* kFriendName       = "friend-name";       // (id) -> string
        static constexpr const char* kFriendOnline     = "friend-online";     // (id) -> bool
        static constexpr const char* kFriendInGame     = "friend-in-game";    // (id) -> bool
        static constexpr const char* kFriendPresence   = "friend-presence";   // (id, key) -> string
        static constexpr const char* kRunCallbacks     = "run-callbacks";
        static constexpr const char* kPlatformInit     = "platform-init";
    }

    // Presence attribute keys and values.
    namespace presence {
        static constexpr const char* kStatus        = "status";
        static constexpr const char* kDisplay       = "steam_display";
        static constexpr const char* kConnect       = "connect";
        static constexpr const char* kHostMarker    = "hostlink_status";
        static constexpr const char* kVersionMarker = "hostlink_version";

        static constexpr const char* kHostingValue  = "hosting";
        static constexpr const char* kInGame        = "In Game";
        static constexpr const char* kInGameToken   = "#Status_InGame";
        static constexpr const char* kJoining       = "Joining Game";
        static constexpr const char* kJoiningToken  = "#Status_JoiningGame";
    }

    // Session-group metadata keys written by the host.
    namespace groupdata {
        static constexpr const char* kHostId  = "host_id";
        static constexpr const char* kVersion = "version";
    }

    // Platform group visibility (matches the platform's lobby type numbering).
    enum class GroupVisibility : int32_t {
        Private = 0,
        FriendsOnly = 1,
        Public = 2,
        Invisible = 3,
    };

    enum class Status : uint8_t {
        Ok = 0,
        BindingUnresolved,            // no candidate shape could be bound
        BindingFailed,                // every shape failed at invocation time
        UnrecognizedIdentifierShape,  // returned value is not an identifier
        OperationFailed,              // platform executed the call and said no
        NotReady,                     // required prior state is missing
    };

    inline const char* statusName(Status s) {
        switch (s) {
        case Status::Ok: return "Ok";
        case Status::BindingUnresolved: return "BindingUnresolved";
        case Status::BindingFailed: return "BindingFailed";
        case Status::UnrecognizedIdentifierShape: return "UnrecognizedIdentifierShape";
        case Status::OperationFailed: return "OperationFailed";
        case Status::NotReady: return "NotReady";
        }
        return "Unknown";
    }

} // namespace hostlink
