#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <utility>
#include <variant>
#include <stdexcept>

#include <steam/steamnetworkingtypes.h>

#include "PlatformOps.hpp"

namespace hostlink {

    using PeerId = uint64_t;
    static constexpr PeerId kNoPeer = 0;

    // A native struct surfaced by name/value pairs, e.g. a CSteamID-like wrapper
    // whose 64-bit payload lives under one of several field names.
    struct FieldRecord {
        std::string typeName;
        std::vector<std::pair<std::string, uint64_t>> fields;
    };

    // Everything a call shape can take or return.
    using Value = std::variant<
        std::monostate,
        bool,
        int64_t,
        uint64_t,
        std::string,
        SteamNetworkingIdentity,
        FieldRecord>;

    using Args = std::vector<Value>;

    // Thrown by a call shape when it cannot be bound or driven with the
    // arguments it was given. The binder converts it into a Status.
    class BindingError : public std::runtime_error {
    public:
        explicit BindingError(const std::string& what) : std::runtime_error(what) {}
    };

    struct CallResult {
        Status status{ Status::Ok };
        Value  value{};

        bool ok() const { return status == Status::Ok; }
    };

    inline Value idValue(uint64_t v) { return Value{ std::in_place_type<uint64_t>, v }; }
    inline Value intValue(int64_t v) { return Value{ std::in_place_type<int64_t>, v }; }
    inline Value flagValue(bool v) { return Value{ std::in_place_type<bool>, v }; }
    inline Value textValue(std::string v) { return Value{ std::in_place_type<std::string>, std::move(v) }; }

    // Argument accessors for call shapes. Throw BindingError on a type mismatch.
    uint64_t argId(const Args& args, size_t i);
    int64_t argInt(const Args& args, size_t i);
    bool argFlag(const Args& args, size_t i);
    const std::string& argText(const Args& args, size_t i);

    // Result decoders for callers. Return false when the value has another shape.
    bool asFlag(const Value& v, bool& out);
    bool asInt(const Value& v, int64_t& out);
    bool asText(const Value& v, std::string& out);

    // Canonicalizes any identifier representation the platform hands back.
    // Zero is never a valid identifier.
    Status normalizeIdentifier(const Value& raw, PeerId& out);

    // Human readable dump used in log lines.
    std::string describe(const Value& v);

} // namespace hostlink
