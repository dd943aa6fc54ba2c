#include "BindValue.hpp"
#include <charconv>
#include <cstring>

namespace hostlink {

namespace {

    const char* const kIdFieldNames[] = {
        "m_SteamID", "SteamID", "steamID", "m_steamID64", "m_ulSteamIDLobby", "value", "Value"
    };

    const Value& argAt(const Args& args, size_t i) {
        if (i >= args.size()) {
            throw BindingError("missing argument #" + std::to_string(i));
        }
        return args[i];
    }

    bool parseDecimal(const std::string& s, uint64_t& out) {
        size_t b = s.find_first_not_of(" \t\r\n");
        size_t e = s.find_last_not_of(" \t\r\n");
        if (b == std::string::npos) return false;

        const char* first = s.data() + b;
        const char* last = s.data() + e + 1;
        uint64_t v = 0;
        const auto res = std::from_chars(first, last, v, 10);
        if (res.ec != std::errc{} || res.ptr != last) return false;

        out = v;
        return true;
    }

} // namespace

uint64_t argId(const Args& args, size_t i) {
    PeerId id = kNoPeer;
    if (normalizeIdentifier(argAt(args, i), id) != Status::Ok) {
        throw BindingError("argument #" + std::to_string(i) + " is not an identifier");
    }
    return id;
}

int64_t argInt(const Args& args, size_t i) {
    int64_t v = 0;
    if (!asInt(argAt(args, i), v)) {
        throw BindingError("argument #" + std::to_string(i) + " is not an integer");
    }
    return v;
}

bool argFlag(const Args& args, size_t i) {
    bool v = false;
    if (!asFlag(argAt(args, i), v)) {
        throw BindingError("argument #" + std::to_string(i) + " is not a bool");
    }
    return v;
}

const std::string& argText(const Args& args, size_t i) {
    const auto* s = std::get_if<std::string>(&argAt(args, i));
    if (!s) {
        throw BindingError("argument #" + std::to_string(i) + " is not text");
    }
    return *s;
}

bool asFlag(const Value& v, bool& out) {
    if (const auto* b = std::get_if<bool>(&v)) { out = *b; return true; }
    return false;
}

bool asInt(const Value& v, int64_t& out) {
    if (const auto* i = std::get_if<int64_t>(&v)) { out = *i; return true; }
    if (const auto* u = std::get_if<uint64_t>(&v)) {
        if (*u > (uint64_t)INT64_MAX) return false;
        out = (int64_t)*u;
        return true;
    }
    return false;
}

bool asText(const Value& v, std::string& out) {
    if (const auto* s = std::get_if<std::string>(&v)) { out = *s; return true; }
    if (std::holds_alternative<std::monostate>(v)) { out.clear(); return true; }
    return false;
}

Status normalizeIdentifier(const Value& raw, PeerId& out) {
    PeerId id = kNoPeer;

    if (const auto* u = std::get_if<uint64_t>(&raw)) {
        id = *u;
    }
    else if (const auto* i = std::get_if<int64_t>(&raw)) {
        if (*i > 0) id = (PeerId)*i;
    }
    else if (const auto* ident = std::get_if<SteamNetworkingIdentity>(&raw)) {
        id = ident->GetSteamID64(); // 0 unless it carries a SteamID
    }
    else if (const auto* rec = std::get_if<FieldRecord>(&raw)) {
        for (const char* name : kIdFieldNames) {
            bool found = false;
            for (const auto& f : rec->fields) {
                if (f.first == name) { id = f.second; found = true; break; }
            }
            if (found) break;
        }
    }
    else if (const auto* s = std::get_if<std::string>(&raw)) {
        if (s->compare(0, 8, "steamid:") == 0) {
            SteamNetworkingIdentity parsed;
            parsed.Clear();
            if (parsed.ParseString(s->c_str())) id = parsed.GetSteamID64();
        }
        else {
            uint64_t v = 0;
            if (parseDecimal(*s, v)) id = v;
        }
    }

    if (id == kNoPeer) return Status::UnrecognizedIdentifierShape;
    out = id;
    return Status::Ok;
}

std::string describe(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return "<none>";
    if (const auto* b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    if (const auto* i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    if (const auto* u = std::get_if<uint64_t>(&v)) return std::to_string(*u);
    if (const auto* s = std::get_if<std::string>(&v)) return "\"" + *s + "\"";
    if (const auto* ident = std::get_if<SteamNetworkingIdentity>(&v)) {
        char buf[SteamNetworkingIdentity::k_cchMaxString]{};
        ident->ToString(buf, sizeof(buf));
        return std::string(buf);
    }
    const auto& rec = std::get<FieldRecord>(v);
    std::string s = rec.typeName.empty() ? std::string("record") : rec.typeName;
    s += "{";
    for (size_t i = 0; i < rec.fields.size(); ++i) {
        if (i) s += ", ";
        s += rec.fields[i].first + "=" + std::to_string(rec.fields[i].second);
    }
    s += "}";
    return s;
}

} // namespace hostlink
