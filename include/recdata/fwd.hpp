#pragma once

/// @file fwd.hpp
/// @brief Forward declarations, value kinds and key-name rules for recdata.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace recdata {

// ─── Forward declarations ───────────────────────────────────────────────
class Value;
class Record;
class Sequence;
class Opaque;

/// Value kinds. The set is closed: the formatter, equality and search
/// dispatch on this tag.
enum class Kind : uint8_t {
    Null     = 0,
    Bool     = 1,
    Integer  = 2,
    UInteger = 3,
    Float    = 4,
    Text     = 5,
    Bytes    = 6,
    Enum     = 7,
    HexBytes = 8,
    Record   = 9,
    Sequence = 10,
    Opaque   = 11
};

/// @brief Returns the string representation of a kind.
inline const char* kind_name(Kind k) noexcept {
    switch (k) {
        case Kind::Null:     return "null";
        case Kind::Bool:     return "bool";
        case Kind::Integer:  return "integer";
        case Kind::UInteger: return "uinteger";
        case Kind::Float:    return "float";
        case Kind::Text:     return "text";
        case Kind::Bytes:    return "bytes";
        case Kind::Enum:     return "enum";
        case Kind::HexBytes: return "hexbytes";
        case Kind::Record:   return "record";
        case Kind::Sequence: return "sequence";
        case Kind::Opaque:   return "opaque";
    }
    return "unknown";
}

// ─── Payload types ──────────────────────────────────────────────────────

/// Binary blob. Distinct from text: capped at a byte count and rendered
/// with escapes.
using Bytes = std::vector<uint8_t>;

/// @brief Byte-for-byte conversions between text and binary payloads.
inline Bytes to_bytes(std::string_view s) {
    return Bytes(s.begin(), s.end());
}
inline std::string to_text(const Bytes& b) {
    return std::string(b.begin(), b.end());
}

/// @brief Enumerated value as produced by a decoder.
///
/// A present name means the integer is a known member; an absent one means
/// the decoder saw an integer outside the mapping.
struct EnumValue {
    int64_t value = 0;
    std::optional<std::string> name;

    EnumValue() = default;
    explicit EnumValue(int64_t v) : value(v) {}
    EnumValue(int64_t v, std::string n) : value(v), name(std::move(n)) {}

    [[nodiscard]] bool known() const noexcept { return name.has_value(); }

    bool operator==(const EnumValue& o) const {
        return value == o.value && name == o.name;
    }
    bool operator!=(const EnumValue& o) const { return !(*this == o); }
};

/// How a HexBytes value is displayed.
enum class HexStyle : uint8_t {
    Inline = 0,   ///< hex(0a0b0c)
    Dump   = 1    ///< multi-line dump: offset, hex columns, ASCII column
};

/// @brief Binary payload that displays as hex instead of escaped bytes.
struct HexBytes {
    Bytes data;
    HexStyle style = HexStyle::Inline;

    HexBytes() = default;
    explicit HexBytes(Bytes d, HexStyle s = HexStyle::Inline)
        : data(std::move(d)), style(s) {}

    bool operator==(const HexBytes& o) const { return data == o.data; }
    bool operator!=(const HexBytes& o) const { return !(*this == o); }
};

// ─── Key-name rules ─────────────────────────────────────────────────────

/// Names of record operations. Field-style access (Record::attr and the
/// struct-mapping macros) refuses these permanently; they stay reachable
/// through keyed access.
inline constexpr std::string_view kReservedNames[] = {
    "at", "attr", "clear", "contains", "copy", "delete", "empty", "erase",
    "field_names", "find", "fromkeys", "get", "get_or", "is_flags", "items",
    "keys", "mark_flags", "merge", "move_to_end", "pop", "popitem", "repr",
    "restore", "search", "search_all", "set", "set_attr", "setdefault",
    "size", "snapshot", "str", "try_at", "update", "values"
};

/// @brief True if @p name is one of kReservedNames. Usable in static_assert.
constexpr bool is_reserved_name(std::string_view name) noexcept {
    for (auto reserved : kReservedNames) {
        if (reserved == name) return true;
    }
    return false;
}

/// @brief True if @p name is an identifier: [A-Za-z_][A-Za-z0-9_]*.
constexpr bool is_field_name(std::string_view name) noexcept {
    if (name.empty()) return false;
    for (size_t i = 0; i < name.size(); ++i) {
        const char c = name[i];
        const bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
        const bool digit = c >= '0' && c <= '9';
        if (!alpha && !(digit && i > 0)) return false;
    }
    return true;
}

/// @brief Private keys start with '_'. They are skipped by equality and by
/// the default display rendering, never by keyed access or snapshots.
constexpr bool is_private_key(std::string_view key) noexcept {
    return !key.empty() && key.front() == '_';
}

/// Private key that marks a record as decoded from named bit flags.
inline constexpr std::string_view kFlagsKey = "_flagsenum";

} // namespace recdata
