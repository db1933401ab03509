#pragma once

/// @file value.hpp
/// @brief Library core: Value, the element type of records and sequences.
///
/// Implementation:
///   - Tagged union over a closed set of kinds (see Kind in fwd.hpp); the
///     variant alternative index is the Kind value
///   - Scalars, text and binary payloads are held by value
///   - Records, sequences and opaque values are held by shared reference:
///     copying a Value shares the nested container, so a record can hold
///     itself and Record::copy() stays shallow
///   - Methods that need Record/Sequence to be complete are defined in
///     record.hpp, sequence.hpp and formatter.hpp; include recdata.hpp

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "opaque.hpp"

#include <cstring>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace recdata {

struct PrintOptions;

class Value {
public:
    using storage_type = std::variant<
        std::monostate,              // Kind::Null
        bool,                        // Kind::Bool
        int64_t,                     // Kind::Integer
        uint64_t,                    // Kind::UInteger
        double,                      // Kind::Float
        std::string,                 // Kind::Text
        Bytes,                       // Kind::Bytes
        EnumValue,                   // Kind::Enum
        HexBytes,                    // Kind::HexBytes
        std::shared_ptr<Record>,     // Kind::Record
        std::shared_ptr<Sequence>,   // Kind::Sequence
        std::shared_ptr<Opaque>>;    // Kind::Opaque

    Value() noexcept = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool v) noexcept : data_(v) {}
    Value(int v) noexcept : data_(static_cast<int64_t>(v)) {}
    Value(int64_t v) noexcept : data_(v) {}
    Value(unsigned v) noexcept : data_(static_cast<int64_t>(v)) {}
    Value(uint64_t v) noexcept : data_(v) {}
    Value(double v) noexcept : data_(v) {}
    Value(const char* v) {
        if (RECDATA_UNLIKELY(!v)) return;
        data_ = std::string(v);
    }
    Value(std::string_view v) : data_(std::string(v)) {}
    Value(const std::string& v) : data_(v) {}
    Value(std::string&& v) : data_(std::move(v)) {}
    Value(Bytes v) : data_(std::move(v)) {}
    Value(EnumValue v) : data_(std::move(v)) {}
    Value(HexBytes v) : data_(std::move(v)) {}

    /// Wrap a copy of the container in a new shared holder (record.hpp /
    /// sequence.hpp).
    Value(const Record& v);
    Value(Record&& v);
    Value(const Sequence& v);
    Value(Sequence&& v);

    /// Share an existing container. A record may hold itself this way.
    Value(std::shared_ptr<Record> v) noexcept
        : data_(std::in_place_type<std::shared_ptr<Record>>, std::move(v)) {
        if (!std::get<std::shared_ptr<Record>>(data_)) data_ = std::monostate{};
    }
    Value(std::shared_ptr<Sequence> v) noexcept
        : data_(std::in_place_type<std::shared_ptr<Sequence>>, std::move(v)) {
        if (!std::get<std::shared_ptr<Sequence>>(data_)) data_ = std::monostate{};
    }
    template <typename T,
              typename = std::enable_if_t<std::is_convertible_v<T*, Opaque*>>>
    Value(std::shared_ptr<T> v) noexcept {
        if (v) data_.emplace<std::shared_ptr<Opaque>>(std::move(v));
    }

    [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(data_.index()); }
    [[nodiscard]] bool is_null()     const noexcept { return kind() == Kind::Null; }
    [[nodiscard]] bool is_bool()     const noexcept { return kind() == Kind::Bool; }
    [[nodiscard]] bool is_integer()  const noexcept { return kind() == Kind::Integer; }
    [[nodiscard]] bool is_uinteger() const noexcept { return kind() == Kind::UInteger; }
    [[nodiscard]] bool is_float()    const noexcept { return kind() == Kind::Float; }
    [[nodiscard]] bool is_text()     const noexcept { return kind() == Kind::Text; }
    [[nodiscard]] bool is_bytes()    const noexcept { return kind() == Kind::Bytes; }
    [[nodiscard]] bool is_enum()     const noexcept { return kind() == Kind::Enum; }
    [[nodiscard]] bool is_hex()      const noexcept { return kind() == Kind::HexBytes; }
    [[nodiscard]] bool is_record()   const noexcept { return kind() == Kind::Record; }
    [[nodiscard]] bool is_sequence() const noexcept { return kind() == Kind::Sequence; }
    [[nodiscard]] bool is_opaque()   const noexcept { return kind() == Kind::Opaque; }
    [[nodiscard]] bool is_number()   const noexcept { return is_integer() || is_uinteger() || is_float(); }
    [[nodiscard]] bool is_container() const noexcept { return is_record() || is_sequence(); }

    /// Text, binary and hex values: the kinds that render with a length cap.
    [[nodiscard]] bool is_string_like() const noexcept {
        return is_text() || is_bytes() || is_hex();
    }

    bool as_bool() const {
        if (RECDATA_UNLIKELY(!is_bool())) throw mismatch("bool");
        return std::get<bool>(data_);
    }
    int64_t as_integer() const {
        if (is_integer()) return std::get<int64_t>(data_);
        if (is_uinteger() && std::get<uint64_t>(data_) <= static_cast<uint64_t>(INT64_MAX))
            return static_cast<int64_t>(std::get<uint64_t>(data_));
        if (is_enum()) return std::get<EnumValue>(data_).value;
        throw mismatch("integer");
    }
    uint64_t as_uinteger() const {
        if (is_uinteger()) return std::get<uint64_t>(data_);
        if (is_integer() && std::get<int64_t>(data_) >= 0)
            return static_cast<uint64_t>(std::get<int64_t>(data_));
        throw mismatch("uinteger");
    }
    double as_float() const {
        if (is_float()) return std::get<double>(data_);
        if (is_integer()) return static_cast<double>(std::get<int64_t>(data_));
        if (is_uinteger()) return static_cast<double>(std::get<uint64_t>(data_));
        throw mismatch("number");
    }

    [[nodiscard]] const std::string& as_text() const {
        if (RECDATA_UNLIKELY(!is_text())) throw mismatch("text");
        return std::get<std::string>(data_);
    }
    [[nodiscard]] std::string_view as_text_view() const { return as_text(); }

    /// Binary payload of a Bytes or HexBytes value.
    [[nodiscard]] const Bytes& as_bytes() const {
        if (is_hex()) return std::get<HexBytes>(data_).data;
        if (RECDATA_UNLIKELY(!is_bytes())) throw mismatch("bytes");
        return std::get<Bytes>(data_);
    }
    [[nodiscard]] const EnumValue& as_enum() const {
        if (RECDATA_UNLIKELY(!is_enum())) throw mismatch("enum");
        return std::get<EnumValue>(data_);
    }
    [[nodiscard]] const HexBytes& as_hex() const {
        if (RECDATA_UNLIKELY(!is_hex())) throw mismatch("hexbytes");
        return std::get<HexBytes>(data_);
    }

    [[nodiscard]] Record& as_record() const {
        if (RECDATA_UNLIKELY(!is_record())) throw mismatch("record");
        return *std::get<std::shared_ptr<Record>>(data_);
    }
    [[nodiscard]] Sequence& as_sequence() const {
        if (RECDATA_UNLIKELY(!is_sequence())) throw mismatch("sequence");
        return *std::get<std::shared_ptr<Sequence>>(data_);
    }
    [[nodiscard]] Opaque& as_opaque() const {
        if (RECDATA_UNLIKELY(!is_opaque())) throw mismatch("opaque");
        return *std::get<std::shared_ptr<Opaque>>(data_);
    }

    /// Shared handles; empty when the kind does not match.
    [[nodiscard]] std::shared_ptr<Record> record_ptr() const noexcept {
        if (const auto* p = std::get_if<std::shared_ptr<Record>>(&data_)) return *p;
        return nullptr;
    }
    [[nodiscard]] std::shared_ptr<Sequence> sequence_ptr() const noexcept {
        if (const auto* p = std::get_if<std::shared_ptr<Sequence>>(&data_)) return *p;
        return nullptr;
    }
    [[nodiscard]] std::shared_ptr<Opaque> opaque_ptr() const noexcept {
        if (const auto* p = std::get_if<std::shared_ptr<Opaque>>(&data_)) return *p;
        return nullptr;
    }

    /// Address of the shared container or opaque object, null for values
    /// held inline. Used for identity checks (recursion guards, equality
    /// short-circuit).
    [[nodiscard]] const void* identity() const noexcept {
        switch (kind()) {
            case Kind::Record:   return std::get<std::shared_ptr<Record>>(data_).get();
            case Kind::Sequence: return std::get<std::shared_ptr<Sequence>>(data_).get();
            case Kind::Opaque:   return std::get<std::shared_ptr<Opaque>>(data_).get();
            default:             return nullptr;
        }
    }

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, bool>) return as_bool();
        else if constexpr (std::is_same_v<T, uint64_t>) return as_uinteger();
        else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, int> || std::is_same_v<T, long>)
            return static_cast<T>(as_integer());
        else if constexpr (std::is_same_v<T, double> || std::is_same_v<T, float>)
            return static_cast<T>(as_float());
        else if constexpr (std::is_same_v<T, std::string>) return as_text();
        else if constexpr (std::is_same_v<T, std::string_view>) return as_text_view();
        else if constexpr (std::is_same_v<T, Bytes>) return as_bytes();
        else static_assert(sizeof(T) == 0, "Unsupported type for get<T>()");
    }

    /// Type-safe value access with fallback, no exceptions.
    template <typename T>
    [[nodiscard]] T get_or(const T& dv) const noexcept {
        if constexpr (std::is_same_v<T, bool>) {
            return is_bool() ? std::get<bool>(data_) : dv;
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, int> || std::is_same_v<T, long>) {
            if (is_integer()) return static_cast<T>(std::get<int64_t>(data_));
            if (is_uinteger() && std::get<uint64_t>(data_) <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                return static_cast<T>(std::get<uint64_t>(data_));
            return dv;
        } else if constexpr (std::is_same_v<T, double> || std::is_same_v<T, float>) {
            if (is_float()) return static_cast<T>(std::get<double>(data_));
            if (is_integer()) return static_cast<T>(std::get<int64_t>(data_));
            if (is_uinteger()) return static_cast<T>(std::get<uint64_t>(data_));
            return dv;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return is_text() ? std::get<std::string>(data_) : dv;
        } else {
            static_assert(sizeof(T) == 0, "Unsupported type for get_or<T>()");
        }
    }

    /// Keyed access into a record value (record.hpp).
    Value& operator[](std::string_view key);
    const Value& operator[](std::string_view key) const;
    Value& operator[](const char* key) { return operator[](std::string_view(key)); }
    const Value& operator[](const char* key) const { return operator[](std::string_view(key)); }

    /// Positional access into a sequence value (sequence.hpp).
    Value& operator[](size_t index);
    const Value& operator[](size_t index) const;
    Value& operator[](int index) { return operator[](static_cast<size_t>(index)); }
    const Value& operator[](int index) const { return operator[](static_cast<size_t>(index)); }

    /// Element count of a container or payload length of text/binary
    /// values, 0 otherwise.
    [[nodiscard]] size_t size() const noexcept;

    /// False for null, false, zero, empty text/binary/containers and enum 0;
    /// opaque values decide for themselves.
    [[nodiscard]] bool truthy() const;
    explicit operator bool() const { return truthy(); }

    /// Structural equality. Numbers compare by value across integer,
    /// unsigned and float kinds; containers compare by content.
    [[nodiscard]] bool operator==(const Value& other) const;
    [[nodiscard]] bool operator!=(const Value& other) const { return !(*this == other); }

    /// Debug (single-line) and display (multi-line) renderings
    /// (formatter.hpp).
    [[nodiscard]] std::string repr() const;
    [[nodiscard]] std::string str() const;
    [[nodiscard]] std::string str(const PrintOptions& opts) const;

    [[nodiscard]] const storage_type& storage() const noexcept { return data_; }

    void swap(Value& o) noexcept { data_.swap(o.data_); }

private:
    storage_type data_;

    TypeError mismatch(const char* expected) const {
        return TypeError("expected " + std::string(expected) + ", got " + kind_name(kind()));
    }
};

inline void swap(Value& a, Value& b) noexcept { a.swap(b); }

} // namespace recdata
