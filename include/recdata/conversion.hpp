#pragma once

/// @file conversion.hpp
/// @brief ADL-based conversion between C++ types and recdata values.
///
/// Provides:
///   - to_value() / from_value() for scalars, text, Bytes and STL containers
///     (vector <-> Sequence, map / unordered_map <-> Record)
///   - RECDATA_DEFINE_RECORD_NON_INTRUSIVE() macro for struct mapping
///   - RECDATA_DEFINE_RECORD_INTRUSIVE() macro for friend mapping
///
/// The struct macros give every member a record key of the same name and
/// refuse, at compile time, a member named like a record operation.
///
/// @code
///   struct Header { std::string magic; int version; bool compressed; };
///   RECDATA_DEFINE_RECORD_NON_INTRUSIVE(Header, magic, version, compressed)
///
///   Header h{"RIFF", 2, false};
///   recdata::Value v = recdata::to_value(h);
///   Header h2 = recdata::from_value<Header>(v);
/// @endcode

#include "record.hpp"
#include "sequence.hpp"
#include "value.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace recdata {

// =====================================================================
// to_value: C++ type -> Value
// =====================================================================

inline void to_value(Value& j, std::nullptr_t)      { j = Value(nullptr); }
inline void to_value(Value& j, bool v)              { j = Value(v); }
inline void to_value(Value& j, int v)               { j = Value(v); }
inline void to_value(Value& j, unsigned v)          { j = Value(v); }
inline void to_value(Value& j, int64_t v)           { j = Value(v); }
inline void to_value(Value& j, uint64_t v)          { j = Value(v); }
inline void to_value(Value& j, float v)             { j = Value(static_cast<double>(v)); }
inline void to_value(Value& j, double v)            { j = Value(v); }
inline void to_value(Value& j, const std::string& v) { j = Value(v); }
inline void to_value(Value& j, std::string_view v)  { j = Value(v); }
inline void to_value(Value& j, const char* v)       { j = Value(v); }
inline void to_value(Value& j, const Bytes& v)      { j = Value(v); }
inline void to_value(Value& j, const EnumValue& v)  { j = Value(v); }
inline void to_value(Value& j, const Record& v)     { j = Value(v); }
inline void to_value(Value& j, const Sequence& v)   { j = Value(v); }
inline void to_value(Value& j, const Value& v)      { j = v; }

template <typename T>
void to_value(Value& j, const std::vector<T>& vec) {
    Sequence seq;
    seq.reserve(vec.size());
    for (const auto& elem : vec) {
        Value tmp;
        to_value(tmp, elem);
        seq.push_back(std::move(tmp));
    }
    j = Value(std::move(seq));
}

template <typename T>
void to_value(Value& j, const std::map<std::string, T>& m) {
    Record rec;
    rec.reserve(m.size());
    for (const auto& [key, val] : m) {
        Value tmp;
        to_value(tmp, val);
        rec.set(key, std::move(tmp));
    }
    j = Value(std::move(rec));
}

template <typename T>
void to_value(Value& j, const std::unordered_map<std::string, T>& m) {
    Record rec;
    rec.reserve(m.size());
    for (const auto& [key, val] : m) {
        Value tmp;
        to_value(tmp, val);
        rec.set(key, std::move(tmp));
    }
    j = Value(std::move(rec));
}

template <typename T>
void to_value(Value& j, const std::optional<T>& opt) {
    if (opt.has_value()) {
        to_value(j, *opt);
    } else {
        j = Value(nullptr);
    }
}

// =====================================================================
// from_value: Value -> C++ type
// =====================================================================

inline void from_value(const Value& j, bool& v)        { v = j.as_bool(); }
inline void from_value(const Value& j, int& v) {
    const int64_t i = j.as_integer();
    if (RECDATA_UNLIKELY(i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()))
        throw TypeError("integer " + std::to_string(i) + " does not fit in int");
    v = static_cast<int>(i);
}
inline void from_value(const Value& j, unsigned& v) {
    const uint64_t u = j.as_uinteger();
    if (RECDATA_UNLIKELY(u > std::numeric_limits<unsigned>::max()))
        throw TypeError("integer " + std::to_string(u) + " does not fit in unsigned");
    v = static_cast<unsigned>(u);
}
inline void from_value(const Value& j, int64_t& v)     { v = j.as_integer(); }
inline void from_value(const Value& j, uint64_t& v)    { v = j.as_uinteger(); }
inline void from_value(const Value& j, float& v)       { v = static_cast<float>(j.as_float()); }
inline void from_value(const Value& j, double& v)      { v = j.as_float(); }
inline void from_value(const Value& j, std::string& v) { v = j.as_text(); }
inline void from_value(const Value& j, Bytes& v)       { v = j.as_bytes(); }
inline void from_value(const Value& j, EnumValue& v)   { v = j.as_enum(); }
inline void from_value(const Value& j, Record& v)      { v = j.as_record(); }
inline void from_value(const Value& j, Sequence& v)    { v = j.as_sequence(); }
inline void from_value(const Value& j, Value& v)       { v = j; }

template <typename T>
void from_value(const Value& j, std::vector<T>& vec) {
    const auto& seq = j.as_sequence();
    vec.clear();
    vec.reserve(seq.size());
    for (const auto& elem : seq) {
        T val{};
        from_value(elem, val);
        vec.push_back(std::move(val));
    }
}

template <typename T>
void from_value(const Value& j, std::map<std::string, T>& m) {
    const auto& rec = j.as_record();
    m.clear();
    for (const auto& [key, val] : rec) {
        T v{};
        from_value(val, v);
        m.emplace(key, std::move(v));
    }
}

template <typename T>
void from_value(const Value& j, std::unordered_map<std::string, T>& m) {
    const auto& rec = j.as_record();
    m.clear();
    for (const auto& [key, val] : rec) {
        T v{};
        from_value(val, v);
        m.emplace(key, std::move(v));
    }
}

template <typename T>
void from_value(const Value& j, std::optional<T>& opt) {
    if (j.is_null()) {
        opt = std::nullopt;
    } else {
        T val{};
        from_value(j, val);
        opt = std::move(val);
    }
}

// =====================================================================
// Helper wrappers
// =====================================================================

/// C++ value -> Value (ADL finds to_value).
template <typename T>
[[nodiscard]] Value to_value(const T& val) {
    Value j;
    to_value(j, val);
    return j;
}

/// Value -> C++ value (T must be default-constructible).
template <typename T>
[[nodiscard]] T from_value(const Value& j) {
    T val{};
    from_value(j, val);
    return val;
}

/// Value -> C++ value, or @p d when the value does not convert.
template <typename T>
[[nodiscard]] T from_value_or(const Value& j, const T& d) {
    try {
        T v{};
        from_value(j, v);
        return v;
    } catch (const std::system_error&) {
        return d;
    }
}

} // namespace recdata

// =====================================================================
// Preprocessor FOREACH utilities (support up to 16 fields)
// =====================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define RECDATA_PP_CAT_I(a, b) a##b
#define RECDATA_PP_CAT(a, b) RECDATA_PP_CAT_I(a, b)

#define RECDATA_PP_NARG_I(...) \
    RECDATA_PP_ARG_N(__VA_ARGS__, 16,15,14,13,12,11,10,9,8,7,6,5,4,3,2,1,0)
#define RECDATA_PP_ARG_N( \
    _1,_2,_3,_4,_5,_6,_7,_8,_9,_10,_11,_12,_13,_14,_15,_16, N,...) N

#define RECDATA_PP_FE_1(m,x) m(x)
#define RECDATA_PP_FE_2(m,x,...) m(x) RECDATA_PP_FE_1(m,__VA_ARGS__)
#define RECDATA_PP_FE_3(m,x,...) m(x) RECDATA_PP_FE_2(m,__VA_ARGS__)
#define RECDATA_PP_FE_4(m,x,...) m(x) RECDATA_PP_FE_3(m,__VA_ARGS__)
#define RECDATA_PP_FE_5(m,x,...) m(x) RECDATA_PP_FE_4(m,__VA_ARGS__)
#define RECDATA_PP_FE_6(m,x,...) m(x) RECDATA_PP_FE_5(m,__VA_ARGS__)
#define RECDATA_PP_FE_7(m,x,...) m(x) RECDATA_PP_FE_6(m,__VA_ARGS__)
#define RECDATA_PP_FE_8(m,x,...) m(x) RECDATA_PP_FE_7(m,__VA_ARGS__)
#define RECDATA_PP_FE_9(m,x,...) m(x) RECDATA_PP_FE_8(m,__VA_ARGS__)
#define RECDATA_PP_FE_10(m,x,...) m(x) RECDATA_PP_FE_9(m,__VA_ARGS__)
#define RECDATA_PP_FE_11(m,x,...) m(x) RECDATA_PP_FE_10(m,__VA_ARGS__)
#define RECDATA_PP_FE_12(m,x,...) m(x) RECDATA_PP_FE_11(m,__VA_ARGS__)
#define RECDATA_PP_FE_13(m,x,...) m(x) RECDATA_PP_FE_12(m,__VA_ARGS__)
#define RECDATA_PP_FE_14(m,x,...) m(x) RECDATA_PP_FE_13(m,__VA_ARGS__)
#define RECDATA_PP_FE_15(m,x,...) m(x) RECDATA_PP_FE_14(m,__VA_ARGS__)
#define RECDATA_PP_FE_16(m,x,...) m(x) RECDATA_PP_FE_15(m,__VA_ARGS__)

#define RECDATA_PP_FOREACH(m,...) \
    RECDATA_PP_CAT(RECDATA_PP_FE_, RECDATA_PP_NARG_I(__VA_ARGS__))(m, __VA_ARGS__)

// Field-level macros for struct mapping
#define RECDATA_DETAIL_CHECK_FIELD(fld) \
    static_assert(!::recdata::is_reserved_name(#fld), \
                  "field \"" #fld "\" collides with a record operation name");
#define RECDATA_DETAIL_TO_FIELD(fld) \
    { ::recdata::Value _rt; to_value(_rt, v.fld); rec.set(#fld, std::move(_rt)); }
#define RECDATA_DETAIL_FROM_FIELD(fld) \
    { from_value(rec.at(#fld), v.fld); }

/// Non-intrusive: use in the same namespace as the type.
#define RECDATA_DEFINE_RECORD_NON_INTRUSIVE(Type, ...) \
    RECDATA_PP_FOREACH(RECDATA_DETAIL_CHECK_FIELD, __VA_ARGS__) \
    inline void to_value(::recdata::Value& j, const Type& v) { \
        ::recdata::Record rec; \
        RECDATA_PP_FOREACH(RECDATA_DETAIL_TO_FIELD, __VA_ARGS__) \
        j = ::recdata::Value(std::move(rec)); \
    } \
    inline void from_value(const ::recdata::Value& j, Type& v) { \
        const auto& rec = j.as_record(); \
        RECDATA_PP_FOREACH(RECDATA_DETAIL_FROM_FIELD, __VA_ARGS__) \
    }

/// Intrusive: use inside the class/struct body.
#define RECDATA_DEFINE_RECORD_INTRUSIVE(Type, ...) \
    RECDATA_PP_FOREACH(RECDATA_DETAIL_CHECK_FIELD, __VA_ARGS__) \
    friend void to_value(::recdata::Value& j, const Type& v) { \
        ::recdata::Record rec; \
        RECDATA_PP_FOREACH(RECDATA_DETAIL_TO_FIELD, __VA_ARGS__) \
        j = ::recdata::Value(std::move(rec)); \
    } \
    friend void from_value(const ::recdata::Value& j, Type& v) { \
        const auto& rec = j.as_record(); \
        RECDATA_PP_FOREACH(RECDATA_DETAIL_FROM_FIELD, __VA_ARGS__) \
    }

// NOLINTEND(cppcoreguidelines-macro-usage)
