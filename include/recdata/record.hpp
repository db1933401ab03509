#pragma once

/// @file record.hpp
/// @brief Record: insertion-ordered key/value mapping with keyed and
/// field-style access.
///
/// Entries live in a vector in first-insertion order; setting an existing
/// key updates the value in place. Lookup is a linear scan for small
/// records and goes through a lazily built hash index (string_view keys
/// pointing into the entries) once the record reaches
/// RECDATA_INDEX_THRESHOLD entries.
///
/// Equality ignores key order and private keys. Copies are shallow: nested
/// records and sequences are shared, never cloned.

#include "config.hpp"
#include "detail/active_path.hpp"
#include "detail/hash.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "sequence.hpp"
#include "value.hpp"

#include <algorithm>
#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace recdata {

class Record {
public:
    using entry_type = std::pair<std::string, Value>;
    using storage_type = std::vector<entry_type>;
    using snapshot_type = storage_type;
    using size_type = size_t;
    /// Hash index stores string_view keys pointing into entries_[].first.
    /// It is rebuilt from scratch whenever positions shift, so the views
    /// always point to live keys.
    using index_type = std::unordered_map<std::string_view, size_type,
                                          detail::KeyHash, detail::KeyEqual>;

    Record() = default;
    ~Record() = default;

    /// Pairs in order; a repeated key keeps its first position and its
    /// last value.
    Record(std::initializer_list<entry_type> init) {
        entries_.reserve(init.size());
        for (const auto& [k, v] : init) set(k, v);
    }

    template <typename InputIt>
    Record(InputIt first, InputIt last) {
        for (; first != last; ++first) set(first->first, first->second);
    }

    explicit Record(const snapshot_type& pairs) : Record(pairs.begin(), pairs.end()) {}

    Record(const Record& o) : entries_(o.entries_) {}
    Record(Record&& o) noexcept
        : entries_(std::move(o.entries_)), index_(std::move(o.index_)) {}
    Record& operator=(const Record& o) {
        if (this != &o) { entries_ = o.entries_; index_.reset(); }
        return *this;
    }
    Record& operator=(Record&& o) noexcept {
        if (this != &o) { entries_ = std::move(o.entries_); index_ = std::move(o.index_); }
        return *this;
    }

    /// Record with every key of @p keys mapped to @p value.
    template <typename Keys>
    [[nodiscard]] static Record fromkeys(const Keys& keys, const Value& value = Value()) {
        Record r;
        for (const auto& k : keys) r.set(std::string(k), value);
        return r;
    }
    [[nodiscard]] static Record fromkeys(std::initializer_list<std::string_view> keys,
                                         const Value& value = Value()) {
        Record r;
        for (auto k : keys) r.set(std::string(k), value);
        return r;
    }

    /// Same key order, same values (nested containers shared).
    [[nodiscard]] Record copy() const { return Record(*this); }

    // ─── Capacity ────────────────────────────────────────────────────────
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] size_type size() const noexcept { return entries_.size(); }
    void reserve(size_type n) { entries_.reserve(n); }

    // ─── Iterators ──────────────────────────────────────────────────────
    auto begin() noexcept { return entries_.begin(); }
    auto end()   noexcept { return entries_.end(); }
    auto begin()  const noexcept { return entries_.begin(); }
    auto end()    const noexcept { return entries_.end(); }
    auto cbegin() const noexcept { return entries_.cbegin(); }
    auto cend()   const noexcept { return entries_.cend(); }

    // ─── Keyed access ───────────────────────────────────────────────────

    /// O(1) key lookup for large records, linear for small ones.
    Value* find(std::string_view key);
    const Value* find(std::string_view key) const;

    [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

    /// Throws KeyNotFoundError.
    Value& at(std::string_view key);
    const Value& at(std::string_view key) const;
    Value& get(std::string_view key) { return at(key); }
    const Value& get(std::string_view key) const { return at(key); }

    /// Copy of the value, or @p dv when the key is absent.
    [[nodiscard]] Value get_or(std::string_view key, const Value& dv = Value()) const {
        const auto* p = find(key);
        return p ? *p : dv;
    }

    /// Reports a missing key through the error code instead of throwing.
    [[nodiscard]] result<Value> try_at(std::string_view key) const;

    /// Access or create: an absent key is appended with a null value.
    Value& operator[](std::string_view key);
    const Value& operator[](std::string_view key) const { return at(key); }

    // ─── Field-style access ─────────────────────────────────────────────

    /// Like at(), restricted to identifiers that are not operation names.
    /// Throws InvalidFieldNameError, ReservedNameError or KeyNotFoundError.
    Value& attr(std::string_view name) {
        check_field_name(name);
        return at(name);
    }
    const Value& attr(std::string_view name) const {
        check_field_name(name);
        return at(name);
    }

    /// Like set(), with the same name restrictions as attr().
    void set_attr(std::string_view name, Value value) {
        check_field_name(name);
        set(std::string(name), std::move(value));
    }

    /// Keys reachable through attr(), in order.
    [[nodiscard]] std::vector<std::string> field_names() const {
        std::vector<std::string> out;
        for (const auto& e : entries_) {
            if (is_field_name(e.first) && !is_reserved_name(e.first)) out.push_back(e.first);
        }
        return out;
    }

    // ─── Modifiers ──────────────────────────────────────────────────────

    /// Insert or update (amortized O(1)). An existing key keeps its position.
    void set(std::string key, Value value);

    /// Erase by key. Returns false if the key was absent.
    bool erase(std::string_view key);

    /// Remove and return a value. Throws KeyNotFoundError.
    Value pop(std::string_view key);

    /// Remove and return the last entry. Throws KeyNotFoundError when empty.
    entry_type popitem();

    /// Value for @p key, inserting @p dv first if the key is absent.
    Value& setdefault(std::string_view key, Value dv = Value());

    /// set() every entry of @p other, in its order.
    void update(const Record& other);
    void update(std::initializer_list<entry_type> pairs) {
        for (const auto& [k, v] : pairs) set(k, v);
    }

    /// Copy of this record updated with @p other.
    [[nodiscard]] Record merge(const Record& other) const {
        Record r(*this);
        r.update(other);
        return r;
    }

    /// Move an existing key to the end (or the front). Throws
    /// KeyNotFoundError.
    void move_to_end(std::string_view key, bool last = true);

    /// Clear all entries and release the index.
    void clear() noexcept {
        entries_.clear();
        index_.reset();
    }

    // ─── Views ──────────────────────────────────────────────────────────
    [[nodiscard]] std::vector<std::string> keys() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_) out.push_back(e.first);
        return out;
    }
    [[nodiscard]] std::vector<Value> values() const {
        std::vector<Value> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_) out.push_back(e.second);
        return out;
    }
    [[nodiscard]] const storage_type& items() const noexcept { return entries_; }

    // ─── Flags-style marker ─────────────────────────────────────────────

    /// Mark this record as decoded from named bit flags: its display hides
    /// falsy entries unless PrintOptions::false_flags is set.
    void mark_flags(bool enabled = true) { set(std::string(kFlagsKey), Value(enabled)); }

    [[nodiscard]] bool is_flags() const {
        const auto* p = find(kFlagsKey);
        return p != nullptr && p->truthy();
    }

    // ─── Persistence ────────────────────────────────────────────────────

    /// Every entry, private ones included, in order.
    [[nodiscard]] snapshot_type snapshot() const { return entries_; }

    /// Replace the content with @p pairs, in their order.
    void restore(const snapshot_type& pairs) {
        // Copy first: pairs may alias entries_.
        snapshot_type incoming(pairs);
        clear();
        for (auto& [k, v] : incoming) set(std::move(k), std::move(v));
    }

    // ─── Comparison ─────────────────────────────────────────────────────

    /// Equal iff every non-private key of either side is present in the
    /// other with an equal value. Key order is ignored. Cyclic records
    /// compare equal when their shapes agree.
    bool operator==(const Record& other) const;
    bool operator!=(const Record& other) const { return !(*this == other); }

    // ─── Rendering (formatter.hpp) ──────────────────────────────────────
    [[nodiscard]] std::string repr() const;
    [[nodiscard]] std::string str() const;
    [[nodiscard]] std::string str(const PrintOptions& opts) const;

    // ─── Search (search.hpp) ────────────────────────────────────────────

    /// First value whose key matches @p pattern (prefix match), scanning
    /// entries in order and descending into nested containers.
    [[nodiscard]] std::optional<Value> search(std::string_view pattern) const;
    [[nodiscard]] std::optional<Value> search(const std::regex& pattern) const;

    /// Every match, in discovery order.
    [[nodiscard]] std::vector<Value> search_all(std::string_view pattern) const;
    [[nodiscard]] std::vector<Value> search_all(const std::regex& pattern) const;

    /// Direct access to the underlying storage.
    const storage_type& storage() const noexcept { return entries_; }

    /// @brief Rebuild the hash index from entries.
    void rebuild_index() const;

private:
    storage_type entries_;

    /// Lazily created hash index: key -> offset in entries_.
    /// Created only when the record grows to kIndexThreshold entries.
    mutable std::unique_ptr<index_type> index_;

    static constexpr size_type kIndexThreshold = RECDATA_INDEX_THRESHOLD;

    bool use_index() const noexcept {
        return entries_.size() >= kIndexThreshold;
    }

    void ensure_index() const { if (use_index() && !index_) rebuild_index(); }

    size_type position(std::string_view key) const;

    static void check_field_name(std::string_view name) {
        if (RECDATA_UNLIKELY(!is_field_name(name))) throw InvalidFieldNameError(std::string(name));
        if (RECDATA_UNLIKELY(is_reserved_name(name))) throw ReservedNameError(std::string(name));
    }
};

inline std::ostream& operator<<(std::ostream& os, const Record& record);

// ─── Record member functions ───────────────────────────────────────────

inline void Record::rebuild_index() const {
    if (!index_) {
        index_ = std::make_unique<index_type>(entries_.size() * 2);
    } else {
        index_->clear();
    }
    for (size_type i = 0; i < entries_.size(); ++i)
        (*index_)[std::string_view(entries_[i].first)] = i;
}

inline Record::size_type Record::position(std::string_view key) const {
    if (use_index()) {
        ensure_index();
        auto it = index_->find(key);  // O(1), zero allocations
        return it != index_->end() ? it->second : entries_.size();
    }
    for (size_type i = 0; i < entries_.size(); ++i)
        if (entries_[i].first == key) return i;
    return entries_.size();
}

inline Value* Record::find(std::string_view key) {
    const size_type i = position(key);
    return i < entries_.size() ? &entries_[i].second : nullptr;
}

inline const Value* Record::find(std::string_view key) const {
    const size_type i = position(key);
    return i < entries_.size() ? &entries_[i].second : nullptr;
}

inline Value& Record::at(std::string_view key) {
    auto* p = find(key);
    if (RECDATA_UNLIKELY(!p)) throw KeyNotFoundError(std::string(key));
    return *p;
}

inline const Value& Record::at(std::string_view key) const {
    const auto* p = find(key);
    if (RECDATA_UNLIKELY(!p)) throw KeyNotFoundError(std::string(key));
    return *p;
}

inline result<Value> Record::try_at(std::string_view key) const {
    const auto* p = find(key);
    if (RECDATA_UNLIKELY(!p)) return {Value(), make_error_code(errc::key_not_found)};
    return {*p, {}};
}

inline Value& Record::operator[](std::string_view key) {
    if (auto* p = find(key)) return *p;
    set(std::string(key), Value());
    return entries_.back().second;
}

inline void Record::set(std::string key, Value value) {
    const size_type i = position(key);
    if (i < entries_.size()) {
        entries_[i].second = std::move(value);
        return;
    }
    const auto* old_data = entries_.data();
    entries_.emplace_back(std::move(key), std::move(value));
    if (!index_) return;
    if (entries_.data() != old_data) {
        // Reallocation: every string_view key is dangling. Rebuild.
        rebuild_index();
    } else {
        index_->emplace(std::string_view(entries_.back().first), entries_.size() - 1);
    }
}

inline bool Record::erase(std::string_view key) {
    const size_type i = position(key);
    if (i >= entries_.size()) return false;
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(i));
    // Positions shifted.
    if (index_) rebuild_index();
    return true;
}

inline Value Record::pop(std::string_view key) {
    const size_type i = position(key);
    if (RECDATA_UNLIKELY(i >= entries_.size())) throw KeyNotFoundError(std::string(key));
    Value v = std::move(entries_[i].second);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(i));
    if (index_) rebuild_index();
    return v;
}

inline Record::entry_type Record::popitem() {
    if (RECDATA_UNLIKELY(entries_.empty()))
        throw KeyNotFoundError("", "popitem(): record is empty");
    entry_type e = std::move(entries_.back());
    entries_.pop_back();
    if (index_) rebuild_index();
    return e;
}

inline Value& Record::setdefault(std::string_view key, Value dv) {
    if (auto* p = find(key)) return *p;
    set(std::string(key), std::move(dv));
    return entries_.back().second;
}

inline void Record::update(const Record& other) {
    if (this == &other) return;
    for (const auto& [k, v] : other.entries_) set(k, v);
}

inline void Record::move_to_end(std::string_view key, bool last) {
    const size_type i = position(key);
    if (RECDATA_UNLIKELY(i >= entries_.size())) throw KeyNotFoundError(std::string(key));
    auto it = entries_.begin() + static_cast<std::ptrdiff_t>(i);
    if (last) std::rotate(it, it + 1, entries_.end());
    else      std::rotate(entries_.begin(), it, it + 1);
    if (index_) rebuild_index();
}

inline bool Record::operator==(const Record& other) const {
    if (this == &other) return true;
    detail::CompareScope scope(this, &other);
    if (!scope) return true;
    // Both directions: each side may carry keys the other lacks.
    for (const auto& [key, val] : entries_) {
        if (is_private_key(key)) continue;
        const auto* p = other.find(key);
        if (!p || *p != val) return false;
    }
    for (const auto& [key, val] : other.entries_) {
        if (is_private_key(key)) continue;
        const auto* p = find(key);
        if (!p || *p != val) return false;
    }
    return true;
}

// ─── Value members that need Record ────────────────────────────────────

inline Value::Value(const Record& v)
    : data_(std::in_place_type<std::shared_ptr<Record>>, std::make_shared<Record>(v)) {}
inline Value::Value(Record&& v)
    : data_(std::in_place_type<std::shared_ptr<Record>>, std::make_shared<Record>(std::move(v))) {}

inline Value& Value::operator[](std::string_view key) {
    return as_record()[key];
}
inline const Value& Value::operator[](std::string_view key) const {
    return as_record().at(key);
}

inline size_t Value::size() const noexcept {
    switch (kind()) {
        case Kind::Text:     return std::get<std::string>(data_).size();
        case Kind::Bytes:    return std::get<Bytes>(data_).size();
        case Kind::HexBytes: return std::get<HexBytes>(data_).data.size();
        case Kind::Record:   return std::get<std::shared_ptr<Record>>(data_)->size();
        case Kind::Sequence: return std::get<std::shared_ptr<Sequence>>(data_)->size();
        default:             return 0;
    }
}

inline bool Value::truthy() const {
    switch (kind()) {
        case Kind::Null:     return false;
        case Kind::Bool:     return std::get<bool>(data_);
        case Kind::Integer:  return std::get<int64_t>(data_) != 0;
        case Kind::UInteger: return std::get<uint64_t>(data_) != 0;
        case Kind::Float:    return std::get<double>(data_) != 0.0;
        case Kind::Enum:     return std::get<EnumValue>(data_).value != 0;
        case Kind::Opaque:   return std::get<std::shared_ptr<Opaque>>(data_)->truthy();
        default:             return size() != 0;
    }
}

inline bool Value::operator==(const Value& other) const {
    if (kind() != other.kind()) {
        if (is_number() && other.is_number()) {
            // Exact int/uint comparison without double-precision loss
            if ((is_integer() && other.is_uinteger()) || (is_uinteger() && other.is_integer())) {
                const int64_t  sv = is_integer()  ? std::get<int64_t>(data_) : std::get<int64_t>(other.data_);
                const uint64_t uv = is_uinteger() ? std::get<uint64_t>(data_) : std::get<uint64_t>(other.data_);
                return sv >= 0 && static_cast<uint64_t>(sv) == uv;
            }
            return as_float() == other.as_float();
        }
        return false;
    }
    switch (kind()) {
        case Kind::Null:     return true;
        case Kind::Bool:     return std::get<bool>(data_) == std::get<bool>(other.data_);
        case Kind::Integer:  return std::get<int64_t>(data_) == std::get<int64_t>(other.data_);
        case Kind::UInteger: return std::get<uint64_t>(data_) == std::get<uint64_t>(other.data_);
        case Kind::Float:    return std::get<double>(data_) == std::get<double>(other.data_);
        case Kind::Text:     return std::get<std::string>(data_) == std::get<std::string>(other.data_);
        case Kind::Bytes:    return std::get<Bytes>(data_) == std::get<Bytes>(other.data_);
        case Kind::Enum:     return std::get<EnumValue>(data_) == std::get<EnumValue>(other.data_);
        case Kind::HexBytes: return std::get<HexBytes>(data_) == std::get<HexBytes>(other.data_);
        case Kind::Record:
            return identity() == other.identity() || as_record() == other.as_record();
        case Kind::Sequence:
            return identity() == other.identity() || as_sequence() == other.as_sequence();
        case Kind::Opaque:
            return identity() == other.identity() || as_opaque().equals(other.as_opaque());
    }
    return false;
}

} // namespace recdata
