#pragma once

/// @file sequence.hpp
/// @brief Sequence: ordered, indexable, growable list of values.

#include "config.hpp"
#include "detail/active_path.hpp"
#include "error.hpp"
#include "value.hpp"

#include <algorithm>
#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace recdata {

class Sequence {
public:
    using storage_type = std::vector<Value>;
    using size_type = size_t;
    using value_type = Value;

    Sequence() = default;
    Sequence(std::initializer_list<Value> init) : items_(init) {}
    explicit Sequence(storage_type items) : items_(std::move(items)) {}

    template <typename InputIt>
    Sequence(InputIt first, InputIt last) : items_(first, last) {}

    // ─── Capacity ────────────────────────────────────────────────────────
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
    [[nodiscard]] size_type size() const noexcept { return items_.size(); }
    void reserve(size_type n) { items_.reserve(n); }

    // ─── Iterators ──────────────────────────────────────────────────────
    auto begin() noexcept { return items_.begin(); }
    auto end()   noexcept { return items_.end(); }
    auto begin()  const noexcept { return items_.begin(); }
    auto end()    const noexcept { return items_.end(); }
    auto cbegin() const noexcept { return items_.cbegin(); }
    auto cend()   const noexcept { return items_.cend(); }

    // ─── Element access ─────────────────────────────────────────────────

    /// Checked access. Throws IndexOutOfRangeError.
    Value& at(size_type index) {
        check_index(index);
        return items_[index];
    }
    const Value& at(size_type index) const {
        check_index(index);
        return items_[index];
    }
    Value& operator[](size_type index) { return at(index); }
    const Value& operator[](size_type index) const { return at(index); }

    /// Exception-free access.
    [[nodiscard]] result<Value> try_at(size_type index) const {
        if (RECDATA_UNLIKELY(index >= items_.size()))
            return {Value(), make_error_code(errc::index_out_of_range)};
        return {items_[index], {}};
    }

    Value& front() { return at(0); }
    Value& back()  { return at(items_.empty() ? 0 : items_.size() - 1); }

    /// Copy of [start, stop), both clamped to size(). Nested containers are
    /// shared with this sequence.
    [[nodiscard]] Sequence slice(size_type start, size_type stop) const {
        stop = std::min(stop, items_.size());
        start = std::min(start, stop);
        return Sequence(items_.begin() + static_cast<std::ptrdiff_t>(start),
                        items_.begin() + static_cast<std::ptrdiff_t>(stop));
    }

    // ─── Modifiers ──────────────────────────────────────────────────────
    void push_back(const Value& v) { items_.push_back(v); }
    void push_back(Value&& v)      { items_.push_back(std::move(v)); }
    void append(Value v)           { items_.push_back(std::move(v)); }

    template <typename... Args>
    Value& emplace_back(Args&&... args) {
        return items_.emplace_back(std::forward<Args>(args)...);
    }

    void extend(const Sequence& other) {
        // Copy first: other may be *this.
        storage_type tail(other.items_);
        items_.insert(items_.end(), std::make_move_iterator(tail.begin()),
                      std::make_move_iterator(tail.end()));
    }

    /// Insert before @p index; an index past the end appends.
    void insert(size_type index, Value v) {
        index = std::min(index, items_.size());
        items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(index), std::move(v));
    }

    /// Remove the element at @p index. Throws IndexOutOfRangeError.
    void erase(size_type index) {
        check_index(index);
        items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(index));
    }

    /// Remove the first element equal to @p v. Returns false if none is.
    bool remove(const Value& v) {
        auto it = std::find(items_.begin(), items_.end(), v);
        if (it == items_.end()) return false;
        items_.erase(it);
        return true;
    }

    /// Remove and return the last element. Throws IndexOutOfRangeError on
    /// an empty sequence.
    Value pop() {
        if (RECDATA_UNLIKELY(items_.empty())) throw IndexOutOfRangeError(0, 0);
        Value v = std::move(items_.back());
        items_.pop_back();
        return v;
    }

    /// Remove and return the element at @p index.
    Value pop(size_type index) {
        check_index(index);
        Value v = std::move(items_[index]);
        items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(index));
        return v;
    }

    void clear() noexcept { items_.clear(); }

    // ─── Comparison ─────────────────────────────────────────────────────

    /// Element-wise and order-sensitive. A pair of sequences reached again
    /// through a cycle while still being compared counts as equal.
    bool operator==(const Sequence& other) const {
        if (this == &other) return true;
        detail::CompareScope scope(this, &other);
        if (!scope) return true;
        return items_ == other.items_;
    }
    bool operator!=(const Sequence& other) const { return !(*this == other); }

    // ─── Rendering (formatter.hpp) ──────────────────────────────────────
    [[nodiscard]] std::string repr() const;
    [[nodiscard]] std::string str() const;
    [[nodiscard]] std::string str(const PrintOptions& opts) const;

    // ─── Search (search.hpp) ────────────────────────────────────────────

    /// First value whose key matches @p pattern anywhere below this
    /// sequence. Elements that are not containers never match.
    [[nodiscard]] std::optional<Value> search(std::string_view pattern) const;
    [[nodiscard]] std::optional<Value> search(const std::regex& pattern) const;

    /// Every match below this sequence, in discovery order.
    [[nodiscard]] std::vector<Value> search_all(std::string_view pattern) const;
    [[nodiscard]] std::vector<Value> search_all(const std::regex& pattern) const;

    /// Direct access to the underlying storage.
    const storage_type& storage() const noexcept { return items_; }
    storage_type& storage() noexcept { return items_; }

private:
    storage_type items_;

    void check_index(size_type index) const {
        if (RECDATA_UNLIKELY(index >= items_.size()))
            throw IndexOutOfRangeError(index, items_.size());
    }
};

inline std::ostream& operator<<(std::ostream& os, const Sequence& seq);

// ─── Value members that need Sequence ──────────────────────────────────

inline Value::Value(const Sequence& v)
    : data_(std::in_place_type<std::shared_ptr<Sequence>>, std::make_shared<Sequence>(v)) {}
inline Value::Value(Sequence&& v)
    : data_(std::in_place_type<std::shared_ptr<Sequence>>, std::make_shared<Sequence>(std::move(v))) {}

inline Value& Value::operator[](size_t index) {
    return as_sequence().at(index);
}
inline const Value& Value::operator[](size_t index) const {
    return as_sequence().at(index);
}

} // namespace recdata
