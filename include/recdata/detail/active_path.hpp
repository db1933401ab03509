#pragma once

/// @file detail/active_path.hpp
/// @brief Per-thread stack of the containers a traversal is inside of.
///
/// Rendering and searching push the container they are working on and pop
/// it on every exit path. Meeting a container that is already on the stack
/// means the structure refers back to itself; the caller substitutes a
/// placeholder (rendering) or treats it as a non-match (search). Nothing is
/// stored on the containers themselves.
///
/// Equality tracks pairs instead: a (lhs, rhs) pair met again while it is
/// still being compared is taken as equal, so two cyclic structures of the
/// same shape compare equal instead of recursing forever.

#include <algorithm>
#include <utility>
#include <vector>

namespace recdata::detail {

class ActivePath {
public:
    bool contains(const void* node) const noexcept {
        return std::find(nodes_.begin(), nodes_.end(), node) != nodes_.end();
    }
    void push(const void* node) { nodes_.push_back(node); }
    void pop() noexcept { nodes_.pop_back(); }
    [[nodiscard]] size_t depth() const noexcept { return nodes_.size(); }

private:
    std::vector<const void*> nodes_;
};

/// Containers being rendered on this thread.
inline ActivePath& render_path() noexcept {
    static thread_local ActivePath path;
    return path;
}

/// Containers being searched on this thread.
inline ActivePath& search_path() noexcept {
    static thread_local ActivePath path;
    return path;
}

/// @brief RAII guard that enters @p node on @p path for the guard's lifetime.
///
/// Converts to false when @p node was already on the path; nothing is
/// pushed in that case and the caller must not descend.
class PathScope {
public:
    PathScope(ActivePath& path, const void* node)
        : path_(path)
        , entered_(!path.contains(node))
    {
        if (entered_) path_.push(node);
    }

    ~PathScope() noexcept {
        if (entered_) path_.pop();
    }

    // Non-copyable
    PathScope(const PathScope&) = delete;
    PathScope& operator=(const PathScope&) = delete;

    explicit operator bool() const noexcept { return entered_; }

private:
    ActivePath& path_;
    bool entered_;
};

// ─── Equality ──────────────────────────────────────────────────────────

class ComparePath {
public:
    using pair_type = std::pair<const void*, const void*>;

    bool contains(const void* lhs, const void* rhs) const noexcept {
        return std::find(pairs_.begin(), pairs_.end(), pair_type(lhs, rhs)) != pairs_.end();
    }
    void push(const void* lhs, const void* rhs) { pairs_.emplace_back(lhs, rhs); }
    void pop() noexcept { pairs_.pop_back(); }
    [[nodiscard]] size_t depth() const noexcept { return pairs_.size(); }

private:
    std::vector<pair_type> pairs_;
};

/// Container pairs being compared on this thread.
inline ComparePath& compare_path() noexcept {
    static thread_local ComparePath path;
    return path;
}

/// @brief RAII guard that enters the pair (@p lhs, @p rhs) on compare_path().
///
/// Converts to false when the pair is already being compared.
class CompareScope {
public:
    CompareScope(const void* lhs, const void* rhs)
        : entered_(!compare_path().contains(lhs, rhs))
    {
        if (entered_) compare_path().push(lhs, rhs);
    }

    ~CompareScope() noexcept {
        if (entered_) compare_path().pop();
    }

    // Non-copyable
    CompareScope(const CompareScope&) = delete;
    CompareScope& operator=(const CompareScope&) = delete;

    explicit operator bool() const noexcept { return entered_; }

private:
    bool entered_;
};

} // namespace recdata::detail
