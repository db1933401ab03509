#pragma once

/// @file search.hpp
/// @brief Recursive regex search over records and sequences.
///
/// One depth-first walk serves both containers. In a record, an entry whose
/// value is a record or sequence is descended into (its own key is not
/// tested); any other entry matches when the pattern matches the start of
/// its key. In a sequence there are no keys: container elements are
/// descended into and every other element is skipped.
///
/// search() stops at the first match; search_all() collects every match in
/// discovery order. A container already on the current search path is a
/// non-match, so cyclic structures terminate. A regex_error raised while
/// matching one key (complexity or stack limits) makes that entry a
/// non-match; a malformed pattern is reported up front as PatternError.

#include "detail/active_path.hpp"
#include "error.hpp"
#include "record.hpp"
#include "sequence.hpp"
#include "value.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace recdata {

/// @brief Compile a search pattern (ECMAScript syntax).
/// @throws PatternError if @p pattern is malformed.
[[nodiscard]] inline std::regex compile_pattern(std::string_view pattern) {
    try {
        return std::regex(pattern.begin(), pattern.end(), std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw PatternError(std::string(pattern), e.what());
    }
}

namespace detail {

/// Runs @p match; a regex_error it raises is reported as no match. Any
/// other exception propagates.
template <typename Match>
bool match_or_skip(Match&& match) {
    try {
        return match();
    } catch (const std::regex_error&) {
        return false;
    }
}

class Searcher {
public:
    Searcher(const std::regex& pattern, bool collect_all) noexcept
        : pattern_(pattern), all_(collect_all) {}

    /// @return true once a single-result search has its match.
    bool visit(const Record& r) {
        PathScope scope(search_path(), &r);
        if (!scope) return false;

        for (const auto& [key, val] : r) {
            if (val.is_container()) {
                if (descend(val)) return true;
            } else if (key_matches(key)) {
                matches_.push_back(val);
                if (!all_) return true;
            }
        }
        return false;
    }

    bool visit(const Sequence& s) {
        PathScope scope(search_path(), &s);
        if (!scope) return false;

        for (const auto& item : s) {
            if (item.is_container() && descend(item)) return true;
        }
        return false;
    }

    [[nodiscard]] std::vector<Value>& matches() noexcept { return matches_; }

private:
    const std::regex& pattern_;
    bool all_;
    std::vector<Value> matches_;

    bool descend(const Value& v) {
        if (v.is_record()) return visit(v.as_record());
        return visit(v.as_sequence());
    }

    bool key_matches(const std::string& key) const {
        return match_or_skip([&] {
            return std::regex_search(key, pattern_, std::regex_constants::match_continuous);
        });
    }
};

template <typename Container>
std::optional<Value> search_first(const Container& c, const std::regex& pattern) {
    Searcher s(pattern, false);
    if (!s.visit(c)) return std::nullopt;
    return std::move(s.matches().front());
}

template <typename Container>
std::vector<Value> search_every(const Container& c, const std::regex& pattern) {
    Searcher s(pattern, true);
    s.visit(c);
    return std::move(s.matches());
}

} // namespace detail

// ─── Record / Sequence search entry points ─────────────────────────────

inline std::optional<Value> Record::search(std::string_view pattern) const {
    return detail::search_first(*this, compile_pattern(pattern));
}

inline std::optional<Value> Record::search(const std::regex& pattern) const {
    return detail::search_first(*this, pattern);
}

inline std::vector<Value> Record::search_all(std::string_view pattern) const {
    return detail::search_every(*this, compile_pattern(pattern));
}

inline std::vector<Value> Record::search_all(const std::regex& pattern) const {
    return detail::search_every(*this, pattern);
}

inline std::optional<Value> Sequence::search(std::string_view pattern) const {
    return detail::search_first(*this, compile_pattern(pattern));
}

inline std::optional<Value> Sequence::search(const std::regex& pattern) const {
    return detail::search_first(*this, pattern);
}

inline std::vector<Value> Sequence::search_all(std::string_view pattern) const {
    return detail::search_every(*this, compile_pattern(pattern));
}

inline std::vector<Value> Sequence::search_all(const std::regex& pattern) const {
    return detail::search_every(*this, pattern);
}

} // namespace recdata
