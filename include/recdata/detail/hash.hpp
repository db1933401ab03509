#pragma once

/// @file hash.hpp
/// @brief Transparent key hashing for the record hash index.
///
/// The index maps string_view keys (pointing into the record's own entry
/// storage) to positions, so lookups by std::string, string_view or
/// const char* never allocate.

#include <cstddef>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>

namespace recdata::detail {

struct KeyHash {
    using is_transparent = void;  // Heterogeneous lookup

    size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }

    size_t operator()(const std::string& s) const noexcept {
        return std::hash<std::string_view>{}(std::string_view(s));
    }

    size_t operator()(const char* s) const noexcept {
        return std::hash<std::string_view>{}(std::string_view(s, std::strlen(s)));
    }
};

/// @brief Transparent comparator for heterogeneous lookup.
struct KeyEqual {
    using is_transparent = void;

    bool operator()(std::string_view a, std::string_view b) const noexcept {
        return a == b;
    }
};

} // namespace recdata::detail
