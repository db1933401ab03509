#pragma once

/// @file utf8.hpp
/// @brief UTF-8 helpers for measuring and cutting text by code points.
///
/// Text caps count code points, not bytes, so a cut never splits a
/// multi-byte sequence. Malformed bytes count as one code point each.

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace recdata::detail::utf8 {

/// @brief Determines the UTF-8 sequence length from the leading byte.
/// @return 1-4 for a valid byte, 0 for an invalid one.
inline unsigned sequence_length(unsigned char lead) noexcept {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0; // Invalid leading byte
}

/// @brief Bytes taken by the sequence starting at @p pos (at least 1).
inline size_t step(std::string_view s, size_t pos) noexcept {
    const unsigned len = sequence_length(static_cast<unsigned char>(s[pos]));
    if (len == 0 || pos + len > s.size()) return 1;
    for (unsigned i = 1; i < len; ++i) {
        if ((static_cast<unsigned char>(s[pos + i]) & 0xC0) != 0x80) return 1;
    }
    return len;
}

/// @brief Number of code points in @p s.
inline size_t length(std::string_view s) noexcept {
    size_t count = 0;
    for (size_t pos = 0; pos < s.size(); pos += step(s, pos)) ++count;
    return count;
}

/// @brief The first @p n code points of @p s.
inline std::string_view prefix(std::string_view s, size_t n) noexcept {
    size_t pos = 0;
    for (size_t i = 0; i < n && pos < s.size(); ++i) pos += step(s, pos);
    return s.substr(0, pos);
}

} // namespace recdata::detail::utf8
