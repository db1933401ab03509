#pragma once

/// @file detail/number.hpp
/// @brief Number to text conversion for the renderers.
///
/// Integers go through std::to_chars. Doubles use the shortest round-trip
/// form from std::to_chars and always keep a '.' or an exponent so a float
/// never reads like an integer. NaN and infinities render as nan, inf, -inf.

#include <charconv>
#include <cmath>
#include <cstdint>
#include <string>

namespace recdata::detail {

inline void append_integer(std::string& out, int64_t val) {
    char buf[24];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), val);
    (void)ec;  // 24 bytes always fit an int64
    out.append(buf, static_cast<size_t>(ptr - buf));
}

inline void append_uinteger(std::string& out, uint64_t val) {
    char buf[24];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), val);
    (void)ec;
    out.append(buf, static_cast<size_t>(ptr - buf));
}

inline void append_float(std::string& out, double val) {
    if (std::isnan(val)) { out += "nan"; return; }
    if (std::isinf(val)) { out += val < 0 ? "-inf" : "inf"; return; }

    char buf[40];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), val);
    (void)ec;
    const auto len = static_cast<size_t>(ptr - buf);

    bool has_dot = false;
    for (size_t i = 0; i < len; ++i) {
        const char c = buf[i];
        if (c == '.' || c == 'e' || c == 'E') {
            has_dot = true;
            break;
        }
    }
    out.append(buf, len);
    if (!has_dot) out += ".0";
}

} // namespace recdata::detail
