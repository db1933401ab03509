#pragma once

/// @file detail/escape.hpp
/// @brief Quoted forms of text and binary values, and hex output.

#include "../config.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace recdata::detail {

/// Hex digit table.
inline constexpr char kHexDigits[16] = {
    '0','1','2','3','4','5','6','7','8','9','a','b','c','d','e','f'
};

inline void append_hex_byte(std::string& out, uint8_t b) {
    out += kHexDigits[(b >> 4) & 0xF];
    out += kHexDigits[b & 0xF];
}

/// Short escapes shared by text and binary quoting; 0 when @p c has none.
inline char short_escape(unsigned char c) noexcept {
    switch (c) {
        case '\n': return 'n';
        case '\r': return 'r';
        case '\t': return 't';
        case '"':  return '"';
        case '\\': return '\\';
        default:   return 0;
    }
}

/// @brief "text" with C-style escapes. Bytes >= 0x80 pass through, so
/// valid UTF-8 stays readable.
inline void append_quoted_text(std::string& out, std::string_view s) {
    out += '"';
    for (char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        if (const char e = short_escape(c)) {
            out += '\\';
            out += e;
        } else if (c < 0x20 || c == 0x7F) {
            out += "\\x";
            append_hex_byte(out, c);
        } else {
            out += ch;
        }
    }
    out += '"';
}

/// @brief b"bytes": printable ASCII verbatim, everything else \xNN.
inline void append_quoted_bytes(std::string& out, const uint8_t* data, size_t len) {
    out += "b\"";
    for (size_t i = 0; i < len; ++i) {
        const uint8_t c = data[i];
        if (const char e = short_escape(c)) {
            out += '\\';
            out += e;
        } else if (c < 0x20 || c >= 0x7F) {
            out += "\\x";
            append_hex_byte(out, c);
        } else {
            out += static_cast<char>(c);
        }
    }
    out += '"';
}

/// @brief hex(0a0b0c)
inline void append_hex_inline(std::string& out, const uint8_t* data, size_t len) {
    out += "hex(";
    for (size_t i = 0; i < len; ++i) append_hex_byte(out, data[i]);
    out += ')';
}

/// @brief Classic dump, one line per RECDATA_HEXDUMP_WIDTH bytes:
///   0000   48 65 6c 6c 6f                                    Hello
/// Lines are separated by '\n' with no trailing newline. Empty input gives
/// an empty string.
inline std::string hexdump(const uint8_t* data, size_t len) {
    constexpr size_t kWidth = RECDATA_HEXDUMP_WIDTH;
    std::string out;
    for (size_t offset = 0; offset < len; offset += kWidth) {
        if (offset > 0) out += '\n';
        // Offset column: at least 4 hex digits.
        std::string off;
        for (size_t v = offset; v > 0 || off.size() < 4; v >>= 4)
            off.insert(off.begin(), kHexDigits[v & 0xF]);
        out += off;
        out += "   ";
        const size_t n = len - offset < kWidth ? len - offset : kWidth;
        for (size_t i = 0; i < kWidth; ++i) {
            if (i < n) {
                append_hex_byte(out, data[offset + i]);
                out += ' ';
            } else {
                out += "   ";
            }
        }
        out += "  ";
        for (size_t i = 0; i < n; ++i) {
            const uint8_t c = data[offset + i];
            out += (c >= 0x20 && c < 0x7F) ? static_cast<char>(c) : '.';
        }
    }
    return out;
}

} // namespace recdata::detail
