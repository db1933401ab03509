#pragma once

/// @file print_options.hpp
/// @brief Display settings read by the renderers.
///
/// Every display rendering accepts an explicit PrintOptions; the overloads
/// without one read the process-wide default, changed through the
/// set_print_* functions below.
///
/// Thread safety: none. The process-wide default is plain mutable state.
/// Changing it while another thread renders is a data race; callers that
/// share records or settings across threads must lock externally.

#include "config.hpp"

#include <cstddef>

namespace recdata {

/// @brief Display configuration.
struct PrintOptions {
    /// Render text and binary values uncapped.
    bool full_strings    = false;

    /// In a flags-style record, also list the entries whose value is falsy.
    bool false_flags     = false;

    /// List private entries (keys starting with '_'). The debug rendering
    /// never lists them.
    bool private_entries = false;

    // ─── Caps ────────────────────────────────────────────────────────────

    /// Code points of text shown before truncating.
    size_t text_cap  = RECDATA_TEXT_PRINT_CAP;

    /// Bytes of a binary value shown before truncating.
    size_t bytes_cap = RECDATA_BYTES_PRINT_CAP;

    // ─── Factory methods ─────────────────────────────────────────────────

    /// Library defaults: capped strings, true flags only, no private entries.
    static constexpr PrintOptions defaults() noexcept {
        return {};
    }

    /// Everything shown, nothing truncated.
    static constexpr PrintOptions verbose() noexcept {
        PrintOptions opts;
        opts.full_strings    = true;
        opts.false_flags     = true;
        opts.private_entries = true;
        return opts;
    }
};

namespace detail {

inline PrintOptions& global_print_options_storage() noexcept {
    static PrintOptions instance;
    return instance;
}

} // namespace detail

/// @brief The process-wide default used by str() without arguments.
inline const PrintOptions& global_print_options() noexcept {
    return detail::global_print_options_storage();
}

/// @brief When enabled, display renderings show text and binary values in
/// full; otherwise (default) they are cut at 32 code points / 16 bytes.
inline void set_print_full_strings(bool enabled = false) noexcept {
    detail::global_print_options_storage().full_strings = enabled;
}

/// @brief When enabled, flags-style records list every flag; otherwise
/// (default) only the ones that are set.
inline void set_print_false_flags(bool enabled = false) noexcept {
    detail::global_print_options_storage().false_flags = enabled;
}

/// @brief When enabled, display renderings list private entries; otherwise
/// (default) they are hidden. The debug rendering never lists them.
inline void set_print_private_entries(bool enabled = false) noexcept {
    detail::global_print_options_storage().private_entries = enabled;
}

} // namespace recdata
