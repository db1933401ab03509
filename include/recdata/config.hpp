#pragma once

/// @file config.hpp
/// @brief Configuration macros for the recdata library.
///
/// Controls:
///   - Branch prediction hints
///   - Record lookup strategy (linear scan vs hash index)
///   - Display caps for text and binary values

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define RECDATA_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define RECDATA_UNLIKELY(x) __builtin_expect(!!(x), 0)
#elif defined(_MSC_VER)
    #define RECDATA_LIKELY(x)   (x)
    #define RECDATA_UNLIKELY(x) (x)
#else
    #define RECDATA_LIKELY(x)   (x)
    #define RECDATA_UNLIKELY(x) (x)
#endif

// =====================================================================
// Small record threshold for linear vs hash lookup
// =====================================================================

#if !defined(RECDATA_INDEX_THRESHOLD)
    #define RECDATA_INDEX_THRESHOLD 16
#endif

// =====================================================================
// Display caps (PrintOptions defaults)
// =====================================================================
// Text is measured in code points, binary values in bytes.

#if !defined(RECDATA_TEXT_PRINT_CAP)
    #define RECDATA_TEXT_PRINT_CAP 32
#endif

#if !defined(RECDATA_BYTES_PRINT_CAP)
    #define RECDATA_BYTES_PRINT_CAP 16
#endif

// Bytes per line of a hex dump.
#if !defined(RECDATA_HEXDUMP_WIDTH)
    #define RECDATA_HEXDUMP_WIDTH 16
#endif
