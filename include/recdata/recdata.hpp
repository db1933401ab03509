#pragma once

/// @file recdata.hpp
/// @brief Main header file for the recdata library.
///
/// recdata holds decoded, structured data in two ordered containers:
/// Record (insertion-ordered key/value mapping) and Sequence (ordered list),
/// with bounded display rendering, private-key-aware equality and recursive
/// regex search by key.
///
/// @code
///   recdata::Record hdr{{"magic", "RIFF"}, {"size", 1024}, {"_offset", 0}};
///   hdr["chunks"] = recdata::Sequence{recdata::Record{{"id", "fmt "}}};
///   std::cout << hdr << '\n';
///   auto id = hdr.search("^id$");   // std::optional<Value>
/// @endcode

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "opaque.hpp"
#include "value.hpp"
#include "sequence.hpp"
#include "record.hpp"
#include "print_options.hpp"
#include "formatter.hpp"
#include "search.hpp"
#include "conversion.hpp"
