#pragma once

/// @file error.hpp
/// @brief Error types for recdata: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: KeyNotFoundError, IndexOutOfRangeError, ... (default)
///   - Via error_code: recdata::errc enum + recdata_category() (exception-free)
///
/// Use Record::try_at / Sequence::try_at for exception-free access.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace recdata {

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief recdata error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Structural access errors (1-29)
    key_not_found      = 1,
    index_out_of_range = 2,

    // Field-style access errors (30-49)
    reserved_name      = 30,
    invalid_field_name = 31,

    // Value access errors (50-69)
    type_mismatch      = 50,

    // Search errors (70-89)
    invalid_pattern    = 70,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class recdata_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "recdata";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                 return "success";
            case errc::key_not_found:      return "key not found";
            case errc::index_out_of_range: return "index out of range";
            case errc::reserved_name:      return "name is reserved for a record operation";
            case errc::invalid_field_name: return "not a valid field name";
            case errc::type_mismatch:      return "type mismatch";
            case errc::invalid_pattern:    return "invalid search pattern";
            default:                       return "unknown recdata error";
        }
    }
};

} // namespace detail

/// @brief Get the recdata error category singleton.
inline const std::error_category& recdata_category() noexcept {
    static const detail::recdata_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from recdata::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), recdata_category()};
}

/// @brief Create an error_condition from recdata::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), recdata_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief Keyed or field-style access on an absent key.
class KeyNotFoundError : public std::system_error {
public:
    explicit KeyNotFoundError(const std::string& key)
        : std::system_error(make_error_code(errc::key_not_found),
                            "key not found: \"" + key + "\"")
        , key_(key) {}

    KeyNotFoundError(const std::string& key, const std::string& msg)
        : std::system_error(make_error_code(errc::key_not_found), msg)
        , key_(key) {}

    /// @brief The key that was looked up.
    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/// @brief Positional access beyond the bounds of a sequence.
class IndexOutOfRangeError : public std::system_error {
public:
    IndexOutOfRangeError(size_t index, size_t size)
        : std::system_error(make_error_code(errc::index_out_of_range),
                            "sequence index " + std::to_string(index) +
                            " out of range (size=" + std::to_string(size) + ")")
        , index_(index)
        , size_(size) {}

    [[nodiscard]] size_t index() const noexcept { return index_; }
    [[nodiscard]] size_t size() const noexcept { return size_; }

private:
    size_t index_;
    size_t size_;
};

/// @brief Field-style access to a name that belongs to a record operation.
class ReservedNameError : public std::system_error {
public:
    explicit ReservedNameError(const std::string& name)
        : std::system_error(make_error_code(errc::reserved_name),
                            "\"" + name + "\" is a record operation and only "
                            "reachable through keyed access") {}
};

/// @brief Field-style access with a name that is not an identifier.
class InvalidFieldNameError : public std::system_error {
public:
    explicit InvalidFieldNameError(const std::string& name)
        : std::system_error(make_error_code(errc::invalid_field_name),
                            "\"" + name + "\" is not a valid field name") {}
};

/// @brief Type mismatch when accessing a value.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::type_mismatch), msg) {}
};

/// @brief Malformed regular expression passed to search()/search_all().
class PatternError : public std::system_error {
public:
    PatternError(const std::string& pattern, const std::string& reason)
        : std::system_error(make_error_code(errc::invalid_pattern),
                            "invalid search pattern \"" + pattern + "\": " + reason) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [val, ec] = record.try_at("name");
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace recdata

// Register recdata::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<recdata::errc> : true_type {};
} // namespace std
