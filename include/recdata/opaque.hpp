#pragma once

/// @file opaque.hpp
/// @brief Foreign values stored in records and sequences.
///
/// An Opaque supplies its own renderings, truthiness and equality, which is
/// how values of types the library does not know still print and compare.
/// NumericArray is the stock implementation for numeric arrays, compared
/// element-wise.

#include "detail/number.hpp"

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace recdata {

class Opaque {
public:
    virtual ~Opaque() = default;

    /// Single-line debug form.
    [[nodiscard]] virtual std::string repr() const = 0;

    /// Display form; may span several lines.
    [[nodiscard]] virtual std::string str() const { return repr(); }

    /// Truthiness, consulted by flags-style display.
    [[nodiscard]] virtual bool truthy() const { return true; }

    /// Equality against another foreign value. Identity by default.
    [[nodiscard]] virtual bool equals(const Opaque& other) const { return this == &other; }
};

/// @brief Fixed list of doubles with element-wise equality.
class NumericArray : public Opaque {
public:
    NumericArray() = default;
    explicit NumericArray(std::vector<double> data) : data_(std::move(data)) {}
    NumericArray(std::initializer_list<double> init) : data_(init) {}

    [[nodiscard]] const std::vector<double>& data() const noexcept { return data_; }
    [[nodiscard]] size_t size() const noexcept { return data_.size(); }

    std::string repr() const override {
        std::string out = "array([";
        for (size_t i = 0; i < data_.size(); ++i) {
            if (i > 0) out += ", ";
            detail::append_float(out, data_[i]);
        }
        out += "])";
        return out;
    }

    bool truthy() const override { return !data_.empty(); }

    bool equals(const Opaque& other) const override {
        const auto* o = dynamic_cast<const NumericArray*>(&other);
        return o != nullptr && o->data_ == data_;
    }

private:
    std::vector<double> data_;
};

} // namespace recdata
