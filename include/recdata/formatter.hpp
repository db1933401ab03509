#pragma once

/// @file formatter.hpp
/// @brief Debug and display renderings of values, records and sequences.
///
/// Two forms:
///   - repr(): single line, Record(a=1, b="x") / Sequence([1, 2]). Private
///     keys are always omitted; text and binary values are quoted in full.
///   - str():  multi-line, one entry per line indented by four spaces.
///     Private keys, falsy flags and long text/binary values follow
///     PrintOptions; nested multi-line values are indented as a block.
///
/// A container met again while it is still being rendered on the current
/// call path renders as "<recursion detected>".

#include "detail/active_path.hpp"
#include "detail/escape.hpp"
#include "detail/number.hpp"
#include "detail/utf8.hpp"
#include "print_options.hpp"
#include "record.hpp"
#include "sequence.hpp"
#include "value.hpp"

#include <ostream>
#include <string>
#include <string_view>

namespace recdata {

/// Rendered in place of a container that is already being rendered.
inline constexpr std::string_view kRecursionPlaceholder = "<recursion detected>";

namespace detail {

/// @brief Rendering of one value (and whatever it nests) into a string.
class Formatter {
public:
    Formatter(std::string& out, const PrintOptions& opts) noexcept
        : out_(out), opts_(opts) {}

    // ─── Debug form ─────────────────────────────────────────────────────

    void write_repr(const Value& v) {
        switch (v.kind()) {
            case Kind::Null:
                out_ += "null";
                break;
            case Kind::Bool:
                out_ += v.as_bool() ? "true" : "false";
                break;
            case Kind::Integer:
                append_integer(out_, v.as_integer());
                break;
            case Kind::UInteger:
                append_uinteger(out_, v.as_uinteger());
                break;
            case Kind::Float:
                append_float(out_, v.as_float());
                break;
            case Kind::Text:
                append_quoted_text(out_, v.as_text());
                break;
            case Kind::Bytes:
            case Kind::HexBytes: {
                const auto& b = v.as_bytes();
                append_quoted_bytes(out_, b.data(), b.size());
                break;
            }
            case Kind::Enum: {
                const auto& e = v.as_enum();
                if (e.known()) append_quoted_text(out_, *e.name);
                else append_integer(out_, e.value);
                break;
            }
            case Kind::Record:
                write_record_repr(v.as_record());
                break;
            case Kind::Sequence:
                write_sequence_repr(v.as_sequence());
                break;
            case Kind::Opaque:
                out_ += v.as_opaque().repr();
                break;
        }
    }

    void write_record_repr(const Record& r) {
        PathScope scope(render_path(), &r);
        if (!scope) { out_ += kRecursionPlaceholder; return; }

        out_ += "Record(";
        bool first = true;
        for (const auto& [key, val] : r) {
            if (is_private_key(key)) continue;
            if (!first) out_ += ", ";
            first = false;
            out_ += key;
            out_ += '=';
            write_repr(val);
        }
        out_ += ')';
    }

    void write_sequence_repr(const Sequence& s) {
        PathScope scope(render_path(), &s);
        if (!scope) { out_ += kRecursionPlaceholder; return; }

        out_ += "Sequence([";
        for (size_t i = 0; i < s.size(); ++i) {
            if (i > 0) out_ += ", ";
            write_repr(s.storage()[i]);
        }
        out_ += "])";
    }

    // ─── Display form ───────────────────────────────────────────────────

    void write_str(const Value& v) {
        switch (v.kind()) {
            case Kind::Text:
                out_ += v.as_text();
                break;
            case Kind::Enum: {
                const auto& e = v.as_enum();
                if (e.known()) out_ += *e.name;
                else append_integer(out_, e.value);
                break;
            }
            case Kind::HexBytes: {
                const auto& h = v.as_hex();
                if (h.style == HexStyle::Dump) out_ += hexdump(h.data.data(), h.data.size());
                else append_hex_inline(out_, h.data.data(), h.data.size());
                break;
            }
            case Kind::Record:
                write_record_str(v.as_record());
                break;
            case Kind::Sequence:
                write_sequence_str(v.as_sequence());
                break;
            case Kind::Opaque:
                out_ += v.as_opaque().str();
                break;
            default:
                write_repr(v);
                break;
        }
    }

    void write_record_str(const Record& r) {
        PathScope scope(render_path(), &r);
        if (!scope) { out_ += kRecursionPlaceholder; return; }

        out_ += "Record:";
        const bool flags = r.is_flags();
        for (const auto& [key, val] : r) {
            if (is_private_key(key) && !opts_.private_entries) continue;
            if (flags && !opts_.false_flags && !val.truthy()) continue;
            out_ += kIndent;
            out_ += key;
            out_ += " = ";
            write_entry(val);
        }
    }

    void write_sequence_str(const Sequence& s) {
        PathScope scope(render_path(), &s);
        if (!scope) { out_ += kRecursionPlaceholder; return; }

        out_ += "Sequence:";
        for (const auto& item : s) {
            out_ += kIndent;
            write_indented([&](Formatter& f) { f.write_str(item); });
        }
    }

private:
    static constexpr std::string_view kIndent = "\n    ";

    std::string& out_;
    const PrintOptions& opts_;

    /// Value on the right of "key = ": enums tagged, text and binary capped,
    /// everything else in its display form indented as a block.
    void write_entry(const Value& v) {
        switch (v.kind()) {
            case Kind::Enum: {
                const auto& e = v.as_enum();
                out_ += "(enum) ";
                if (e.known()) out_ += *e.name;
                else out_ += "(unknown)";
                out_ += ' ';
                append_integer(out_, e.value);
                break;
            }
            case Kind::Bytes: {
                const auto& b = v.as_bytes();
                const size_t cap = opts_.bytes_cap;
                if (b.size() <= cap || opts_.full_strings) {
                    append_quoted_bytes(out_, b.data(), b.size());
                    write_total(b.size(), false);
                } else {
                    append_quoted_bytes(out_, b.data(), cap);
                    write_total(b.size(), true);
                }
                break;
            }
            case Kind::Text: {
                const auto& t = v.as_text();
                const size_t len = utf8::length(t);
                if (len <= opts_.text_cap || opts_.full_strings) {
                    append_quoted_text(out_, t);
                    write_total(len, false);
                } else {
                    append_quoted_text(out_, utf8::prefix(t, opts_.text_cap));
                    write_total(len, true);
                }
                break;
            }
            default:
                write_indented([&](Formatter& f) { f.write_str(v); });
                break;
        }
    }

    void write_total(size_t total, bool truncated) {
        out_ += truncated ? "... (truncated, total " : " (total ";
        append_uinteger(out_, total);
        out_ += ')';
    }

    /// Render into a scratch buffer, then copy it with every line break
    /// followed by one indentation level.
    template <typename Fn>
    void write_indented(Fn&& fn) {
        std::string text;
        Formatter nested(text, opts_);
        fn(nested);
        size_t start = 0;
        for (size_t nl = text.find('\n'); nl != std::string::npos; nl = text.find('\n', start)) {
            out_.append(text, start, nl - start);
            out_ += kIndent;
            start = nl + 1;
        }
        out_.append(text, start, std::string::npos);
    }
};

} // namespace detail

// ─── Rendering entry points ────────────────────────────────────────────

inline std::string Value::repr() const {
    std::string out;
    detail::Formatter(out, global_print_options()).write_repr(*this);
    return out;
}

inline std::string Value::str() const {
    return str(global_print_options());
}

inline std::string Value::str(const PrintOptions& opts) const {
    std::string out;
    detail::Formatter(out, opts).write_str(*this);
    return out;
}

inline std::string Record::repr() const {
    std::string out;
    detail::Formatter(out, global_print_options()).write_record_repr(*this);
    return out;
}

inline std::string Record::str() const {
    return str(global_print_options());
}

inline std::string Record::str(const PrintOptions& opts) const {
    std::string out;
    detail::Formatter(out, opts).write_record_str(*this);
    return out;
}

inline std::string Sequence::repr() const {
    std::string out;
    detail::Formatter(out, global_print_options()).write_sequence_repr(*this);
    return out;
}

inline std::string Sequence::str() const {
    return str(global_print_options());
}

inline std::string Sequence::str(const PrintOptions& opts) const {
    std::string out;
    detail::Formatter(out, opts).write_sequence_str(*this);
    return out;
}

/// @brief Display form of a value.
inline std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << value.str();
}

/// @brief Display form of a record.
inline std::ostream& operator<<(std::ostream& os, const Record& record) {
    return os << record.str();
}

/// @brief Display form of a sequence.
inline std::ostream& operator<<(std::ostream& os, const Sequence& seq) {
    return os << seq.str();
}

} // namespace recdata
