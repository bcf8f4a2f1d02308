#pragma once

/// @file escape.hpp
/// @brief Escape table and literal <-> escape-sequence substitution.
///
/// The table is ordered and backslash comes first. Escaping consults the
/// table per input byte, so a backslash already present in the input is
/// always doubled before any other sequence is emitted. Unescaping reads
/// each backslash together with the byte after it exactly once, so the
/// output of one substitution is never fed into another: the JSON text
/// \\n decodes to a backslash followed by 'n', not to a newline.

#include "buffer.hpp"

#include <cstddef>
#include <string_view>

namespace scanjson {

/// @brief One row of the escape table.
struct EscapeEntry {
    char literal;   ///< byte as it appears in decoded text
    char code;      ///< byte following the backslash in JSON text
};

/// Ordered escape table. Backslash must stay first.
inline constexpr EscapeEntry kEscapeTable[] = {
    {'\\', '\\'},
    {'"',  '"'},
    {'/',  '/'},
    {'\b', 'b'},
    {'\f', 'f'},
    {'\n', 'n'},
    {'\r', 'r'},
    {'\t', 't'},
};

inline constexpr size_t kEscapeTableSize =
    sizeof(kEscapeTable) / sizeof(kEscapeTable[0]);

namespace detail {

/// Table row whose literal is @p c, or nullptr.
constexpr const EscapeEntry* find_literal(char c) noexcept {
    for (const auto& e : kEscapeTable) {
        if (e.literal == c) return &e;
    }
    return nullptr;
}

/// Table row whose escape code is @p c, or nullptr.
constexpr const EscapeEntry* find_code(char c) noexcept {
    for (const auto& e : kEscapeTable) {
        if (e.code == c) return &e;
    }
    return nullptr;
}

} // namespace detail

// ─── Escaping (literal -> sequence) ──────────────────────────────────────

/// @brief Length @p in would have after escape().
constexpr size_t escaped_length(std::string_view in) noexcept {
    size_t n = in.size();
    for (char c : in) {
        if (detail::find_literal(c)) ++n;
    }
    return n;
}

/// @brief Replace every table literal in @p in by its escape sequence.
/// @p in must not alias @p out.
/// @return false (out cleared) if the result does not fit in @p out.
inline bool escape(std::string_view in, TokenBuffer& out) noexcept {
    out.clear();
    if (escaped_length(in) > out.capacity()) return false;
    for (char c : in) {
        if (const EscapeEntry* e = detail::find_literal(c)) {
            out.push_back('\\');
            out.push_back(e->code);
        } else {
            out.push_back(c);
        }
    }
    return true;
}

// ─── Unescaping (sequence -> literal) ────────────────────────────────────

/// @brief Length @p in would have after unescape().
constexpr size_t unescaped_length(std::string_view in) noexcept {
    size_t n = 0;
    for (size_t i = 0; i < in.size(); ++i, ++n) {
        if (in[i] == '\\' && i + 1 < in.size() && detail::find_code(in[i + 1])) ++i;
    }
    return n;
}

/// @brief Replace every table escape sequence in @p in by its literal.
///
/// Sequences not in the table (\uXXXX included) and a trailing lone
/// backslash are copied unchanged. @p in must not alias @p out; use the
/// in-place overload for that.
/// @return false (out cleared) if the result does not fit in @p out.
inline bool unescape(std::string_view in, TokenBuffer& out) noexcept {
    out.clear();
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '\\' && i + 1 < in.size()) {
            if (const EscapeEntry* e = detail::find_code(in[i + 1])) {
                c = e->literal;
                ++i;
            }
        }
        if (!out.push_back(c)) {
            out.clear();
            return false;
        }
    }
    return true;
}

/// @brief Unescape @p buf in place. Never grows, so it cannot fail.
inline void unescape(TokenBuffer& buf) noexcept {
    char* p = buf.data();
    const size_t n = buf.size();
    size_t w = 0;
    for (size_t r = 0; r < n; ++r) {
        char c = p[r];
        if (c == '\\' && r + 1 < n) {
            if (const EscapeEntry* e = detail::find_code(p[r + 1])) {
                c = e->literal;
                ++r;
            }
        }
        p[w++] = c;
    }
    buf.truncate(w);
}

} // namespace scanjson
