#pragma once

/// @file scanner.hpp
/// @brief Boundary and whitespace primitives over a buffer + cursor.
///
/// All functions are pure lookahead except skip_whitespace(), which only
/// moves the cursor forward. The buffer's size is the end-of-data bound;
/// every read is checked against it, no terminator byte is assumed.

#include "config.hpp"
#include "types.hpp"

#include <cstddef>
#include <string_view>

namespace scanjson {

// ─── Single-byte tests ───────────────────────────────────────────────────

/// @brief True iff the byte at @p pos is space, tab, CR or LF.
inline bool is_whitespace(std::string_view buf, size_t pos) noexcept {
    if (SCANJSON_UNLIKELY(pos >= buf.size())) return false;
    const char c = buf[pos];
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

inline bool is_string_start(std::string_view buf, size_t pos) noexcept {
    return pos < buf.size() && buf[pos] == '"';
}

inline bool is_object_start(std::string_view buf, size_t pos) noexcept {
    return pos < buf.size() && buf[pos] == '{';
}

inline bool is_array_start(std::string_view buf, size_t pos) noexcept {
    return pos < buf.size() && buf[pos] == '[';
}

inline bool is_object_end(std::string_view buf, size_t pos) noexcept {
    return pos < buf.size() && buf[pos] == '}';
}

inline bool is_array_end(std::string_view buf, size_t pos) noexcept {
    return pos < buf.size() && buf[pos] == ']';
}

/// @brief True iff the byte at @p pos validly terminates a token.
///
/// Comma, closing brace and closing bracket always do. A colon only does
/// outside arrays: it separates an object key from its value, and array
/// elements never end on one.
inline bool is_at_boundary(std::string_view buf, size_t pos,
                           bool in_array) noexcept {
    if (SCANJSON_UNLIKELY(pos >= buf.size())) return false;
    switch (buf[pos]) {
        case ',':
        case '}':
        case ']':
            return true;
        case ':':
            return !in_array;
        default:
            return false;
    }
}

// ─── Cursor movement ─────────────────────────────────────────────────────

/// @brief Advance @p pos past whitespace.
/// @return false if the buffer is exhausted (malformed end of data).
inline bool skip_whitespace(std::string_view buf, size_t& pos) noexcept {
    while (pos < buf.size() && is_whitespace(buf, pos)) ++pos;
    return pos < buf.size();
}

// ─── Lookahead classification ────────────────────────────────────────────

/// @brief Classify the token starting at @p pos from its first byte.
///
/// Scalars (numbers, true/false/null and garbage) are all reported as
/// TokenKind::Scalar; extract them with extract_token() and refine with
/// classify_scalar().
inline TokenKind peek_token(std::string_view buf, size_t pos) noexcept {
    if (pos >= buf.size()) return TokenKind::End;
    switch (buf[pos]) {
        case ' ': case '\t': case '\r': case '\n':
            return TokenKind::Whitespace;
        case '"': return TokenKind::String;
        case '{': return TokenKind::ObjectStart;
        case '}': return TokenKind::ObjectEnd;
        case '[': return TokenKind::ArrayStart;
        case ']': return TokenKind::ArrayEnd;
        default:  return TokenKind::Scalar;
    }
}

} // namespace scanjson
