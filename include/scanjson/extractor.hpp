#pragma once

/// @file extractor.hpp
/// @brief Token extractors: copy one token out of the buffer and move the
///        cursor onto the boundary that terminates it.
///
/// Contract shared by both extractors:
///   - On success the token text is in @p out and @p pos sits ON the
///     boundary character (',', ':', '}' or ']'), not past it. The caller
///     inspects that character to decide what comes next.
///   - On failure @p out is left untouched, @p pos marks the offending byte
///     and @p ec says why. The decode pass must be abandoned.
///   - The cursor only ever moves forward and never past buf.size().
///   - @p out must not alias @p buf.

#include "buffer.hpp"
#include "config.hpp"
#include "error.hpp"
#include "escape.hpp"
#include "scanner.hpp"

#include <cstddef>
#include <string_view>
#include <system_error>

namespace scanjson {

namespace detail {

/// Control bytes that may not appear raw inside a string.
constexpr bool is_disallowed_control(char c) noexcept {
    return c == '\b' || c == '\f' || c == '\n' || c == '\r' || c == '\t';
}

/// Skip whitespace after a token and require a boundary.
inline bool finish_at_boundary(std::string_view buf, size_t& pos,
                               bool in_array, std::error_code& ec) noexcept {
    if (SCANJSON_UNLIKELY(!skip_whitespace(buf, pos))) {
        ec = errc::unterminated_token;
        return false;
    }
    if (SCANJSON_UNLIKELY(!is_at_boundary(buf, pos, in_array))) {
        ec = errc::malformed_boundary;
        return false;
    }
    return true;
}

} // namespace detail

// ─── Generic scalar extractor ────────────────────────────────────────────

/// @brief Extract a non-string scalar (number, true, false, null).
///
/// Scans from @p pos until whitespace or a boundary, skips trailing
/// whitespace and requires a boundary there. The raw text is copied to
/// @p out; classify it with classify_scalar().
///
/// @param in_array  true when extracting an array element: a colon then
///                  does not terminate the token.
[[nodiscard]] inline bool extract_token(std::string_view buf, size_t& pos,
                                        TokenBuffer& out, bool in_array,
                                        std::error_code& ec) noexcept {
    ec.clear();
    const size_t start = pos;
    while (pos < buf.size() && !is_whitespace(buf, pos) &&
           !is_at_boundary(buf, pos, in_array)) {
        if (SCANJSON_UNLIKELY(pos - start == out.capacity())) {
            ec = errc::token_too_long;
            return false;
        }
        ++pos;
    }
    const size_t end = pos;

    if (SCANJSON_UNLIKELY(end == start)) {
        ec = pos >= buf.size() ? errc::unterminated_token
                               : errc::unexpected_character;
        return false;
    }
    if (!detail::finish_at_boundary(buf, pos, in_array, ec)) return false;

    out.assign(buf.substr(start, end - start));
    return true;
}

[[nodiscard]] inline bool extract_token(std::string_view buf, size_t& pos,
                                        TokenBuffer& out,
                                        bool in_array) noexcept {
    std::error_code ec;
    return extract_token(buf, pos, out, in_array, ec);
}

// ─── String extractor ────────────────────────────────────────────────────

/// @brief Extract a double-quoted string and unescape it into @p out.
///
/// @p pos must be on the opening quote. A quote closes the string only when
/// preceded by an even number of consecutive backslashes, so "a\\" ends
/// after one escaped backslash while "a\"b" continues past the escaped
/// quote. Raw backspace, form-feed, newline, CR or tab inside the string is
/// rejected. Only the unescaped length has to fit in @p out.
[[nodiscard]] inline bool extract_string(std::string_view buf, size_t& pos,
                                         TokenBuffer& out, bool in_array,
                                         std::error_code& ec) noexcept {
    ec.clear();
    if (SCANJSON_UNLIKELY(!is_string_start(buf, pos))) {
        ec = errc::unexpected_character;
        return false;
    }
    ++pos;
    const size_t start = pos;

    size_t backslashes = 0;
    for (;;) {
        if (SCANJSON_UNLIKELY(pos >= buf.size())) {
            ec = errc::unterminated_token;
            return false;
        }
        const char c = buf[pos];
        if (c == '"' && backslashes % 2 == 0) break;
        if (SCANJSON_UNLIKELY(detail::is_disallowed_control(c))) {
            ec = errc::disallowed_control_character;
            return false;
        }
        backslashes = (c == '\\') ? backslashes + 1 : 0;
        ++pos;
    }

    const std::string_view raw = buf.substr(start, pos - start);
    if (SCANJSON_UNLIKELY(unescaped_length(raw) > out.capacity())) {
        ec = errc::token_too_long;
        return false;
    }

    ++pos; // closing quote
    if (!detail::finish_at_boundary(buf, pos, in_array, ec)) return false;

    unescape(raw, out);
    return true;
}

[[nodiscard]] inline bool extract_string(std::string_view buf, size_t& pos,
                                         TokenBuffer& out,
                                         bool in_array) noexcept {
    std::error_code ec;
    return extract_string(buf, pos, out, in_array, ec);
}

} // namespace scanjson
