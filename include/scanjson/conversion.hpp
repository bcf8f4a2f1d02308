#pragma once

/// @file conversion.hpp
/// @brief Literal classification and scalar value conversion.
///
/// classify_scalar() decides what an extracted, non-string token is. The
/// to_*() converters turn an already classified token into a native value;
/// they trust the classification and do not re-run the grammar.
///
/// @code
///   scanjson::FixedBuffer<32> tok;
///   if (scanjson::extract_token(doc, pos, tok, in_array) &&
///       scanjson::classify_scalar(tok.view()) == scanjson::TokenKind::Int) {
///       auto [n, ec] = scanjson::to_integer(tok.view());
///   }
/// @endcode

#include "config.hpp"
#include "error.hpp"
#include "number.hpp"
#include "types.hpp"

#include <cerrno>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>

namespace scanjson {

// ─── Literal classifiers ─────────────────────────────────────────────────

/// @brief Exact, case-sensitive match against "true" or "false".
inline bool is_bool(std::string_view token) noexcept {
    return token == "true" || token == "false";
}

/// @brief Exact, case-sensitive match against "null".
inline bool is_null(std::string_view token) noexcept {
    return token == "null";
}

/// @brief Classify an extracted non-string token.
///
/// Tests run in a fixed order: integer, float, bool, null. Returns
/// TokenKind::Invalid when none matches.
inline TokenKind classify_scalar(std::string_view token) noexcept {
    switch (scan_number(token)) {
        case NumberForm::Integer:  return TokenKind::Int;
        case NumberForm::Floating: return TokenKind::Float;
        case NumberForm::Invalid:  break;
    }
    if (is_bool(token)) return TokenKind::Bool;
    if (is_null(token)) return TokenKind::Null;
    return TokenKind::Invalid;
}

// ─── Value conversion ────────────────────────────────────────────────────

/// @brief Parse a token accepted by is_int() as a signed 64-bit integer.
/// Values outside int64_t report errc::integer_overflow.
inline result<int64_t> to_integer(std::string_view token) noexcept {
    int64_t value = 0;
    auto [p, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return {0, make_error_code(errc::integer_overflow)};
    }
    if (ec != std::errc{} || p != token.data() + token.size()) {
        return {0, make_error_code(errc::invalid_numeric_grammar)};
    }
    return {value, {}};
}

namespace detail {

inline result<double> finish_strtod(const char* str, size_t len) noexcept {
    char* end_ptr = nullptr;
    errno = 0;
    double value = std::strtod(str, &end_ptr);
    if (errno == ERANGE) {
        return {0.0, make_error_code(errc::float_out_of_range)};
    }
    if (end_ptr != str + len) {
        return {0.0, make_error_code(errc::invalid_numeric_grammar)};
    }
    return {value, {}};
}

/// strtod-based conversion for libraries without floating from_chars.
/// strtod needs a terminator: short tokens are copied to the stack, longer
/// ones to a temporary string.
inline result<double> strtod_float(std::string_view token) {
    char buf[64];
    if (SCANJSON_LIKELY(token.size() < sizeof(buf))) {
        std::memcpy(buf, token.data(), token.size());
        buf[token.size()] = '\0';
        return finish_strtod(buf, token.size());
    }
    const std::string num_str(token);
    return finish_strtod(num_str.c_str(), num_str.size());
}

} // namespace detail

/// @brief Parse a token accepted by is_float() (or is_int()) as a double.
/// Magnitudes outside double's range report errc::float_out_of_range.
inline result<double> to_float(std::string_view token) {
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
    double value = 0.0;
    auto [p, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return {0.0, make_error_code(errc::float_out_of_range)};
    }
    if (ec != std::errc{} || p != token.data() + token.size()) {
        return {0.0, make_error_code(errc::invalid_numeric_grammar)};
    }
    return {value, {}};
#else
    return detail::strtod_float(token);
#endif
}

/// @brief True iff @p token is exactly "true".
inline bool to_bool(std::string_view token) noexcept {
    return token == "true";
}

} // namespace scanjson
