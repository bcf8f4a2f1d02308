#pragma once

/// @file error.hpp
/// @brief Error types for scanjson: std::error_code system + DecodeError.
///
/// Dual error reporting:
///   - Via error_code: scanjson::errc enum + json_category() (core, never throws)
///   - Via exception: DecodeError, thrown only by the convenience read()
///
/// Every extractor and predicate in the core reports failure through a bool
/// result and, optionally, an std::error_code out-parameter.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace scanjson {

// =====================================================================
// Source position for decode errors
// =====================================================================

/// @brief Position in the source JSON text.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning
};

/// @brief Compute line/column for a byte offset inside @p buf.
/// Offsets past the end are clamped to buf.size().
inline SourceLocation locate(std::string_view buf, size_t offset) noexcept {
    SourceLocation loc;
    if (offset > buf.size()) offset = buf.size();
    loc.offset = offset;
    for (size_t i = 0; i < offset; ++i) {
        if (buf[i] == '\n') { ++loc.line; loc.column = 1; }
        else { ++loc.column; }
    }
    return loc;
}

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief scanjson error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Token errors (1-49)
    malformed_boundary           = 1,
    unterminated_token           = 2,
    disallowed_control_character = 3,
    invalid_numeric_grammar      = 4,
    invalid_literal              = 5,
    unexpected_character         = 6,
    token_too_long               = 7,

    // Document errors (50-79)
    max_depth_exceeded           = 50,
    trailing_content             = 51,
    reserved_key                 = 52,

    // Conversion errors (80-99)
    integer_overflow             = 80,
    float_out_of_range           = 81,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class json_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "scanjson";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                           return "success";
            case errc::malformed_boundary:           return "token not followed by ',', ':', '}' or ']'";
            case errc::unterminated_token:           return "buffer exhausted inside token";
            case errc::disallowed_control_character: return "unescaped control character in string";
            case errc::invalid_numeric_grammar:      return "invalid number";
            case errc::invalid_literal:              return "invalid literal";
            case errc::unexpected_character:         return "unexpected character";
            case errc::token_too_long:               return "token exceeds buffer capacity";
            case errc::max_depth_exceeded:           return "maximum nesting depth exceeded";
            case errc::trailing_content:             return "trailing content after JSON";
            case errc::reserved_key:                 return "key collides with a reserved meta key";
            case errc::integer_overflow:             return "integer overflow";
            case errc::float_out_of_range:           return "float out of range";
            default:                                 return "unknown scanjson error";
        }
    }
};

} // namespace detail

/// @brief Get the scanjson error category singleton.
inline const std::error_category& json_category() noexcept {
    static const detail::json_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from scanjson::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), json_category()};
}

/// @brief Create an error_condition from scanjson::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), json_category()};
}

// =====================================================================
// Exception type
// =====================================================================

/// @brief Decode error with source position information.
class DecodeError : public std::system_error {
public:
    DecodeError(std::error_code code, SourceLocation loc)
        : std::system_error(code, format_message(loc))
        , location_(loc) {}

    /// @brief Error position in the source text.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

private:
    // std::system_error appends ": " + code.message() to this prefix.
    static std::string format_message(const SourceLocation& loc) {
        return "JSON decode error at line " + std::to_string(loc.line) +
               ", column " + std::to_string(loc.column) +
               " (offset " + std::to_string(loc.offset) + ")";
    }

    SourceLocation location_;
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [val, ec] = scanjson::to_integer(token);
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace scanjson

// Register scanjson::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<scanjson::errc> : true_type {};
} // namespace std
