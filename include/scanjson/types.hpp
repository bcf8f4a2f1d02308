#pragma once

/// @file types.hpp
/// @brief Token classification and cell type tags.

#include <cstdint>

namespace scanjson {

/// @brief Type tag the container layer stores next to each decoded value.
///
/// Arrays are stored by the container layer as objects keyed by index, so
/// there is no separate array tag.
enum class CellType : uint8_t {
    Invalid = 0,
    String  = 1,
    Int     = 2,
    Float   = 3,
    Bool    = 4,
    Null    = 5,
    Object  = 6
};

/// @brief Returns the string representation of a cell type.
inline const char* cell_type_name(CellType t) noexcept {
    switch (t) {
        case CellType::Invalid: return "invalid";
        case CellType::String:  return "string";
        case CellType::Int:     return "int";
        case CellType::Float:   return "float";
        case CellType::Bool:    return "bool";
        case CellType::Null:    return "null";
        case CellType::Object:  return "object";
    }
    return "unknown";
}

/// @brief Result of classifying the token at the cursor.
///
/// Whitespace, String and the four structural kinds come from raw
/// lookahead (peek_token). Int, Float, Bool and Null are only produced by
/// classify_scalar() on an already extracted candidate; lookahead reports
/// such tokens as Scalar.
enum class TokenKind : uint8_t {
    Invalid     = 0,
    End         = 1,
    Whitespace  = 2,
    String      = 3,
    Int         = 4,
    Float       = 5,
    Bool        = 6,
    Null        = 7,
    ObjectStart = 8,
    ObjectEnd   = 9,
    ArrayStart  = 10,
    ArrayEnd    = 11,
    Scalar      = 12
};

/// @brief Returns the string representation of a token kind.
inline const char* token_kind_name(TokenKind k) noexcept {
    switch (k) {
        case TokenKind::Invalid:     return "invalid";
        case TokenKind::End:         return "end";
        case TokenKind::Whitespace:  return "whitespace";
        case TokenKind::String:      return "string";
        case TokenKind::Int:         return "int";
        case TokenKind::Float:       return "float";
        case TokenKind::Bool:        return "bool";
        case TokenKind::Null:        return "null";
        case TokenKind::ObjectStart: return "object-start";
        case TokenKind::ObjectEnd:   return "object-end";
        case TokenKind::ArrayStart:  return "array-start";
        case TokenKind::ArrayEnd:    return "array-end";
        case TokenKind::Scalar:      return "scalar";
    }
    return "unknown";
}

/// @brief Cell type a value of the given kind is stored as.
/// Kinds that never start a value map to CellType::Invalid.
constexpr CellType cell_type_of(TokenKind k) noexcept {
    switch (k) {
        case TokenKind::String:      return CellType::String;
        case TokenKind::Int:         return CellType::Int;
        case TokenKind::Float:       return CellType::Float;
        case TokenKind::Bool:        return CellType::Bool;
        case TokenKind::Null:        return CellType::Null;
        case TokenKind::ObjectStart:
        case TokenKind::ArrayStart:  return CellType::Object;
        default:                     return CellType::Invalid;
    }
}

} // namespace scanjson
