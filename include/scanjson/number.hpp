#pragma once

/// @file number.hpp
/// @brief Single-pass integer and float grammar validators.
///
/// One automaton covers both grammars:
///
///   integer: -?(0|[1-9][0-9]*)
///   float:   -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
///            with at least one of the fraction or exponent parts
///
/// The scan is left to right, one table lookup per byte, no backtracking.
/// The final state decides the form: a token that ends in the integer part
/// is an integer, one that ends after fraction or exponent digits is a
/// float, anything else is invalid.

#include <cstdint>
#include <string_view>

namespace scanjson {

/// @brief Grammar a numeric token conforms to.
enum class NumberForm : uint8_t {
    Invalid  = 0,
    Integer  = 1,
    Floating = 2
};

namespace detail {

/// Automaton states.
enum class NumState : uint8_t {
    Start,        ///< nothing consumed
    Sign,         ///< leading '-'
    Zero,         ///< integer part is a single '0'
    IntDigits,    ///< integer part [1-9][0-9]*
    Dot,          ///< '.' seen, fraction digit required
    FracDigits,   ///< at least one fraction digit
    Exponent,     ///< 'e'/'E' seen, sign or digit required
    ExponentSign, ///< exponent sign seen, digit required
    ExpDigits,    ///< at least one exponent digit
    Reject,       ///< dead state
    Count
};

/// Input byte classes.
enum class NumClass : uint8_t {
    Minus,
    Plus,
    Zero,
    NonZero,
    Dot,
    Exp,
    Other,
    Count
};

constexpr NumClass classify_num_byte(char c) noexcept {
    switch (c) {
        case '-': return NumClass::Minus;
        case '+': return NumClass::Plus;
        case '0': return NumClass::Zero;
        case '.': return NumClass::Dot;
        case 'e': case 'E': return NumClass::Exp;
        default:
            return (c >= '1' && c <= '9') ? NumClass::NonZero : NumClass::Other;
    }
}

constexpr auto kNumStates  = static_cast<size_t>(NumState::Count);
constexpr auto kNumClasses = static_cast<size_t>(NumClass::Count);

/// Transition table, indexed [state][class].
/// Columns: Minus, Plus, Zero, NonZero, Dot, Exp, Other
inline constexpr NumState kNumTransitions[kNumStates][kNumClasses] = {
    // Start: optional '-', then the integer part
    { NumState::Sign,   NumState::Reject, NumState::Zero,       NumState::IntDigits,
      NumState::Reject, NumState::Reject, NumState::Reject },
    // Sign
    { NumState::Reject, NumState::Reject, NumState::Zero,       NumState::IntDigits,
      NumState::Reject, NumState::Reject, NumState::Reject },
    // Zero: no further integer digits after a leading zero
    { NumState::Reject, NumState::Reject, NumState::Reject,     NumState::Reject,
      NumState::Dot,    NumState::Exponent, NumState::Reject },
    // IntDigits
    { NumState::Reject, NumState::Reject, NumState::IntDigits,  NumState::IntDigits,
      NumState::Dot,    NumState::Exponent, NumState::Reject },
    // Dot
    { NumState::Reject, NumState::Reject, NumState::FracDigits, NumState::FracDigits,
      NumState::Reject, NumState::Reject, NumState::Reject },
    // FracDigits
    { NumState::Reject, NumState::Reject, NumState::FracDigits, NumState::FracDigits,
      NumState::Reject, NumState::Exponent, NumState::Reject },
    // Exponent: the only place a sign may appear after the first byte
    { NumState::ExponentSign, NumState::ExponentSign, NumState::ExpDigits, NumState::ExpDigits,
      NumState::Reject, NumState::Reject, NumState::Reject },
    // ExponentSign
    { NumState::Reject, NumState::Reject, NumState::ExpDigits,  NumState::ExpDigits,
      NumState::Reject, NumState::Reject, NumState::Reject },
    // ExpDigits
    { NumState::Reject, NumState::Reject, NumState::ExpDigits,  NumState::ExpDigits,
      NumState::Reject, NumState::Reject, NumState::Reject },
    // Reject
    { NumState::Reject, NumState::Reject, NumState::Reject,     NumState::Reject,
      NumState::Reject, NumState::Reject, NumState::Reject },
};

constexpr NumState num_step(NumState s, char c) noexcept {
    return kNumTransitions[static_cast<size_t>(s)]
                          [static_cast<size_t>(classify_num_byte(c))];
}

} // namespace detail

/// @brief Run the number automaton over the whole token.
constexpr NumberForm scan_number(std::string_view token) noexcept {
    detail::NumState s = detail::NumState::Start;
    for (char c : token) {
        s = detail::num_step(s, c);
        if (s == detail::NumState::Reject) return NumberForm::Invalid;
    }
    switch (s) {
        case detail::NumState::Zero:
        case detail::NumState::IntDigits:
            return NumberForm::Integer;
        case detail::NumState::FracDigits:
        case detail::NumState::ExpDigits:
            return NumberForm::Floating;
        default:
            return NumberForm::Invalid;
    }
}

/// @brief True iff @p token matches -?(0|[1-9][0-9]*).
constexpr bool is_int(std::string_view token) noexcept {
    return scan_number(token) == NumberForm::Integer;
}

/// @brief True iff @p token is a JSON number with a fraction or exponent.
/// Bare integers are rejected; classify them with is_int() first.
constexpr bool is_float(std::string_view token) noexcept {
    return scan_number(token) == NumberForm::Floating;
}

/// @brief True if @p token could only have been meant as a number.
/// Used to pick invalid_numeric_grammar over invalid_literal on failure.
constexpr bool looks_numeric(std::string_view token) noexcept {
    if (token.empty()) return false;
    const char c = token.front();
    return c == '-' || c == '.' || (c >= '0' && c <= '9');
}

} // namespace scanjson
