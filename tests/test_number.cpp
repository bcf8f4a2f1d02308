/// @file test_number.cpp
/// @brief Unit tests for the integer / float grammar automaton.

#include <scanjson/scanjson.hpp>

#include <gtest/gtest.h>

#include <string>
#include <string_view>

using namespace scanjson;

// ═══════════════════════════════════════════════════════════════════════════════
// Integers
// ═══════════════════════════════════════════════════════════════════════════════

TEST(NumberInt, Zero) {
    EXPECT_TRUE(is_int("0"));
    EXPECT_TRUE(is_int("-0"));
}

TEST(NumberInt, LeadingZeroRejected) {
    EXPECT_FALSE(is_int("00"));
    EXPECT_FALSE(is_int("01"));
    EXPECT_FALSE(is_int("-01"));
}

TEST(NumberInt, PlainDigits) {
    EXPECT_TRUE(is_int("7"));
    EXPECT_TRUE(is_int("42"));
    EXPECT_TRUE(is_int("-100"));
    EXPECT_TRUE(is_int("9223372036854775808")); // grammar has no range limit
}

TEST(NumberInt, EmptyAndSignOnly) {
    EXPECT_FALSE(is_int(""));
    EXPECT_FALSE(is_int("-"));
}

TEST(NumberInt, NonDigits) {
    EXPECT_FALSE(is_int("1a"));
    EXPECT_FALSE(is_int("a1"));
    EXPECT_FALSE(is_int("+1"));
    EXPECT_FALSE(is_int("1-"));
    EXPECT_FALSE(is_int("--1"));
    EXPECT_FALSE(is_int("1 "));
    EXPECT_FALSE(is_int("0x10"));
}

TEST(NumberInt, FloatsAreNotIntegers) {
    EXPECT_FALSE(is_int("1.0"));
    EXPECT_FALSE(is_int("1e5"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Floats
// ═══════════════════════════════════════════════════════════════════════════════

TEST(NumberFloat, Fractions) {
    EXPECT_TRUE(is_float("0.0"));
    EXPECT_TRUE(is_float("-0.5"));
    EXPECT_TRUE(is_float("3.14159"));
    EXPECT_TRUE(is_float("10.01"));
}

TEST(NumberFloat, Exponents) {
    EXPECT_TRUE(is_float("1e10"));
    EXPECT_TRUE(is_float("1E10"));
    EXPECT_TRUE(is_float("1e+10"));
    EXPECT_TRUE(is_float("1e-10"));
    EXPECT_TRUE(is_float("-2.5E-3"));
    EXPECT_TRUE(is_float("1e00"));
}

TEST(NumberFloat, ZeroWithExponent) {
    // Legal JSON; the integer part "0" is complete before the marker.
    EXPECT_TRUE(is_float("0e10"));
    EXPECT_TRUE(is_float("-0E-1"));
    EXPECT_TRUE(is_float("0.0e0"));
}

TEST(NumberFloat, BareIntegerRejected) {
    EXPECT_FALSE(is_float("1"));
    EXPECT_FALSE(is_float("0"));
    EXPECT_FALSE(is_float("-12"));
}

TEST(NumberFloat, MissingDigitsAroundDot) {
    EXPECT_FALSE(is_float("1."));
    EXPECT_FALSE(is_float(".1"));
    EXPECT_FALSE(is_float("-.1"));
    EXPECT_FALSE(is_float("1.e5"));
    EXPECT_FALSE(is_float("."));
}

TEST(NumberFloat, MissingDigitsAfterExponent) {
    EXPECT_FALSE(is_float("1e"));
    EXPECT_FALSE(is_float("1e+"));
    EXPECT_FALSE(is_float("1E-"));
    EXPECT_FALSE(is_float("e5"));
    EXPECT_FALSE(is_float("-e5"));
}

TEST(NumberFloat, MisplacedSigns) {
    EXPECT_FALSE(is_float("+1.0"));
    EXPECT_FALSE(is_float("1.-0"));
    EXPECT_FALSE(is_float("1.0-"));
    EXPECT_FALSE(is_float("1e5-"));
    EXPECT_FALSE(is_float("1e+-5"));
    EXPECT_FALSE(is_float("--1.0"));
}

TEST(NumberFloat, LeadingZeroRejected) {
    EXPECT_FALSE(is_float("00.1"));
    EXPECT_FALSE(is_float("01.5"));
    EXPECT_FALSE(is_float("-01e3"));
}

TEST(NumberFloat, RepeatedSections) {
    EXPECT_FALSE(is_float("1.0.0"));
    EXPECT_FALSE(is_float("1e5e5"));
    EXPECT_FALSE(is_float("1e5.0"));
}

TEST(NumberFloat, Garbage) {
    EXPECT_FALSE(is_float(""));
    EXPECT_FALSE(is_float("NaN"));
    EXPECT_FALSE(is_float("Infinity"));
    EXPECT_FALSE(is_float("1.0f"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// scan_number
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ScanNumber, Forms) {
    EXPECT_EQ(scan_number("12"), NumberForm::Integer);
    EXPECT_EQ(scan_number("1.2"), NumberForm::Floating);
    EXPECT_EQ(scan_number("1e2"), NumberForm::Floating);
    EXPECT_EQ(scan_number("1x"), NumberForm::Invalid);
    EXPECT_EQ(scan_number(""), NumberForm::Invalid);
}

TEST(ScanNumber, UsableAtCompileTime) {
    static_assert(is_int("-0"));
    static_assert(!is_int("01"));
    static_assert(is_float("1e10"));
    static_assert(!is_float("1."));
    SUCCEED();
}

TEST(ScanNumber, LongInputsStayLinear) {
    std::string digits = "1" + std::string(4096, '5');
    EXPECT_TRUE(is_int(digits));
    EXPECT_TRUE(is_float(digits + ".5e-7"));
    EXPECT_FALSE(is_float(digits + "."));
}

TEST(ScanNumber, LooksNumeric) {
    EXPECT_TRUE(looks_numeric("-x"));
    EXPECT_TRUE(looks_numeric(".5"));
    EXPECT_TRUE(looks_numeric("0z"));
    EXPECT_FALSE(looks_numeric("tru"));
    EXPECT_FALSE(looks_numeric(""));
}
