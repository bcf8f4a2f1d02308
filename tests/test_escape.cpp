/// @file test_escape.cpp
/// @brief Unit tests for the escape table and (un)escaping.

#include <scanjson/scanjson.hpp>

#include <gtest/gtest.h>

#include <string>
#include <string_view>

using namespace scanjson;

// ═══════════════════════════════════════════════════════════════════════════════
// Table
// ═══════════════════════════════════════════════════════════════════════════════

TEST(EscapeTable, OrderAndContents) {
    ASSERT_EQ(kEscapeTableSize, 8u);
    // Backslash must be first.
    EXPECT_EQ(kEscapeTable[0].literal, '\\');
    EXPECT_EQ(kEscapeTable[0].code, '\\');
    EXPECT_EQ(kEscapeTable[1].literal, '"');
    EXPECT_EQ(kEscapeTable[2].literal, '/');
    EXPECT_EQ(kEscapeTable[3].literal, '\b');
    EXPECT_EQ(kEscapeTable[3].code, 'b');
    EXPECT_EQ(kEscapeTable[4].literal, '\f');
    EXPECT_EQ(kEscapeTable[5].literal, '\n');
    EXPECT_EQ(kEscapeTable[6].literal, '\r');
    EXPECT_EQ(kEscapeTable[7].literal, '\t');
    EXPECT_EQ(kEscapeTable[7].code, 't');
}

// ═══════════════════════════════════════════════════════════════════════════════
// Escaping
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Escape, PlainTextUnchanged) {
    FixedBuffer<32> out;
    ASSERT_TRUE(escape("hello world", out));
    EXPECT_EQ(out.view(), "hello world");
}

TEST(Escape, EverySpecialCharacter) {
    FixedBuffer<32> out;
    ASSERT_TRUE(escape("\\\"/\b\f\n\r\t", out));
    EXPECT_EQ(out.view(), R"(\\\"\/\b\f\n\r\t)");
}

TEST(Escape, BackslashBeforeLetterIsDoubled) {
    FixedBuffer<32> out;
    ASSERT_TRUE(escape("C:\\new", out));
    EXPECT_EQ(out.view(), R"(C:\\new)");
}

TEST(Escape, IntoBufferFromAnotherBuffer) {
    FixedBuffer<16> src("a\"b\\");
    FixedBuffer<16> dst;
    ASSERT_TRUE(escape(src.view(), dst));
    EXPECT_EQ(dst.view(), "a\\\"b\\\\");
    EXPECT_EQ(src.view(), "a\"b\\");
}

TEST(Escape, EscapedLength) {
    EXPECT_EQ(escaped_length(""), 0u);
    EXPECT_EQ(escaped_length("abc"), 3u);
    EXPECT_EQ(escaped_length("a\"b\n"), 6u);
}

TEST(Escape, DoesNotFitFailsAndClears) {
    FixedBuffer<3> out;
    EXPECT_FALSE(escape("a\"b", out)); // needs 4
    EXPECT_TRUE(out.empty());
    EXPECT_TRUE(escape("abc", out));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Unescaping
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Unescape, EverySequence) {
    FixedBuffer<32> out;
    ASSERT_TRUE(unescape(R"(\\\"\/\b\f\n\r\t)", out));
    EXPECT_EQ(out.view(), "\\\"/\b\f\n\r\t");
}

TEST(Unescape, EscapedBackslashIsNotReusedForNextSequence) {
    FixedBuffer<32> out;
    ASSERT_TRUE(unescape(R"(\\n)", out));
    EXPECT_EQ(out.view(), "\\n");
    ASSERT_TRUE(unescape(R"(\\\\")", out));
    EXPECT_EQ(out.view(), "\\\\\"");
}

TEST(Unescape, UnicodeSequencesPassThrough) {
    FixedBuffer<32> out;
    ASSERT_TRUE(unescape(R"(\u00e9x)", out));
    EXPECT_EQ(out.view(), R"(\u00e9x)");
}

TEST(Unescape, UnknownSequenceAndTrailingBackslashKept) {
    FixedBuffer<32> out;
    ASSERT_TRUE(unescape(R"(a\qb\)", out));
    EXPECT_EQ(out.view(), R"(a\qb\)");
}

TEST(Unescape, UnescapedLength) {
    EXPECT_EQ(unescaped_length(R"(abc)"), 3u);
    EXPECT_EQ(unescaped_length(R"(a\nb)"), 3u);
    EXPECT_EQ(unescaped_length(R"(\\\\)"), 2u);
    EXPECT_EQ(unescaped_length(R"(\u0041)"), 6u);
    EXPECT_EQ(unescaped_length(R"(\)"), 1u);
}

TEST(Unescape, DoesNotFitFailsAndClears) {
    FixedBuffer<2> out;
    EXPECT_FALSE(unescape("abc", out));
    EXPECT_TRUE(out.empty());
    EXPECT_TRUE(unescape(R"(a\n)", out));
    EXPECT_EQ(out.view(), "a\n");
}

TEST(Unescape, InPlace) {
    FixedBuffer<32> buf(R"(tab\there \"q\" \\ end)");
    unescape(buf);
    EXPECT_EQ(buf.view(), "tab\there \"q\" \\ end");
    EXPECT_EQ(buf.c_str()[buf.size()], '\0');
}

// ═══════════════════════════════════════════════════════════════════════════════
// Round trip: unescape(escape(s)) == s
// ═══════════════════════════════════════════════════════════════════════════════

class EscapeRoundTrip : public ::testing::TestWithParam<std::string> {};

TEST_P(EscapeRoundTrip, Identity) {
    const std::string& s = GetParam();
    FixedBuffer<128> escaped;
    FixedBuffer<128> back;
    ASSERT_TRUE(escape(s, escaped));
    ASSERT_TRUE(unescape(escaped.view(), back));
    EXPECT_EQ(back.view(), s);

    // In-place variant agrees.
    unescape(escaped);
    EXPECT_EQ(escaped.view(), s);
}

INSTANTIATE_TEST_SUITE_P(
    Specials, EscapeRoundTrip,
    ::testing::Values(
        std::string(""),
        std::string("plain"),
        std::string("\\"),
        std::string("\\n"),
        std::string("\\\\\""),
        std::string("a\"b/c\bd\fe\nf\rg\th"),
        std::string("\\t\t\\\t"),
        std::string("path\\to\\file.txt"),
        std::string("\"\"\"///\\\\\\"),
        std::string("end with backslash\\")));
