#include <gtest/gtest.h>

#include "types/infer.hpp"

using namespace dsprof;

TEST(TryParseInt64, AcceptsSignedDecimal) {
    EXPECT_EQ(try_parse_int64("42"), 42);
    EXPECT_EQ(try_parse_int64(" -17 "), -17);
    EXPECT_EQ(try_parse_int64("+5"), 5);
    EXPECT_EQ(try_parse_int64("9223372036854775807"), INT64_MAX);
}

TEST(TryParseInt64, RejectsEverythingElse) {
    EXPECT_FALSE(try_parse_int64(""));
    EXPECT_FALSE(try_parse_int64("4.0"));
    EXPECT_FALSE(try_parse_int64("1e3"));
    EXPECT_FALSE(try_parse_int64("++1"));
    EXPECT_FALSE(try_parse_int64("+-5"));
    EXPECT_FALSE(try_parse_int64("+"));
    EXPECT_FALSE(try_parse_int64("12abc"));
    EXPECT_FALSE(try_parse_int64("9223372036854775808")); // overflow
}

TEST(TryParseFloat64, DecimalAndScientific) {
    EXPECT_DOUBLE_EQ(*try_parse_float64("3.5"), 3.5);
    EXPECT_DOUBLE_EQ(*try_parse_float64("-0.25"), -0.25);
    EXPECT_DOUBLE_EQ(*try_parse_float64(".5"), 0.5);
    EXPECT_DOUBLE_EQ(*try_parse_float64("1e3"), 1000.0);
    EXPECT_DOUBLE_EQ(*try_parse_float64("2.5E-2"), 0.025);
    EXPECT_DOUBLE_EQ(*try_parse_float64("7"), 7.0);
}

TEST(TryParseFloat64, RejectsNonFiniteAndJunk) {
    EXPECT_FALSE(try_parse_float64("nan"));
    EXPECT_FALSE(try_parse_float64("inf"));
    EXPECT_FALSE(try_parse_float64("1e999"));
    EXPECT_FALSE(try_parse_float64("1.2.3"));
    EXPECT_FALSE(try_parse_float64("1e"));
    EXPECT_FALSE(try_parse_float64("-"));
    EXPECT_FALSE(try_parse_float64("$5"));
}

TEST(TryParseFloat64, OneSignAtMost) {
    EXPECT_DOUBLE_EQ(*try_parse_float64("+2.5"), 2.5);
    EXPECT_FALSE(try_parse_float64("+-5"));
    EXPECT_FALSE(try_parse_float64("++5"));
    EXPECT_FALSE(try_parse_float64("-+5"));
    EXPECT_FALSE(try_parse_float64("--5"));
}

TEST(TryParseBool, StaysWithinOneVocabulary) {
    const auto& yes_no = bool_vocabularies()[2];
    EXPECT_EQ(try_parse_bool("YES", yes_no), true);
    EXPECT_EQ(try_parse_bool(" no ", yes_no), false);
    EXPECT_FALSE(try_parse_bool("true", yes_no));
}
