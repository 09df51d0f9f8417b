/**
 * @file test_parse.cpp
 * @brief Unit tests for string typing (GoogleTest)
 *
 * parse_value() types --set values:
 * - Only "true"/"false" for booleans (not yes/no/on/off)
 * - Only "null" for null (not none/nil)
 * - Integers and decimals with a fractional part
 * - JSON arrays, objects and double-quoted strings
 *
 * resolve_plain_scalar() types unquoted YAML scalars with the YAML 1.2
 * core schema.
 */

#include <gtest/gtest.h>
#include "strata/Parse.hpp"
#include "strata/Value.hpp"

#include <cmath>
#include <cstdint>

using namespace strata;

// ============================================================================
// Booleans and null
// ============================================================================

TEST(ParseValue, Booleans) {
    EXPECT_EQ(parse_value("true"), true);
    EXPECT_EQ(parse_value("True"), true);
    EXPECT_EQ(parse_value("FALSE"), false);
    EXPECT_EQ(parse_value("yes"), "yes");
    EXPECT_EQ(parse_value("off"), "off");
}

TEST(ParseValue, Null) {
    EXPECT_TRUE(parse_value("null").is_null());
    EXPECT_TRUE(parse_value("NULL").is_null());
    EXPECT_EQ(parse_value("none"), "none");
}

// ============================================================================
// Numbers
// ============================================================================

TEST(ParseValue, Integers) {
    EXPECT_EQ(parse_value("42"), 42);
    EXPECT_EQ(parse_value("-7"), -7);
    EXPECT_TRUE(parse_value("0").is_number_integer());
    EXPECT_EQ(parse_value("1"), 1);
}

TEST(ParseValue, Floats) {
    auto v = parse_value("3.14");
    ASSERT_TRUE(v.is_number_float());
    EXPECT_DOUBLE_EQ(v.get<double>(), 3.14);
    EXPECT_TRUE(parse_value("-0.5").is_number_float());
    EXPECT_TRUE(parse_value("1.0e3").is_number_float());
}

TEST(ParseValue, NumberLookalikesStayStrings) {
    EXPECT_EQ(parse_value("1.2.3"), "1.2.3");
    EXPECT_EQ(parse_value("0x10"), "0x10");
    EXPECT_EQ(parse_value("12abc"), "12abc");
    EXPECT_EQ(parse_value("99999999999999999999"), "99999999999999999999");
}

// ============================================================================
// Strings and JSON
// ============================================================================

TEST(ParseValue, EmptyIsEmptyString) {
    EXPECT_EQ(parse_value(""), "");
}

TEST(ParseValue, PlainStrings) {
    EXPECT_EQ(parse_value("localhost"), "localhost");
    EXPECT_EQ(parse_value("hello world"), "hello world");
}

TEST(ParseValue, QuotedStrings) {
    EXPECT_EQ(parse_value("\"42\""), "42");
    EXPECT_EQ(parse_value("\"true\""), "true");
    EXPECT_EQ(parse_value("\"a\\nb\""), "a\nb");
}

TEST(ParseValue, JsonCompounds) {
    EXPECT_EQ(parse_value("[1,2,3]"), Value({1, 2, 3}));
    auto obj = parse_value("{\"a\": {\"b\": 1}}");
    ASSERT_TRUE(obj.is_object());
    EXPECT_EQ(obj["a"]["b"], 1);
}

TEST(ParseValue, MalformedJsonStaysString) {
    EXPECT_EQ(parse_value("[1,2"), "[1,2");
    EXPECT_EQ(parse_value("{not json}"), "{not json}");
}

// ============================================================================
// YAML core schema
// ============================================================================

TEST(ResolvePlainScalar, Nulls) {
    EXPECT_TRUE(resolve_plain_scalar("").is_null());
    EXPECT_TRUE(resolve_plain_scalar("~").is_null());
    EXPECT_TRUE(resolve_plain_scalar("null").is_null());
    EXPECT_TRUE(resolve_plain_scalar("Null").is_null());
    EXPECT_EQ(resolve_plain_scalar("nUll"), "nUll");
}

TEST(ResolvePlainScalar, Booleans) {
    EXPECT_EQ(resolve_plain_scalar("true"), true);
    EXPECT_EQ(resolve_plain_scalar("False"), false);
    // YAML 1.1 spellings are plain strings
    EXPECT_EQ(resolve_plain_scalar("yes"), "yes");
    EXPECT_EQ(resolve_plain_scalar("on"), "on");
}

TEST(ResolvePlainScalar, Integers) {
    EXPECT_EQ(resolve_plain_scalar("10"), 10);
    EXPECT_EQ(resolve_plain_scalar("+10"), 10);
    EXPECT_EQ(resolve_plain_scalar("-3"), -3);
    EXPECT_EQ(resolve_plain_scalar("0o17"), 15);
    EXPECT_EQ(resolve_plain_scalar("0xff"), 255);
    EXPECT_EQ(resolve_plain_scalar("0o9"), "0o9");
}

TEST(ResolvePlainScalar, LargeIntegers) {
    auto u = resolve_plain_scalar("18446744073709551615");
    ASSERT_TRUE(u.is_number_unsigned());
    EXPECT_EQ(u.get<std::uint64_t>(), 18446744073709551615ULL);

    auto f = resolve_plain_scalar("99999999999999999999999");
    EXPECT_TRUE(f.is_number_float());
}

TEST(ResolvePlainScalar, Floats) {
    EXPECT_TRUE(resolve_plain_scalar("1.0").is_number_float());
    EXPECT_TRUE(resolve_plain_scalar(".5").is_number_float());
    EXPECT_TRUE(resolve_plain_scalar("1e3").is_number_float());
    EXPECT_TRUE(resolve_plain_scalar("-2.5E-3").is_number_float());

    EXPECT_TRUE(std::isinf(resolve_plain_scalar(".inf").get<double>()));
    EXPECT_LT(resolve_plain_scalar("-.Inf").get<double>(), 0);
    EXPECT_TRUE(std::isnan(resolve_plain_scalar(".nan").get<double>()));
}

TEST(ResolvePlainScalar, Strings) {
    EXPECT_EQ(resolve_plain_scalar("hello"), "hello");
    EXPECT_EQ(resolve_plain_scalar("1.2.3"), "1.2.3");
    EXPECT_EQ(resolve_plain_scalar("."), ".");
    EXPECT_EQ(resolve_plain_scalar("inf"), "inf");
}
