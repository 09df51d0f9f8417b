/**
 * @file test_value.cpp
 * @brief Tests for value kinds and type names (GoogleTest)
 */

#include <gtest/gtest.h>
#include "strata/Value.hpp"

#include <cstdint>

using namespace strata;

// ============================================================================
// Kinds
// ============================================================================

TEST(ValueKind, ScalarKinds) {
    EXPECT_EQ(kind_of(Value(nullptr)), ValueKind::Null);
    EXPECT_EQ(kind_of(Value(true)), ValueKind::Boolean);
    EXPECT_EQ(kind_of(Value("text")), ValueKind::String);
}

TEST(ValueKind, AllNumbersShareOneKind) {
    EXPECT_EQ(kind_of(Value(42)), ValueKind::Number);
    EXPECT_EQ(kind_of(Value(std::uint64_t{18446744073709551615ULL})), ValueKind::Number);
    EXPECT_EQ(kind_of(Value(1.5)), ValueKind::Number);
}

TEST(ValueKind, Containers) {
    EXPECT_EQ(kind_of(Value::array()), ValueKind::Sequence);
    EXPECT_EQ(kind_of(Value::object()), ValueKind::Mapping);
    EXPECT_TRUE(is_container(Value::array()));
    EXPECT_TRUE(is_container(Value::object()));
    EXPECT_FALSE(is_container(Value("[]")));
}

TEST(ValueKind, BooleanIsNotNumber) {
    EXPECT_NE(kind_of(Value(true)), kind_of(Value(1)));
}

// ============================================================================
// Names
// ============================================================================

TEST(ValueKind, KindNames) {
    EXPECT_STREQ(kind_name(ValueKind::Sequence), "sequence");
    EXPECT_STREQ(kind_name(ValueKind::Mapping), "mapping");
    EXPECT_STREQ(kind_name(ValueKind::Number), "number");
}

TEST(ValueKind, TypeNamesDistinguishNumbers) {
    EXPECT_EQ(type_name(Value(3)), "integer");
    EXPECT_EQ(type_name(Value(3.0)), "float");
    EXPECT_EQ(type_name(Value(nullptr)), "null");
    EXPECT_EQ(type_name(Value::array()), "sequence");
    EXPECT_EQ(type_name(Value::object()), "mapping");
}

TEST(ValueKind, MappingsKeepInsertionOrder) {
    Value v = Value::object();
    v["zeta"] = 1;
    v["alpha"] = 2;
    v["mid"] = 3;

    std::vector<std::string> keys;
    for (auto it = v.begin(); it != v.end(); ++it) keys.push_back(it.key());
    EXPECT_EQ(keys, (std::vector<std::string>{"zeta", "alpha", "mid"}));
}
