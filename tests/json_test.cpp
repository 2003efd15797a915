//! # JSON Library Tests
//!
//! The JSON reader used for reflection dumps: values, escapes, nesting
//! and error locations.

#include "common.hpp"

#include "json/json_parser.hpp"
#include <gtest/gtest.h>

using namespace jstub;
using namespace jstub::json;

// ============================================================================
// Primitives
// ============================================================================

TEST(JsonParserTest, ParseKeywords) {
    auto null_result = parse_json("null");
    ASSERT_TRUE(is_ok(null_result));
    EXPECT_TRUE(unwrap(null_result).is_null());

    auto true_result = parse_json("true");
    ASSERT_TRUE(is_ok(true_result));
    EXPECT_TRUE(unwrap(true_result).as_bool());

    auto false_result = parse_json(" false ");
    ASSERT_TRUE(is_ok(false_result));
    EXPECT_FALSE(unwrap(false_result).as_bool());
}

TEST(JsonParserTest, ParseIntegers) {
    auto result = parse_json("1537");
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).is_integer());
    EXPECT_EQ(unwrap(result).as_i64(), 1537);

    auto negative = parse_json("-42");
    ASSERT_TRUE(is_ok(negative));
    EXPECT_EQ(unwrap(negative).as_i64(), -42);
}

TEST(JsonParserTest, ParseFloats) {
    auto result = parse_json("2.5e2");
    ASSERT_TRUE(is_ok(result));
    EXPECT_FALSE(unwrap(result).is_integer());
    EXPECT_DOUBLE_EQ(unwrap(result).as_f64(), 250.0);
}

// ============================================================================
// Strings
// ============================================================================

TEST(JsonParserTest, ParseEscapes) {
    auto result = parse_json(R"("line\n\t\"quoted\" \\ \/")");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).as_string(), "line\n\t\"quoted\" \\ /");
}

TEST(JsonParserTest, ParseUnicodeEscape) {
    auto result = parse_json(R"("\u00e9\u200b")");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).as_string(), "\xc3\xa9\xe2\x80\x8b");
}

TEST(JsonParserTest, ParseSurrogatePair) {
    auto result = parse_json(R"("\ud83d\ude00")");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).as_string(), "\xf0\x9f\x98\x80");
}

// ============================================================================
// Containers
// ============================================================================

TEST(JsonParserTest, ParseNestedObject) {
    auto result = parse_json(R"({
        "name": "java.util.Map$Entry",
        "modifiers": 1545,
        "member_classes": [],
        "javadoc": {"description": "A map entry."}
    })");
    ASSERT_TRUE(is_ok(result));
    const auto& value = unwrap(result);
    ASSERT_TRUE(value.is_object());
    EXPECT_EQ(value.size(), 4u);
    EXPECT_EQ(value.get("name")->as_string(), "java.util.Map$Entry");
    EXPECT_EQ(value.get("modifiers")->as_i64(), 1545);
    EXPECT_TRUE(value.get("member_classes")->is_array());
    EXPECT_EQ(value.get("javadoc")->get("description")->as_string(), "A map entry.");
    EXPECT_EQ(value.get("missing"), nullptr);
}

TEST(JsonParserTest, ParseArrayOfMixedValues) {
    auto result = parse_json(R"([1, "two", [3], {"four": 4}, null])");
    ASSERT_TRUE(is_ok(result));
    const auto& array = unwrap(result).as_array();
    ASSERT_EQ(array.size(), 5u);
    EXPECT_EQ(array[0].as_i64(), 1);
    EXPECT_EQ(array[1].as_string(), "two");
    EXPECT_EQ(array[2].size(), 1u);
    EXPECT_EQ(array[3].get("four")->as_i64(), 4);
    EXPECT_TRUE(array[4].is_null());
}

// ============================================================================
// Errors
// ============================================================================

TEST(JsonParserTest, ErrorUnterminatedString) {
    EXPECT_TRUE(is_err(parse_json(R"("open)")));
}

TEST(JsonParserTest, ErrorTrailingComma) {
    EXPECT_TRUE(is_err(parse_json("[1, 2,]")));
    EXPECT_TRUE(is_err(parse_json(R"({"a": 1,})")));
}

TEST(JsonParserTest, ErrorTrailingContent) {
    EXPECT_TRUE(is_err(parse_json("{} {}")));
}

TEST(JsonParserTest, ErrorLocation) {
    auto result = parse_json("{\n  \"a\": tru\n}");
    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    EXPECT_EQ(error.line, 2u);
    EXPECT_NE(error.to_string().find("line 2"), std::string::npos);
}

TEST(JsonParserTest, ErrorDepthLimit) {
    std::string deep(600, '[');
    deep += std::string(600, ']');
    EXPECT_TRUE(is_err(parse_json(deep)));
}
