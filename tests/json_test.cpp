//! # JSON Tests
//!
//! Test Coverage:
//! - Value construction, type queries and object access
//! - Parser (primitives, strings and escapes, nesting, errors with location)
//! - Serializer (compact, indented, escaping, key order)
//! - Deep copy and structural equality

#include "json/json_parser.hpp"

#include <gtest/gtest.h>

using namespace pystruct;
using namespace pystruct::json;

namespace {

auto parse_ok(std::string_view text) -> JsonValue {
    auto result = parse_json(text);
    if (is_err(result)) {
        ADD_FAILURE() << unwrap_err(result).to_string();
        return JsonValue();
    }
    return std::move(unwrap(result));
}

auto parse_error(std::string_view text) -> JsonError {
    auto result = parse_json(text);
    if (is_ok(result)) {
        ADD_FAILURE() << "Expected parse of '" << text << "' to fail";
        return JsonError{};
    }
    return unwrap_err(result);
}

} // namespace

// ============================================================================
// JsonValue
// ============================================================================

TEST(JsonValueTest, Construction) {
    EXPECT_TRUE(JsonValue().is_null());
    EXPECT_TRUE(JsonValue(true).as_bool());
    EXPECT_TRUE(JsonValue(42).is_integer());
    EXPECT_EQ(JsonValue(int64_t(-7)).try_as_i64(), -7);
    EXPECT_FALSE(JsonValue(2.5).is_integer());
    EXPECT_EQ(JsonValue("text").as_string(), "text");
    EXPECT_TRUE(json_array().is_array());
    EXPECT_TRUE(json_object().is_object());
}

TEST(JsonValueTest, OptionalString) {
    EXPECT_TRUE(JsonValue::optional_string(std::nullopt).is_null());
    EXPECT_EQ(JsonValue::optional_string(std::string("int")).as_string(), "int");
}

TEST(JsonValueTest, ObjectSetKeepsPosition) {
    auto obj = json_object();
    obj.set("name", JsonValue("requests"));
    obj.set("url", JsonValue("https://example.com"));
    obj.set("name", JsonValue("httpx"));

    ASSERT_EQ(obj.size(), 2u);
    EXPECT_EQ(obj.as_object()[0].first, "name");
    EXPECT_EQ(obj.get("name")->as_string(), "httpx");
    EXPECT_TRUE(obj.contains("url"));
    EXPECT_FALSE(obj.contains("missing"));
    EXPECT_EQ(JsonValue(1).get("name"), nullptr);
}

TEST(JsonValueTest, TryAsI64) {
    EXPECT_EQ(JsonValue(3.0).try_as_i64(), 3);
    EXPECT_FALSE(JsonValue(3.5).try_as_i64().has_value());
    EXPECT_FALSE(JsonValue("3").try_as_i64().has_value());
    EXPECT_FALSE(JsonValue(1e300).try_as_i64().has_value());
}

TEST(JsonValueTest, CloneIsDeep) {
    auto original = parse_ok(R"({"a": [1, {"b": null}], "c": "d"})");
    auto copy = original.clone();
    EXPECT_TRUE(copy == original);

    copy.as_object_mut()[0].second.push(JsonValue(2));
    EXPECT_FALSE(copy == original);
    EXPECT_EQ(original.get("a")->size(), 2u);
}

TEST(JsonValueTest, EqualityIsOrderSensitiveForObjects) {
    EXPECT_TRUE(parse_ok(R"({"a": 1, "b": 2})") == parse_ok(R"({"a":1,"b":2})"));
    EXPECT_FALSE(parse_ok(R"({"a": 1, "b": 2})") == parse_ok(R"({"b": 2, "a": 1})"));
    EXPECT_FALSE(parse_ok("1") == parse_ok("1.0"));
}

// ============================================================================
// Parser
// ============================================================================

TEST(JsonParserTest, Primitives) {
    EXPECT_TRUE(parse_ok("null").is_null());
    EXPECT_FALSE(parse_ok(" false ").as_bool());
    EXPECT_EQ(parse_ok("-12").try_as_i64(), -12);
    EXPECT_DOUBLE_EQ(parse_ok("1.5e2").as_number().as_f64(), 150.0);
    EXPECT_EQ(parse_ok("\"x\"").as_string(), "x");
}

TEST(JsonParserTest, LargeIntegerBecomesDouble) {
    auto value = parse_ok("92233720368547758080");
    EXPECT_TRUE(value.is_number());
    EXPECT_FALSE(value.is_integer());
}

TEST(JsonParserTest, StringEscapes) {
    EXPECT_EQ(parse_ok(R"("a\nb\t\"c\"\\/")").as_string(), "a\nb\t\"c\"\\/");
    EXPECT_EQ(parse_ok(R"("\u00e9")").as_string(), "\xC3\xA9");
    EXPECT_EQ(parse_ok(R"("\ud83d\ude00")").as_string(), "\xF0\x9F\x98\x80");
}

TEST(JsonParserTest, NestedStructures) {
    auto value = parse_ok(R"([{"name": "f", "parameters": []}, {"name": "g"}])");
    ASSERT_TRUE(value.is_array());
    ASSERT_EQ(value.size(), 2u);
    EXPECT_EQ(value[0].get("name")->as_string(), "f");
    EXPECT_TRUE(value[0].get("parameters")->is_array());
    EXPECT_EQ(value[1].get("parameters"), nullptr);
}

TEST(JsonParserTest, RepeatedKeyKeepsFirstPositionAndLastValue) {
    auto value = parse_ok(R"({"a": 1, "b": 2, "a": 3})");
    ASSERT_EQ(value.size(), 2u);
    EXPECT_EQ(value.as_object()[0].first, "a");
    EXPECT_EQ(value.get("a")->try_as_i64(), 3);
}

TEST(JsonParserTest, ErrorsCarryLocation) {
    auto error = parse_error("{\n  \"a\": tru\n}");
    EXPECT_EQ(error.message, "Unknown literal");
    EXPECT_EQ(error.line, 2u);
    EXPECT_EQ(error.column, 8u);
    EXPECT_EQ(error.to_string(), "line 2, column 8: Unknown literal");
}

TEST(JsonParserTest, Errors) {
    EXPECT_EQ(parse_error("").message, "Unexpected end of input");
    EXPECT_EQ(parse_error("[1, ").message, "Unexpected end of input");
    EXPECT_EQ(parse_error("{1: 2}").message, "Expected string key in object");
    EXPECT_EQ(parse_error(R"({"a" 1})").message, "Expected ':' after object key");
    EXPECT_EQ(parse_error("[1 2]").message, "Expected ',' or ']' in array");
    EXPECT_EQ(parse_error("\"open").message, "Unterminated string");
    EXPECT_EQ(parse_error(R"("\q")").message, "Invalid escape sequence: \\q");
    EXPECT_EQ(parse_error("1.").message, "Expected digit after decimal point");
    EXPECT_EQ(parse_error("{} []").message, "Unexpected content after JSON value");
}

TEST(JsonParserTest, DepthLimit) {
    std::string deep(JsonParser::MAX_DEPTH + 1, '[');
    deep += std::string(JsonParser::MAX_DEPTH + 1, ']');
    EXPECT_EQ(parse_error(deep).message, "Maximum nesting depth exceeded");
}

TEST(JsonErrorTest, ToStringWithoutLocation) {
    EXPECT_EQ(JsonError::make("bad").to_string(), "bad");
    EXPECT_EQ(JsonError::make("bad", 3, 0).to_string(), "line 3: bad");
}

// ============================================================================
// Serializer
// ============================================================================

TEST(JsonSerializerTest, Compact) {
    auto obj = json_object();
    obj.set("name", JsonValue("f"));
    obj.set("type", json_null());
    obj.set("line_number", json_int(3));
    auto params = json_array();
    params.push(JsonValue(true));
    params.push(JsonValue(0.5));
    obj.set("items", std::move(params));

    EXPECT_EQ(obj.to_string(),
              R"({"name":"f","type":null,"line_number":3,"items":[true,0.5]})");
}

TEST(JsonSerializerTest, Pretty) {
    auto obj = json_object();
    obj.set("a", json_int(1));
    obj.set("b", json_array());
    auto inner = json_array();
    inner.push(json_string("x"));
    obj.set("c", std::move(inner));

    EXPECT_EQ(obj.to_string_pretty(2), "{\n"
                                       "  \"a\": 1,\n"
                                       "  \"b\": [],\n"
                                       "  \"c\": [\n"
                                       "    \"x\"\n"
                                       "  ]\n"
                                       "}");
    EXPECT_EQ(json_object().to_string_pretty(), "{}");
}

TEST(JsonSerializerTest, Escaping) {
    EXPECT_EQ(JsonValue("say \"hi\"\n\ttab\\").to_string(), R"("say \"hi\"\n\ttab\\")");
    EXPECT_EQ(JsonValue(std::string("\x01", 1)).to_string(), R"("\u0001")");
    EXPECT_EQ(JsonValue("caf\xC3\xA9").to_string(), "\"caf\xC3\xA9\"");
}

TEST(JsonSerializerTest, Numbers) {
    EXPECT_EQ(JsonValue(2.0).to_string(), "2.0");
    EXPECT_EQ(json_int(-40).to_string(), "-40");
}

TEST(JsonSerializerTest, ParsedTextReserializesIdentically) {
    std::string text = R"({"z":1,"a":[null,"s",{"k":false}],"m":-3})";
    EXPECT_EQ(parse_ok(text).to_string(), text);
}
