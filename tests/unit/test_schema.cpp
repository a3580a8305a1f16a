#include <gtest/gtest.h>
#include "foundry/schema.hpp"

using namespace foundry;
using nlohmann::json;

namespace {

const json kSchema = json::parse(R"({
    "type": "object",
    "properties": {
        "query":  {"type": "string", "minLength": 1},
        "limit":  {"type": "integer", "minimum": 1, "maximum": 50},
        "order":  {"enum": ["asc", "desc"]},
        "tags":   {"type": "array", "items": {"type": "string"}}
    },
    "required": ["query"],
    "additionalProperties": false
})");

} // namespace

TEST(Schema, AcceptsConformingArguments) {
    EXPECT_FALSE(validate_arguments(kSchema, json{{"query", "canvas"}}).has_value());
    EXPECT_FALSE(validate_arguments(kSchema,
        json{{"query", "x"}, {"limit", 10}, {"order", "asc"}, {"tags", {"a", "b"}}}).has_value());
}

TEST(Schema, IntegralFloatCountsAsInteger) {
    EXPECT_FALSE(validate_arguments(kSchema, json{{"query", "x"}, {"limit", 3.0}}).has_value());
    EXPECT_TRUE(validate_arguments(kSchema, json{{"query", "x"}, {"limit", 3.5}}).has_value());
}

TEST(Schema, MissingRequired) {
    auto err = validate_arguments(kSchema, json::object());
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "$: missing required field 'query'");
}

TEST(Schema, WrongTypeReportsPath) {
    auto err = validate_arguments(kSchema, json{{"query", "x"}, {"limit", "ten"}});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "$.limit: expected integer");
}

TEST(Schema, BoundsAndLengths) {
    EXPECT_TRUE(validate_arguments(kSchema, json{{"query", "x"}, {"limit", 0}}).has_value());
    EXPECT_TRUE(validate_arguments(kSchema, json{{"query", "x"}, {"limit", 51}}).has_value());
    EXPECT_TRUE(validate_arguments(kSchema, json{{"query", ""}}).has_value());
}

TEST(Schema, EnumAndItems) {
    EXPECT_TRUE(validate_arguments(kSchema, json{{"query", "x"}, {"order", "up"}}).has_value());
    auto err = validate_arguments(kSchema, json{{"query", "x"}, {"tags", {"a", 2}}});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "$.tags[1]: expected string");
}

TEST(Schema, AdditionalPropertiesRejected) {
    auto err = validate_arguments(kSchema, json{{"query", "x"}, {"extra", true}});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "$: unexpected field 'extra'");
}

TEST(Schema, TypeListAndUnknownKeywords) {
    json schema = {{"type", {"string", "null"}}, {"format", "uuid"}};
    EXPECT_FALSE(validate_arguments(schema, nullptr).has_value());
    EXPECT_FALSE(validate_arguments(schema, "abc").has_value());
    EXPECT_TRUE(validate_arguments(schema, 5).has_value());
}

TEST(Schema, NonObjectSchemaAcceptsAnything) {
    EXPECT_FALSE(validate_arguments(json(true), json{{"a", 1}}).has_value());
}
