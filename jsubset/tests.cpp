#include "gtest/gtest.h"
#include "jsubset_checker.hpp"
#include "jsubset_resolver.hpp"
#include "jsubset_schema.hpp"

class SubsetTest : public ::testing::Test {
protected:
  static jsubset::value_ptr schema(const nlohmann::json &document)
  {
    return jsubset::make_value(jsubset::resolve(jsubset::parse_schema_document(document)));
  }

  static std::vector<std::string> errors(const nlohmann::json &a, const nlohmann::json &b)
  {
    std::vector<std::string> lines;
    for (const auto &e: jsubset::is_subset(schema(a), schema(b)))
      lines.push_back(e.to_string());
    return lines;
  }

  static nlohmann::json single(const std::string &title, const std::string &name, const nlohmann::json &node, bool required = true)
  {
    nlohmann::json document = { { "type", "object" }, { "title", title }, { "properties", { { name, node } } } };
    if (required)
      document["required"] = nlohmann::json::array({ name });
    return document;
  }

  const nlohmann::json str_only = R"({
    "title": "StrOnly", "type": "object",
    "properties": { "a": { "title": "A", "type": "string" } },
    "required": ["a"]
  })"_json;

  const nlohmann::json int_only = R"({
    "title": "IntOnly", "type": "object",
    "properties": { "a": { "title": "A", "type": "integer" } },
    "required": ["a"]
  })"_json;

  const nlohmann::json str_or_none = R"({
    "title": "StrOrNone", "type": "object",
    "properties": { "a": { "anyOf": [{ "type": "string" }, { "type": "null" }], "title": "A" } },
    "required": ["a"]
  })"_json;

  const nlohmann::json date_only = R"({
    "title": "DateOnly", "type": "object",
    "properties": { "a": { "format": "date", "title": "A", "type": "string" } },
    "required": ["a"]
  })"_json;

  const nlohmann::json date_time_only = R"({
    "title": "DateTimeOnly", "type": "object",
    "properties": { "a": { "format": "date-time", "title": "A", "type": "string" } },
    "required": ["a"]
  })"_json;

  const nlohmann::json str_nested = R"({
    "$defs": {
      "StrOnly": { "title": "StrOnly", "type": "object", "properties": { "a": { "title": "A", "type": "string" } }, "required": ["a"] }
    },
    "title": "StrNested", "type": "object",
    "properties": { "b": { "$ref": "#/$defs/StrOnly" } },
    "required": ["b"]
  })"_json;

  const nlohmann::json int_nested = R"({
    "$defs": {
      "IntOnly": { "title": "IntOnly", "type": "object", "properties": { "a": { "title": "A", "type": "integer" } }, "required": ["a"] }
    },
    "title": "IntNested", "type": "object",
    "properties": { "b": { "$ref": "#/$defs/IntOnly" } },
    "required": ["b"]
  })"_json;

  const nlohmann::json str_or_none_nested = R"({
    "$defs": {
      "StrOrNone": {
        "title": "StrOrNone", "type": "object",
        "properties": { "a": { "anyOf": [{ "type": "string" }, { "type": "null" }], "title": "A" } },
        "required": ["a"]
      }
    },
    "title": "StrOrNoneNested", "type": "object",
    "properties": { "b": { "anyOf": [{ "$ref": "#/$defs/StrOrNone" }, { "type": "null" }] } },
    "required": ["b"]
  })"_json;

  const nlohmann::json int_or_str_nested = R"({
    "$defs": {
      "IntOrStr": {
        "title": "IntOrStr", "type": "object",
        "properties": { "a": { "anyOf": [{ "type": "integer" }, { "type": "string" }], "title": "A" } },
        "required": ["a"]
      }
    },
    "title": "IntOrStrNested", "type": "object",
    "properties": { "b": { "anyOf": [{ "$ref": "#/$defs/IntOrStr" }, { "type": "null" }] } },
    "required": ["b"]
  })"_json;

  const nlohmann::json str_no_default = R"({
    "title": "StrNoDefault", "type": "object",
    "properties": { "a": { "title": "A", "type": "string" }, "b": { "title": "B", "type": "number" } },
    "required": ["a", "b"]
  })"_json;

  const nlohmann::json str_and_default = R"({
    "title": "StrAndDefault", "type": "object",
    "properties": {
      "a": { "title": "A", "type": "string" },
      "b": { "anyOf": [{ "type": "number" }, { "type": "null" }], "default": null, "title": "B" }
    },
    "required": ["a"]
  })"_json;

  static nlohmann::json enum_model(const std::string &name, const std::vector<std::string> &members)
  {
    nlohmann::json document = R"({
      "type": "object",
      "properties": { "choices": {} },
      "required": ["choices"]
    })"_json;
    document["title"]                        = "Enum" + name;
    document["$defs"][name]                  = { { "enum", members }, { "title", name }, { "type", "string" } };
    document["properties"]["choices"]["$ref"] = "#/$defs/" + name;
    return document;
  }

  static nlohmann::json union_model(const std::string &title, const std::vector<std::string> &members)
  {
    nlohmann::json document = R"({
      "$defs": {
        "X": { "title": "X", "type": "object", "properties": { "a": { "title": "A", "type": "string" } }, "required": ["a"] },
        "Y": { "title": "Y", "type": "object", "properties": { "a": { "title": "A", "type": "integer" } }, "required": ["a"] },
        "Z": { "title": "Z", "type": "object", "properties": { "a": { "title": "A", "type": "number" } }, "required": ["a"] }
      },
      "type": "object",
      "required": ["choices"]
    })"_json;
    document["title"] = title;
    nlohmann::json variants = nlohmann::json::array();
    for (const auto &m: members)
      variants.push_back(nlohmann::json{ { "$ref", "#/$defs/" + m } });
    document["properties"]["choices"] = { { "anyOf", variants }, { "title", "Choices" } };
    return document;
  }
};

using lines = std::vector<std::string>;

TEST_F(SubsetTest, IdenticalSchemasAreCompatible)
{
  EXPECT_EQ(errors(str_only, str_only), lines{});
}

TEST_F(SubsetTest, TypeMismatch)
{
  EXPECT_EQ(errors(str_only, int_only), lines{ "At .a Types don't match - a: String b: Integer" });
}

TEST_F(SubsetTest, DateFormats)
{
  EXPECT_EQ(errors(date_only, date_time_only), lines{ "At .a String formats do not match - a: String b: String" });
}

TEST_F(SubsetTest, RequiredFitsNullable)
{
  EXPECT_EQ(errors(str_only, str_or_none), lines{});
}

TEST_F(SubsetTest, NullableDoesNotFitRequired)
{
  EXPECT_EQ(errors(str_or_none, str_only), lines{ "At .a Types don't match - a: Null b: String" });
}

TEST_F(SubsetTest, Nested)
{
  EXPECT_EQ(errors(str_nested, str_nested), lines{});
}

TEST_F(SubsetTest, NestedTypeMismatch)
{
  EXPECT_EQ(errors(str_nested, int_nested), lines{ "At .b.a Types don't match - a: String b: Integer" });
}

TEST_F(SubsetTest, NestedUnionReportsEveryVariant)
{
  const lines expected = {
    "At .b.a Types don't match - a: Null b: Integer",
    "At .b.a Types don't match - a: Null b: String",
    "At .b Types don't match - a: Object b: Null",
  };
  EXPECT_EQ(errors(str_or_none_nested, int_or_str_nested), expected);
}

TEST_F(SubsetTest, MissingRequiredKey)
{
  EXPECT_EQ(errors(str_only, str_no_default), lines{ "At .b Key: b not in a - a: Object b: Object" });
}

TEST_F(SubsetTest, MissingOptionalKeyIsTolerated)
{
  EXPECT_EQ(errors(str_only, str_and_default), lines{});
}

TEST_F(SubsetTest, MissingKeyListsAvailableProperties)
{
  auto a = R"({ "title": "A", "type": "object", "properties": { "y": { "type": "string" }, "x": { "type": "string" } } })"_json;
  auto b = single("B", "z", { { "type", "string" } });
  EXPECT_EQ(errors(a, b), lines{ "At .z Key: z not in x, y - a: Object b: Object" });
}

TEST_F(SubsetTest, OptionalPropertyOfferedByAIsStillChecked)
{
  auto a = single("A", "n", { { "type", "string" } });
  auto b = single("B", "n", { { "type", "integer" } }, false);
  EXPECT_EQ(errors(a, b), lines{ "At .n Types don't match - a: String b: Integer" });
}

TEST_F(SubsetTest, UndeclaredPropertiesOfAAreIgnored)
{
  auto a = R"({ "title": "A", "type": "object", "properties": { "a": { "type": "string" }, "extra": { "type": "boolean" } }, "required": ["a", "extra"] })"_json;
  EXPECT_EQ(errors(a, str_only), lines{});
}

TEST_F(SubsetTest, Enum)
{
  EXPECT_EQ(errors(enum_model("AB", { "a", "b" }), enum_model("AB", { "a", "b" })), lines{});
}

TEST_F(SubsetTest, EnumSubset)
{
  EXPECT_EQ(errors(enum_model("AB", { "a", "b" }), enum_model("ABC", { "a", "b", "c" })), lines{});
}

TEST_F(SubsetTest, EnumSuperset)
{
  EXPECT_EQ(errors(enum_model("ABC", { "a", "b", "c" }), enum_model("AB", { "a", "b" })), lines{ "At .choices Following keys not in a: c - a: String b: String" });
}

TEST_F(SubsetTest, EnumIntersection)
{
  EXPECT_EQ(errors(enum_model("AB", { "a", "b" }), enum_model("BC", { "b", "c" })), lines{ "At .choices Following keys not in a: a - a: String b: String" });
}

TEST_F(SubsetTest, EnumDifferenceIsSorted)
{
  EXPECT_EQ(errors(enum_model("DCBA", { "d", "c", "b", "a" }), enum_model("A", { "a" })), lines{ "At .choices Following keys not in a: b, c, d - a: String b: String" });
}

TEST_F(SubsetTest, PlainStringDoesNotFitEnum)
{
  auto a = single("A", "choices", { { "type", "string" } });
  EXPECT_EQ(errors(a, enum_model("AB", { "a", "b" })), lines{ "At .choices Cannot fit any string into an Enum - a: String b: String" });
}

TEST_F(SubsetTest, EnumFitsPlainString)
{
  auto b = single("B", "choices", { { "type", "string" } });
  EXPECT_EQ(errors(enum_model("AB", { "a", "b" }), b), lines{});
}

TEST_F(SubsetTest, FormatIsCheckedBeforeEnum)
{
  auto a = single("A", "d", { { "type", "string" }, { "format", "date" } });
  auto b = single("B", "d", { { "type", "string" }, { "enum", nlohmann::json::array({ "2024-01-01" }) } });
  EXPECT_EQ(errors(a, b), lines{ "At .d String formats do not match - a: String b: String" });
}

TEST_F(SubsetTest, UnionSubset)
{
  EXPECT_EQ(errors(union_model("UnionXY", { "X", "Y" }), union_model("UnionXYZ", { "X", "Y", "Z" })), lines{});
}

TEST_F(SubsetTest, UnionSuperset)
{
  const lines expected = {
    "At .choices.a Types don't match - a: Number b: String",
    "At .choices.a Types don't match - a: Number b: Integer",
  };
  EXPECT_EQ(errors(union_model("UnionXYZ", { "X", "Y", "Z" }), union_model("UnionXY", { "X", "Y" })), expected);
}

TEST_F(SubsetTest, UnionIntersection)
{
  const lines expected = {
    "At .choices.a Types don't match - a: String b: Integer",
    "At .choices.a Types don't match - a: String b: Number",
  };
  EXPECT_EQ(errors(union_model("UnionXY", { "X", "Y" }), union_model("UnionYZ", { "Y", "Z" })), expected);
}

TEST_F(SubsetTest, IntegerIsNotANumber)
{
  auto a = single("A", "n", { { "type", "integer" } });
  auto b = single("B", "n", { { "type", "number" } });
  EXPECT_EQ(errors(a, b), lines{ "At .n Types don't match - a: Integer b: Number" });
}

TEST_F(SubsetTest, ArrayElementsAreCovariant)
{
  auto a = single("A", "xs", { { "type", "array" }, { "items", { { "type", "string" } } } });
  auto b = single("B", "xs", { { "type", "array" }, { "items", { { "type", "integer" } } } });
  EXPECT_EQ(errors(a, b), lines{ "At .xs.[] Types don't match - a: String b: Integer" });
  EXPECT_EQ(errors(a, a), lines{});
}

TEST_F(SubsetTest, ArrayAgainstScalar)
{
  auto a = single("A", "xs", { { "type", "array" }, { "items", { { "type", "string" } } } });
  auto b = single("B", "xs", { { "type", "string" } });
  EXPECT_EQ(errors(a, b), lines{ "At .xs Types don't match - a: Array b: String" });
}

TEST_F(SubsetTest, ReflexiveOnEveryNodeKind)
{
  auto document = R"({
    "$defs": {
      "Kind": { "enum": ["x", "y"], "type": "string" },
      "Inner": { "type": "object", "properties": { "flag": { "type": "boolean" }, "n": { "type": "integer", "enum": [1, 2] } }, "required": ["flag"] }
    },
    "title": "Everything", "type": "object",
    "properties": {
      "nothing": { "type": "null" },
      "ratio": { "type": "number", "enum": [0.5, 1.5] },
      "when": { "type": "string", "format": "date-time" },
      "kind": { "allOf": [{ "$ref": "#/$defs/Kind" }], "default": "x" },
      "inner": { "type": "array", "items": { "$ref": "#/$defs/Inner" } },
      "either": { "anyOf": [{ "type": "string" }, { "type": "array", "items": { "type": "number" } }] }
    },
    "required": ["nothing", "inner"]
  })"_json;
  EXPECT_EQ(errors(document, document), lines{});
}

TEST_F(SubsetTest, LeftUnionSurfacesOnlyFailingBranches)
{
  using namespace jsubset;
  auto x      = make_value(string_type{});
  auto y      = make_value(integer_type{});
  auto b      = make_value(string_type{});
  auto union_ = make_value(any_of_type{ {}, { x, y } });

  EXPECT_TRUE(is_subset(x, b).empty());
  auto result = is_subset(union_, b);
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].a, y);
  EXPECT_EQ(result[0].b, b);
  EXPECT_EQ(result[0].message, "Types don't match");
}

TEST_F(SubsetTest, RightUnionNeedsOneMatch)
{
  using namespace jsubset;
  auto a      = make_value(boolean_type{});
  auto union_ = make_value(any_of_type{ {}, { make_value(null_type{}), make_value(boolean_type{}) } });
  EXPECT_TRUE(is_subset(a, union_).empty());

  auto mismatch = make_value(any_of_type{ {}, { make_value(null_type{}), make_value(number_type{}) } });
  auto result   = is_subset(a, mismatch);
  ASSERT_EQ(result.size(), 2u);
  EXPECT_EQ(result[0].to_string(), "At . Types don't match - a: Boolean b: Null");
  EXPECT_EQ(result[1].to_string(), "At . Types don't match - a: Boolean b: Number");
}

TEST_F(SubsetTest, PathPrefixIsKept)
{
  using namespace jsubset;
  auto result = is_subset(make_value(string_type{}), make_value(null_type{}), { "root", "leaf" });
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].path, (schema_path{ "root", "leaf" }));
  EXPECT_EQ(result[0].to_string(), "At .root.leaf Types don't match - a: String b: Null");
}

TEST_F(SubsetTest, ErrorsAsJson)
{
  auto result = jsubset::is_subset(schema(str_only), schema(int_only));
  ASSERT_EQ(result.size(), 1u);
  auto expected = R"({ "path": ["a"], "message": "Types don't match", "a": "String", "b": "Integer" })"_json;
  EXPECT_EQ(result[0].as_json(), expected);
}

TEST_F(SubsetTest, InputsAreNotModified)
{
  auto a        = schema(str_or_none_nested);
  auto b        = schema(int_or_str_nested);
  auto a_before = *a;
  auto b_before = *b;
  (void)jsubset::is_subset(a, b);
  EXPECT_EQ(*a, a_before);
  EXPECT_EQ(*b, b_before);
}
