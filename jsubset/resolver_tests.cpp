#include "gtest/gtest.h"
#include "jsubset_resolver.hpp"
#include "jsubset_schema.hpp"

using namespace jsubset;

class ResolverTest : public ::testing::Test {
protected:
  const nlohmann::json aliased_enum = R"({
    "$defs": {
      "Color": { "enum": ["blue", "red"], "title": "Color", "type": "string" }
    },
    "title": "Paint", "type": "object",
    "properties": {
      "primary": { "allOf": [{ "$ref": "#/$defs/Color" }], "default": "red" },
      "secondary": { "$ref": "#/$defs/Color" },
      "plain": { "allOf": [{ "$ref": "#/$defs/Color" }] }
    },
    "required": ["secondary"]
  })"_json;

  static const value &property(const object_type &object, const std::string &name)
  {
    return *object.properties.at(name);
  }

  // Counts nodes that must not survive resolution
  static int unresolved_nodes(const nlohmann::json &j)
  {
    int count = 0;
    if (j.is_object()) {
      count += j.contains("$ref") + j.contains("allOf");
      for (const auto &[key, child]: j.items())
        count += unresolved_nodes(child);
    } else if (j.is_array()) {
      for (const auto &child: j)
        count += unresolved_nodes(child);
    }
    return count;
  }
};

TEST_F(ResolverTest, ReferencesAreInlined)
{
  auto document = parse_schema_document(R"({
    "definitions": {
      "Leaf": { "type": "integer" },
      "Middle": { "type": "object", "properties": { "leaf": { "$ref": "#/definitions/Leaf" } }, "required": ["leaf"] }
    },
    "title": "Chain", "type": "object",
    "properties": {
      "items": { "type": "array", "items": { "$ref": "#/definitions/Middle" } },
      "maybe": { "anyOf": [{ "$ref": "#/definitions/Leaf" }, { "type": "null" }], "default": 3 }
    }
  })"_json);

  auto root = resolve(document);
  EXPECT_EQ(unresolved_nodes(as_json(value{ root })), 0);

  const auto &items = std::get<array_type>(property(root, "items").node);
  const auto &middle = std::get<object_type>(items.items->node);
  EXPECT_TRUE(std::holds_alternative<integer_type>(property(middle, "leaf").node));
  EXPECT_EQ(middle.required, std::set<std::string>{ "leaf" });

  const auto &maybe = std::get<any_of_type>(property(root, "maybe").node);
  ASSERT_EQ(maybe.variants.size(), 2u);
  EXPECT_EQ(type_name(*maybe.variants[0]), "Integer");
  EXPECT_EQ(type_name(*maybe.variants[1]), "Null");
  EXPECT_EQ(maybe.info.default_value, 3);
}

TEST_F(ResolverTest, RootRequiredPassesThrough)
{
  auto root = resolve(parse_schema_document(aliased_enum));
  EXPECT_EQ(root.required, std::set<std::string>{ "secondary" });
  EXPECT_EQ(root.properties.size(), 3u);
}

TEST_F(ResolverTest, AllOfOverridesDefault)
{
  auto root = resolve(parse_schema_document(aliased_enum));

  const auto &primary = std::get<string_type>(property(root, "primary").node);
  EXPECT_EQ(primary.info.default_value, "red");
  EXPECT_EQ(primary.enum_values, (std::set<std::string>{ "blue", "red" }));
  EXPECT_EQ(primary.info.title, "Color");
}

TEST_F(ResolverTest, AllOfDefaultDoesNotLeakIntoDefinition)
{
  auto document = parse_schema_document(aliased_enum);
  auto root     = resolve(document);

  EXPECT_TRUE(node_annotations(property(root, "secondary")).default_value.is_null());
  EXPECT_TRUE(node_annotations(property(root, "plain")).default_value.is_null());
  EXPECT_TRUE(node_annotations(*document.definitions.at("Color")).default_value.is_null());
}

TEST_F(ResolverTest, ResolutionIsDeterministic)
{
  auto document = parse_schema_document(aliased_enum);
  EXPECT_EQ(resolve(document), resolve(document));
}

TEST_F(ResolverTest, UnknownReference)
{
  auto document = parse_schema_document(R"({
    "title": "Dangling", "type": "object",
    "properties": { "a": { "$ref": "#/$defs/Missing" } }
  })"_json);
  EXPECT_THROW(resolve(document), resolution_fault);
}

TEST_F(ResolverTest, UnknownReferenceInsideAllOf)
{
  auto document = parse_schema_document(R"({
    "title": "Dangling", "type": "object",
    "properties": { "a": { "allOf": [{ "$ref": "#/$defs/Missing" }], "default": 1 } }
  })"_json);
  EXPECT_THROW(resolve(document), resolution_fault);
}

TEST_F(ResolverTest, AllOfWithTwoConjuncts)
{
  auto document = parse_schema_document(R"({
    "$defs": { "A": { "type": "string" }, "B": { "type": "string" } },
    "title": "Intersection", "type": "object",
    "properties": { "a": { "allOf": [{ "$ref": "#/$defs/A" }, { "$ref": "#/$defs/B" }] } }
  })"_json);
  EXPECT_THROW(resolve(document), resolution_fault);
}

TEST_F(ResolverTest, AllOfWithoutReference)
{
  auto document = parse_schema_document(R"({
    "title": "Inline", "type": "object",
    "properties": { "a": { "allOf": [{ "type": "string" }] } }
  })"_json);
  EXPECT_THROW(resolve(document), resolution_fault);
}

TEST_F(ResolverTest, ResolveSingleNode)
{
  definition_table definitions = { { "Flag", make_node(boolean_type{}) } };
  auto resolved                = resolve(*make_node(unresolved_array{ {}, make_node(ref_type{ {}, "Flag" }) }), definitions);

  const auto &array = std::get<array_type>(resolved->node);
  EXPECT_TRUE(std::holds_alternative<boolean_type>(array.items->node));
}

TEST_F(ResolverTest, MissingChildIsAFault)
{
  const definition_table definitions;
  unresolved_object object;
  object.properties.emplace("a", nullptr);

  EXPECT_THROW(resolve(*make_node(object), definitions), resolution_fault);
  EXPECT_THROW(resolve(*make_node(unresolved_any_of{ {}, { make_node(null_type{}), nullptr } }), definitions), resolution_fault);
  EXPECT_THROW(resolve(*make_node(unresolved_array{ {}, nullptr }), definitions), resolution_fault);
  EXPECT_THROW(resolve(*make_node(all_of_type{ {}, { nullptr } }), definitions), resolution_fault);
}
