#include "jsubset_value.hpp"

namespace jsubset {

static constexpr std::string_view tag_name(const null_type &)
{
  return "Null";
}
static constexpr std::string_view tag_name(const boolean_type &)
{
  return "Boolean";
}
static constexpr std::string_view tag_name(const integer_type &)
{
  return "Integer";
}
static constexpr std::string_view tag_name(const number_type &)
{
  return "Number";
}
static constexpr std::string_view tag_name(const string_type &)
{
  return "String";
}
template <class Node>
static constexpr std::string_view tag_name(const basic_array<Node> &)
{
  return "Array";
}
template <class Node>
static constexpr std::string_view tag_name(const basic_object<Node> &)
{
  return "Object";
}
template <class Node>
static constexpr std::string_view tag_name(const basic_any_of<Node> &)
{
  return "AnyOf";
}
static constexpr std::string_view tag_name(const all_of_type &)
{
  return "AllOf";
}
static constexpr std::string_view tag_name(const ref_type &)
{
  return "Ref";
}

std::string_view type_name(const value &node)
{
  return std::visit([](const auto &alternative) { return tag_name(alternative); }, node.node);
}

std::string_view type_name(const schema_node &node)
{
  return std::visit([](const auto &alternative) { return tag_name(alternative); }, node.node);
}

const annotations &node_annotations(const value &node)
{
  return std::visit([](const auto &alternative) -> const annotations & { return alternative.info; }, node.node);
}

const annotations &node_annotations(const schema_node &node)
{
  return std::visit([](const auto &alternative) -> const annotations & { return alternative.info; }, node.node);
}

bool all_of_type::operator==(const all_of_type &other) const
{
  if (info != other.info || conjuncts.size() != other.conjuncts.size())
    return false;
  for (size_t i = 0; i < conjuncts.size(); ++i)
    if (!deep_equal(conjuncts[i], other.conjuncts[i]))
      return false;
  return true;
}

bool value::operator==(const value &other) const
{
  return node == other.node;
}

bool schema_node::operator==(const schema_node &other) const
{
  return node == other.node;
}

bool schema_document::operator==(const schema_document &other) const
{
  if (title != other.title || required != other.required)
    return false;

  auto same_table = [](const auto &left, const auto &right) {
    if (left.size() != right.size())
      return false;
    for (const auto &[name, node]: left) {
      auto match = right.find(name);
      if (match == right.end() || !deep_equal(node, match->second))
        return false;
    }
    return true;
  };
  return same_table(definitions, other.definitions) && same_table(properties, other.properties);
}

} // namespace jsubset
