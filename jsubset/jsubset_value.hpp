#pragma once

#include "nlohmann/json.hpp"
#include <concepts>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jsubset {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

/**
 * @brief Documentation and default carried by every schema node
 *
 * title and description are never compared by the subset checker. A null
 * default_value means the node declares no default.
 */
struct annotations {
  std::string title;
  std::string description;
  nlohmann::json default_value;

  bool operator==(const annotations &) const = default;
};

struct null_type {
  annotations info;

  bool operator==(const null_type &) const = default;
};

struct boolean_type {
  annotations info;

  bool operator==(const boolean_type &) const = default;
};

struct integer_type {
  annotations info;
  std::optional<std::set<std::int64_t>> enum_values;

  bool operator==(const integer_type &) const = default;
};

struct number_type {
  annotations info;
  std::optional<std::set<double>> enum_values;

  bool operator==(const number_type &) const = default;
};

struct string_type {
  annotations info;
  std::optional<std::set<std::string>> enum_values;
  std::optional<std::string> format; // Opaque tag, compared for equality only

  bool operator==(const string_type &) const = default;
};

// Children are compared by value, not by pointer identity
template <class Pointer>
bool deep_equal(const Pointer &left, const Pointer &right)
{
  if (left == right)
    return true;
  if (!left || !right)
    return false;
  return *left == *right;
}

template <class Node>
struct basic_array {
  annotations info;
  std::shared_ptr<const Node> items;

  friend bool operator==(const basic_array &left, const basic_array &right)
  {
    return left.info == right.info && deep_equal(left.items, right.items);
  }
};

template <class Node>
struct basic_object {
  annotations info;
  std::map<std::string, std::shared_ptr<const Node>> properties;
  std::set<std::string> required;

  friend bool operator==(const basic_object &left, const basic_object &right)
  {
    if (left.info != right.info || left.required != right.required || left.properties.size() != right.properties.size())
      return false;
    for (const auto &[name, node]: left.properties) {
      auto other = right.properties.find(name);
      if (other == right.properties.end() || !deep_equal(node, other->second))
        return false;
    }
    return true;
  }
};

template <class Node>
struct basic_any_of {
  annotations info;
  std::vector<std::shared_ptr<const Node>> variants;

  friend bool operator==(const basic_any_of &left, const basic_any_of &right)
  {
    if (left.info != right.info || left.variants.size() != right.variants.size())
      return false;
    for (size_t i = 0; i < left.variants.size(); ++i)
      if (!deep_equal(left.variants[i], right.variants[i]))
        return false;
    return true;
  }
};

struct value;
struct schema_node;

using value_ptr       = std::shared_ptr<const value>;
using schema_node_ptr = std::shared_ptr<const schema_node>;

// Resolved shapes
using array_type  = basic_array<value>;
using object_type = basic_object<value>;
using any_of_type = basic_any_of<value>;

// Unresolved shapes, as read from a schema document
using unresolved_array  = basic_array<schema_node>;
using unresolved_object = basic_object<schema_node>;
using unresolved_any_of = basic_any_of<schema_node>;

struct ref_type {
  annotations info;
  std::string target; // Definition name, the trailing segment of the $ref pointer

  bool operator==(const ref_type &) const = default;
};

/**
 * @brief allOf wrapper around a single $ref, used to attach a default to an aliased definition
 */
struct all_of_type {
  annotations info;
  std::vector<schema_node_ptr> conjuncts;

  bool operator==(const all_of_type &other) const;
};

template <class T>
concept scalar_alternative = std::same_as<T, null_type> || std::same_as<T, boolean_type> || std::same_as<T, integer_type> || std::same_as<T, number_type> || std::same_as<T, string_type>;

/**
 * @brief A schema node after resolution
 *
 * Holds no allOf or $ref node. Only the resolver produces these.
 */
struct value {
  using variant_type = std::variant<null_type, boolean_type, integer_type, number_type, string_type, array_type, object_type, any_of_type>;
  variant_type node;

  bool operator==(const value &other) const;
};

/**
 * @brief A schema node as read from a document, before definitions are inlined
 */
struct schema_node {
  using variant_type = std::variant<null_type, boolean_type, integer_type, number_type, string_type, unresolved_array, unresolved_object, unresolved_any_of, all_of_type, ref_type>;
  variant_type node;

  bool operator==(const schema_node &other) const;
};

using definition_table = std::map<std::string, schema_node_ptr>;

/**
 * @brief Root of a schema document: a definitions table plus the root object shape
 */
struct schema_document {
  std::string title;
  definition_table definitions;
  std::map<std::string, schema_node_ptr> properties;
  std::set<std::string> required;

  bool operator==(const schema_document &other) const;
};

template <class T>
value_ptr make_value(T alternative)
{
  return std::make_shared<const value>(value{ std::move(alternative) });
}

template <class T>
schema_node_ptr make_node(T alternative)
{
  return std::make_shared<const schema_node>(schema_node{ std::move(alternative) });
}

std::string_view type_name(const value &node);
std::string_view type_name(const schema_node &node);

const annotations &node_annotations(const value &node);
const annotations &node_annotations(const schema_node &node);

} // namespace jsubset
