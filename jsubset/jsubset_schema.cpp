#include "jsubset_schema.hpp"
#include "jsubset_resolver.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <cstdint>
#include <limits>

namespace jsubset {

static bool is_scalar(const nlohmann::json &j)
{
  return j.is_null() || j.is_boolean() || j.is_number() || j.is_string();
}

// Unsigned values above INT64_MAX would wrap on get<std::int64_t>()
static bool is_int64(const nlohmann::json &j)
{
  if (j.is_number_unsigned())
    return j.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  return j.is_number_integer();
}

static std::string string_field(const nlohmann::json &node, const char *key)
{
  if (!node.contains(key))
    return {};
  if (!node[key].is_string())
    throw schema_error(std::string("'") + key + "' must be a string");
  return node[key].get<std::string>();
}

static annotations parse_annotations(const nlohmann::json &node)
{
  annotations info;
  info.title       = string_field(node, "title");
  info.description = string_field(node, "description");
  if (node.contains("default"))
    info.default_value = node["default"];
  return info;
}

template <class Predicate>
static void check_default(const annotations &info, std::string_view type, Predicate accepts)
{
  if (!info.default_value.is_null() && !accepts(info.default_value))
    throw schema_error("default " + info.default_value.dump() + " does not fit type '" + std::string(type) + "'");
}

template <class T, class Predicate>
static std::optional<std::set<T>> parse_enum(const nlohmann::json &node, std::string_view type, Predicate accepts)
{
  if (!node.contains("enum"))
    return std::nullopt;

  const auto &values = node["enum"];
  if (!values.is_array())
    throw schema_error("'enum' must be an array");

  std::set<T> result;
  for (const auto &v: values) {
    if (!accepts(v))
      throw schema_error("enum member " + v.dump() + " does not fit type '" + std::string(type) + "'");
    result.insert(v.get<T>());
  }
  return result;
}

static std::vector<schema_node_ptr> parse_node_list(const nlohmann::json &node, const char *key)
{
  const auto &list = node[key];
  if (!list.is_array())
    throw schema_error(std::string("'") + key + "' must be an array");

  std::vector<schema_node_ptr> nodes;
  for (const auto &child: list)
    nodes.push_back(parse_schema_node(child));
  return nodes;
}

static std::map<std::string, schema_node_ptr> parse_properties(const nlohmann::json &node)
{
  std::map<std::string, schema_node_ptr> properties;
  if (!node.contains("properties"))
    return properties;
  if (!node["properties"].is_object())
    throw schema_error("'properties' must be an object");

  for (const auto &[name, child]: node["properties"].items())
    properties.emplace(name, parse_schema_node(child));
  return properties;
}

static std::set<std::string> parse_required(const nlohmann::json &node)
{
  std::set<std::string> required;
  if (!node.contains("required"))
    return required;
  if (!node["required"].is_array())
    throw schema_error("'required' must be an array");

  for (const auto &name: node["required"]) {
    if (!name.is_string())
      throw schema_error("'required' entries must be strings");
    required.insert(name.get<std::string>());
  }
  return required;
}

// "#/<table>/<name>" names the definition <name>
static std::string reference_name(const nlohmann::json &ref)
{
  if (!ref.is_string())
    throw schema_error("'$ref' must be a string");

  const auto pointer = ref.get<std::string>();
  const auto slashes = std::ranges::count(pointer, '/');
  if (!pointer.starts_with("#/") || slashes != 2 || pointer.back() == '/')
    throw schema_error("unsupported $ref '" + pointer + "', expected '#/" + definitions_key + "/<name>'");

  return pointer.substr(pointer.rfind('/') + 1);
}

schema_node_ptr parse_schema_node(const nlohmann::json &node)
{
  if (!node.is_object())
    throw schema_error("schema node must be an object, got " + node.dump());

  auto info = parse_annotations(node);

  if (node.contains("$ref"))
    return make_node(ref_type{ std::move(info), reference_name(node["$ref"]) });

  if (node.contains("allOf")) {
    check_default(info, "allOf", is_scalar);
    return make_node(all_of_type{ std::move(info), parse_node_list(node, "allOf") });
  }

  if (node.contains("anyOf")) {
    check_default(info, "anyOf", is_scalar);
    return make_node(unresolved_any_of{ std::move(info), parse_node_list(node, "anyOf") });
  }

  if (!node.contains("type"))
    throw schema_error("schema node has no type: " + node.dump());
  if (!node["type"].is_string())
    throw schema_error("'type' must be a string, got " + node["type"].dump());

  const auto type = node["type"].get<std::string>();
  if (type == "null") {
    return make_node(null_type{ std::move(info) });
  } else if (type == "boolean") {
    check_default(info, type, [](const auto &j) { return j.is_boolean(); });
    return make_node(boolean_type{ std::move(info) });
  } else if (type == "integer") {
    check_default(info, type, is_int64);
    return make_node(integer_type{ std::move(info), parse_enum<std::int64_t>(node, type, is_int64) });
  } else if (type == "number") {
    auto accepts = [](const nlohmann::json &j) { return j.is_number(); };
    check_default(info, type, accepts);
    return make_node(number_type{ std::move(info), parse_enum<double>(node, type, accepts) });
  } else if (type == "string") {
    auto accepts = [](const nlohmann::json &j) { return j.is_string(); };
    check_default(info, type, accepts);
    std::optional<std::string> format;
    if (node.contains("format"))
      format = string_field(node, "format");
    return make_node(string_type{ std::move(info), parse_enum<std::string>(node, type, accepts), std::move(format) });
  } else if (type == "array") {
    if (!node.contains("items"))
      throw schema_error("array node has no 'items'");
    return make_node(unresolved_array{ std::move(info), parse_schema_node(node["items"]) });
  } else if (type == "object") {
    return make_node(unresolved_object{ std::move(info), parse_properties(node), parse_required(node) });
  }

  throw schema_error("unsupported type '" + type + "'");
}

schema_document parse_schema_document(const nlohmann::json &document)
{
  if (!document.is_object())
    throw schema_error("schema document must be a JSON object");
  if (!document.contains("type") || document["type"] != "object")
    throw schema_error("schema document root must have type 'object'");

  schema_document result;
  result.title      = string_field(document, "title");
  result.properties = parse_properties(document);
  result.required   = parse_required(document);

  for (const char *key: { "$defs", "definitions" }) {
    if (!document.contains(key))
      continue;
    if (!document[key].is_object())
      throw schema_error(std::string("'") + key + "' must be an object");
    for (const auto &[name, definition]: document[key].items())
      result.definitions.emplace(name, parse_schema_node(definition));
    break;
  }

  spdlog::trace("Parsed schema document '{}' with {} definitions", result.title, result.definitions.size());
  return result;
}

static void write_annotations(nlohmann::json &j, const annotations &info)
{
  if (!info.title.empty())
    j["title"] = info.title;
  if (!info.description.empty())
    j["description"] = info.description;
  if (!info.default_value.is_null())
    j["default"] = info.default_value;
}

template <class T>
static void write_enum(nlohmann::json &j, const std::optional<std::set<T>> &enum_values)
{
  if (enum_values)
    j["enum"] = *enum_values;
}

// Shared between resolved and unresolved trees
template <class Node>
static nlohmann::json node_as_json(const Node &node)
{
  nlohmann::json j = nlohmann::json::object();
  std::visit(overloaded{
               [&](const null_type &) { j["type"] = "null"; },
               [&](const boolean_type &) { j["type"] = "boolean"; },
               [&](const integer_type &integer) {
                 j["type"] = "integer";
                 write_enum(j, integer.enum_values);
               },
               [&](const number_type &number) {
                 j["type"] = "number";
                 write_enum(j, number.enum_values);
               },
               [&](const string_type &string) {
                 j["type"] = "string";
                 write_enum(j, string.enum_values);
                 if (string.format)
                   j["format"] = *string.format;
               },
               [&](const basic_array<Node> &array) {
                 j["type"]  = "array";
                 j["items"] = node_as_json(*array.items);
               },
               [&](const basic_object<Node> &object) {
                 j["type"]       = "object";
                 j["properties"] = nlohmann::json::object();
                 for (const auto &[name, child]: object.properties)
                   j["properties"][name] = node_as_json(*child);
                 if (!object.required.empty())
                   j["required"] = object.required;
               },
               [&](const basic_any_of<Node> &any_of) {
                 j["anyOf"] = nlohmann::json::array();
                 for (const auto &variant: any_of.variants)
                   j["anyOf"].push_back(node_as_json(*variant));
               },
               [&](const all_of_type &all_of) {
                 j["allOf"] = nlohmann::json::array();
                 for (const auto &conjunct: all_of.conjuncts)
                   j["allOf"].push_back(node_as_json(*conjunct));
               },
               [&](const ref_type &ref) { j["$ref"] = std::string("#/") + definitions_key + "/" + ref.target; },
             },
             node.node);
  write_annotations(j, node_annotations(node));
  return j;
}

nlohmann::json as_json(const schema_node &node)
{
  return node_as_json(node);
}

nlohmann::json as_json(const value &node)
{
  return node_as_json(node);
}

nlohmann::json as_json(const schema_document &document)
{
  nlohmann::json j = { { "type", "object" }, { "title", document.title }, { "properties", nlohmann::json::object() } };
  for (const auto &[name, node]: document.properties)
    j["properties"][name] = as_json(*node);
  if (!document.required.empty())
    j["required"] = document.required;
  if (!document.definitions.empty()) {
    j[definitions_key] = nlohmann::json::object();
    for (const auto &[name, node]: document.definitions)
      j[definitions_key][name] = as_json(*node);
  }
  return j;
}

std::expected<schema_document, std::error_code> load_schema_document(const std::filesystem::path &path)
{
  auto contents = get_file_contents<std::string>(path);
  if (!contents) {
    spdlog::debug("Cannot read '{}': {}", path.string(), contents.error().message());
    return std::unexpected(contents.error());
  }
  return parse_schema_document(nlohmann::json::parse(contents.value()));
}

std::expected<void, std::error_code> save_schema_document(const schema_document &document, const std::filesystem::path &path)
{
  // nlohmann::json objects are ordered maps, so keys come out sorted
  return write_file_contents(path, as_json(document).dump(4));
}

std::expected<object_type, std::error_code> load(const std::filesystem::path &path)
{
  auto document = load_schema_document(path);
  if (!document)
    return std::unexpected(document.error());
  return resolve(document.value());
}

} // namespace jsubset
