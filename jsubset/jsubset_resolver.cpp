#include "jsubset_resolver.hpp"
#include "spdlog/spdlog.h"

namespace jsubset {

static value_ptr resolve_reference(const std::string &target, const definition_table &definitions)
{
  auto definition = definitions.find(target);
  if (definition == definitions.end() || !definition->second)
    throw resolution_fault("unknown reference: '" + target + "' is not in the definitions table");

  spdlog::trace("Expanding reference '{}'", target);
  return resolve(*definition->second, definitions);
}

// Copy of a resolved node with its default replaced
static value_ptr with_default(const value &node, const nlohmann::json &default_value)
{
  return std::visit(
    [&](auto alternative) {
      alternative.info.default_value = default_value;
      return make_value(std::move(alternative));
    },
    node.node);
}

static value_ptr resolve_child(const schema_node_ptr &child, const definition_table &definitions, std::string_view role)
{
  if (!child)
    throw resolution_fault("missing " + std::string(role));
  return resolve(*child, definitions);
}

static std::map<std::string, value_ptr> resolve_properties(const std::map<std::string, schema_node_ptr> &properties, const definition_table &definitions)
{
  std::map<std::string, value_ptr> resolved;
  for (const auto &[name, node]: properties)
    resolved.emplace(name, resolve_child(node, definitions, "property '" + name + "'"));
  return resolved;
}

value_ptr resolve(const schema_node &node, const definition_table &definitions)
{
  return std::visit(overloaded{
                      [](const scalar_alternative auto &scalar) -> value_ptr {
                        return make_value(scalar);
                      },
                      [&](const unresolved_array &array) -> value_ptr {
                        return make_value(array_type{ array.info, resolve_child(array.items, definitions, "array items") });
                      },
                      [&](const unresolved_object &object) -> value_ptr {
                        return make_value(object_type{ object.info, resolve_properties(object.properties, definitions), object.required });
                      },
                      [&](const unresolved_any_of &any_of) -> value_ptr {
                        any_of_type resolved{ any_of.info, {} };
                        resolved.variants.reserve(any_of.variants.size());
                        for (const auto &variant: any_of.variants)
                          resolved.variants.push_back(resolve_child(variant, definitions, "anyOf variant"));
                        return make_value(std::move(resolved));
                      },
                      [&](const all_of_type &all_of) -> value_ptr {
                        if (all_of.conjuncts.size() != 1 || !all_of.conjuncts.front() || !std::holds_alternative<ref_type>(all_of.conjuncts.front()->node))
                          throw resolution_fault("unsupported AllOf shape: only a single $ref conjunct is supported");

                        const auto &ref = std::get<ref_type>(all_of.conjuncts.front()->node);
                        auto aliased    = resolve_reference(ref.target, definitions);
                        if (all_of.info.default_value.is_null())
                          return aliased;
                        return with_default(*aliased, all_of.info.default_value);
                      },
                      [&](const ref_type &ref) -> value_ptr {
                        return resolve_reference(ref.target, definitions);
                      },
                    },
                    node.node);
}

object_type resolve(const schema_document &document)
{
  spdlog::debug("Resolving '{}' with {} definitions", document.title, document.definitions.size());
  return object_type{ {}, resolve_properties(document.properties, document.definitions), document.required };
}

} // namespace jsubset
