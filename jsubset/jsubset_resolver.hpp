#pragma once

#include "jsubset_value.hpp"
#include <stdexcept>
#include <string>

namespace jsubset {

/**
 * @brief Raised when a document holds a construct that cannot be resolved
 *
 * Covers an allOf that is not a single $ref wrapper and a $ref naming a missing definition.
 */
class resolution_fault : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Inlines every definition of a document into its root object
 * @param document Schema document with its definitions table
 * @return Root object holding no allOf or $ref node
 * @throws resolution_fault on an unsupported allOf or an unknown reference
 *
 * The input document is left untouched. Cyclic definitions are not detected.
 */
object_type resolve(const schema_document &document);

/**
 * @brief Resolves one node against a definitions table
 * @throws resolution_fault on an unsupported allOf or an unknown reference
 */
value_ptr resolve(const schema_node &node, const definition_table &definitions);

} // namespace jsubset
