#pragma once

#include "jsubset_value.hpp"
#include "jsubset_error.hpp"
#include <vector>

namespace jsubset {

/**
 * @brief Lists every reason why a value accepted by `a` may be rejected by `b`
 * @param a Resolved left schema (the producer's shape)
 * @param b Resolved right schema (the consumer's shape)
 * @param path Location of `a` and `b` within their enclosing documents
 * @return Incompatibilities in discovery order. Empty when `a` is a subset of `b`.
 *
 * The relation is structural and performs no coercion. An anyOf on the left must
 * match `b` in every variant, while an anyOf on the right needs only one matching
 * variant. Integer is never accepted where Number is expected.
 */
std::vector<incompatibility> is_subset(const value_ptr &a, const value_ptr &b, const schema_path &path = {});

std::vector<incompatibility> is_subset(const object_type &a, const object_type &b);

} // namespace jsubset
