#pragma once

#include "jsubset_value.hpp"
#include "nlohmann/json.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace jsubset {

using schema_path = std::vector<std::string>;

// Path segment standing for one element of an array
inline constexpr const char *array_element_segment = "[]";

/**
 * @brief One point where the left schema accepts something the right schema rejects
 */
struct incompatibility {
  schema_path path; // Property names, or "[]" for an array element
  value_ptr a;      // Offending node of the left schema
  value_ptr b;      // Offending node of the right schema
  std::string message = "Types don't match";

  /**
   * @brief Formats the record as "At .<path> <message> - a: <TypeA> b: <TypeB>"
   */
  std::string to_string() const;

  nlohmann::json as_json() const;
};

std::ostream &operator<<(std::ostream &os, const incompatibility &error);

} // namespace jsubset
