#include "jsubset_error.hpp"
#include "utilities.hpp"

namespace jsubset {

static std::string_view node_type_name(const value_ptr &node)
{
  return node ? type_name(*node) : std::string_view{ "None" };
}

std::string incompatibility::to_string() const
{
  std::string line = "At ." + join(path, ".") + " " + message + " - a: ";
  line.append(node_type_name(a));
  line.append(" b: ");
  line.append(node_type_name(b));
  return line;
}

nlohmann::json incompatibility::as_json() const
{
  return { { "path", path }, { "message", message }, { "a", std::string(node_type_name(a)) }, { "b", std::string(node_type_name(b)) } };
}

std::ostream &operator<<(std::ostream &os, const incompatibility &error)
{
  return os << error.to_string();
}

} // namespace jsubset
