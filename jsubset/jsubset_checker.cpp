#include "jsubset_checker.hpp"
#include "utilities.hpp"
#include <algorithm>
#include <iterator>

namespace jsubset {

using error_list = std::vector<incompatibility>;

static void check(const value_ptr &a, const value_ptr &b, schema_path &path, error_list &errors);

static void check_string(const string_type &a_string, const value_ptr &a, const value_ptr &b, const schema_path &path, error_list &errors)
{
  const auto *b_string = std::get_if<string_type>(&b->node);
  if (!b_string) {
    errors.push_back({ path, a, b });
    return;
  }

  if (a_string.format != b_string->format) {
    errors.push_back({ path, a, b, "String formats do not match" });
    return;
  }

  if (!b_string->enum_values)
    return;

  if (!a_string.enum_values) {
    errors.push_back({ path, a, b, "Cannot fit any string into an Enum" });
    return;
  }

  // Both sets are ordered, so the difference comes out sorted
  std::vector<std::string> not_in_b;
  std::ranges::set_difference(*a_string.enum_values, *b_string->enum_values, std::back_inserter(not_in_b));
  if (!not_in_b.empty())
    errors.push_back({ path, a, b, "Following keys not in a: " + join(not_in_b, ", ") });
}

static void check_object(const object_type &a_object, const value_ptr &a, const value_ptr &b, schema_path &path, error_list &errors)
{
  const auto *b_object = std::get_if<object_type>(&b->node);
  if (!b_object) {
    errors.push_back({ path, a, b });
    return;
  }

  for (const auto &[key, b_value]: b_object->properties) {
    auto a_value = a_object.properties.find(key);
    path.push_back(key);
    if (a_value != a_object.properties.end()) {
      check(a_value->second, b_value, path, errors);
    } else if (b_object->required.contains(key)) {
      std::vector<std::string> available;
      for (const auto &[name, node]: a_object.properties)
        available.push_back(name);
      errors.push_back({ path, a, b, "Key: " + key + " not in " + join(available, ", ") });
    }
    path.pop_back();
  }
}

static void check(const value_ptr &a, const value_ptr &b, schema_path &path, error_list &errors)
{
  // A union on the right is satisfied by any one of its variants
  if (!std::holds_alternative<any_of_type>(a->node)) {
    if (const auto *b_union = std::get_if<any_of_type>(&b->node)) {
      std::vector<error_list> variant_errors;
      for (const auto &variant: b_union->variants) {
        auto &current = variant_errors.emplace_back();
        check(a, variant, path, current);
        if (current.empty())
          return;
      }
      for (auto &current: variant_errors)
        std::ranges::move(current, std::back_inserter(errors));
      return;
    }
  }

  std::visit(overloaded{
               [&](const any_of_type &a_union) {
                 // Every variant the producer may emit has to fit b
                 for (const auto &variant: a_union.variants)
                   check(variant, b, path, errors);
               },
               [&](const string_type &a_string) {
                 check_string(a_string, a, b, path, errors);
               },
               [&](const scalar_alternative auto &) {
                 if (a->node.index() != b->node.index())
                   errors.push_back({ path, a, b });
               },
               [&](const array_type &a_array) {
                 const auto *b_array = std::get_if<array_type>(&b->node);
                 if (!b_array) {
                   errors.push_back({ path, a, b });
                   return;
                 }
                 path.push_back(array_element_segment);
                 check(a_array.items, b_array->items, path, errors);
                 path.pop_back();
               },
               [&](const object_type &a_object) {
                 check_object(a_object, a, b, path, errors);
               },
             },
             a->node);
}

std::vector<incompatibility> is_subset(const value_ptr &a, const value_ptr &b, const schema_path &path)
{
  error_list errors;
  schema_path current = path;
  check(a, b, current, errors);
  return errors;
}

std::vector<incompatibility> is_subset(const object_type &a, const object_type &b)
{
  return is_subset(make_value(a), make_value(b));
}

} // namespace jsubset
