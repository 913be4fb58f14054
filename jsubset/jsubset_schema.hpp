#pragma once

#include "jsubset_value.hpp"
#include "nlohmann/json.hpp"
#include <expected>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace jsubset {

/**
 * @brief Raised when a JSON document cannot be read as a schema
 */
class schema_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Definitions are written under this key. "definitions" is also accepted on read.
inline constexpr const char *definitions_key = "$defs";

/**
 * @brief Reads one schema node
 * @throws schema_error on an unknown type or a wrongly typed keyword
 *
 * Keyword precedence is $ref, allOf, anyOf, then type.
 */
schema_node_ptr parse_schema_node(const nlohmann::json &node);

/**
 * @brief Reads a root schema document with its definitions table
 * @throws schema_error when the root is not an object schema
 */
schema_document parse_schema_document(const nlohmann::json &document);

nlohmann::json as_json(const schema_node &node);
nlohmann::json as_json(const value &node);
nlohmann::json as_json(const schema_document &document);

/**
 * @brief Loads a schema document from a JSON file
 * @return The document, or the error code of a failed read
 * @throws nlohmann::json::parse_error or schema_error on malformed content
 */
std::expected<schema_document, std::error_code> load_schema_document(const std::filesystem::path &path);

/**
 * @brief Writes a schema document as JSON with sorted keys and a 4 space indent
 */
std::expected<void, std::error_code> save_schema_document(const schema_document &document, const std::filesystem::path &path);

/**
 * @brief Loads a schema document and resolves it
 * @throws resolution_fault, schema_error or nlohmann::json::parse_error on malformed content
 */
std::expected<object_type, std::error_code> load(const std::filesystem::path &path);

} // namespace jsubset
