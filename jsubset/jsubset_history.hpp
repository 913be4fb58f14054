#pragma once

#include "jsubset_value.hpp"
#include "jsubset_error.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace jsubset {

/**
 * @brief Ordered store of schema snapshots, numbered from 1
 */
class version_history {
public:
  virtual ~version_history() = default;

  /** @return Stored version numbers in ascending order */
  virtual std::vector<unsigned> versions() const = 0;

  virtual std::expected<schema_document, std::error_code> load_version(unsigned version) const = 0;
  virtual std::expected<void, std::error_code> store_version(unsigned version, const schema_document &document) = 0;

  /** @return Human readable name of a version, used in reports */
  virtual std::string describe(unsigned version) const = 0;

  /** @return Highest stored version, 0 when the history is empty */
  unsigned latest_version() const;
};

/**
 * @brief History kept as NNNN.json files in one directory
 */
class directory_version_history : public version_history {
public:
  explicit directory_version_history(fs::path directory);

  std::vector<unsigned> versions() const override;
  std::expected<schema_document, std::error_code> load_version(unsigned version) const override;
  std::expected<void, std::error_code> store_version(unsigned version, const schema_document &document) override;
  std::string describe(unsigned version) const override;

  fs::path version_path(unsigned version) const;

private:
  fs::path directory;
};

struct history_failure {
  unsigned older;
  unsigned newer;
  std::vector<incompatibility> errors;
};

// Zero padded to four digits, e.g. 0007.json
std::string version_filename(unsigned version);

/**
 * @brief Stores `document` as a new version unless it resolves to the same tree as the latest one
 * @return Version number now holding the document
 * @throws resolution_fault or schema_error when a document cannot be resolved
 */
std::expected<unsigned, std::error_code> record_version(version_history &history, const schema_document &document);

/**
 * @brief Checks that every version is a subset of the version that follows it
 * @return One entry per incompatible consecutive pair, empty when the history is compatible
 * @throws resolution_fault or schema_error when a stored document cannot be resolved
 */
std::expected<std::vector<history_failure>, std::error_code> check_history(const version_history &history);

} // namespace jsubset
