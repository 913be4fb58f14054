#pragma once

#include "yaml-cpp/yaml.h"
#include "spdlog/spdlog.h"
#include <expected>
#include <filesystem>
#include <string>
#include <system_error>

namespace jsubset {

// Read from the working directory when no --config is given
inline constexpr const char *default_config_filename = ".jsubset.yaml";

struct config {
  enum class output_format {
    TEXT,
    JSON,
  };

  std::string log_file                    = "jsubset.log";
  spdlog::level::level_enum log_level     = spdlog::level::info;
  output_format output                    = output_format::TEXT;
  std::filesystem::path history_directory = "schemas";
};

/**
 * @brief Applies the keys of a YAML mapping on top of the defaults
 * @throws YAML::Exception on a wrongly typed value
 * @throws std::invalid_argument on an unknown log level or output format
 */
config parse_config(const YAML::Node &node);

/**
 * @brief Loads a configuration file
 * @return The configuration, or no_such_file_or_directory when the file is missing
 * @throws YAML::Exception or std::invalid_argument on malformed content
 */
std::expected<config, std::error_code> load_config_file(const std::filesystem::path &config_file_path);

spdlog::level::level_enum parse_log_level(const std::string &name);
config::output_format parse_output_format(const std::string &name);

} // namespace jsubset
