#include "jsubset_config.hpp"
#include <stdexcept>

namespace jsubset {

spdlog::level::level_enum parse_log_level(const std::string &name)
{
  // from_str() maps unknown names to "off"
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off")
    throw std::invalid_argument("unknown log level '" + name + "'");
  return level;
}

config::output_format parse_output_format(const std::string &name)
{
  if (name == "text")
    return config::output_format::TEXT;
  else if (name == "json")
    return config::output_format::JSON;
  throw std::invalid_argument("unknown output format '" + name + "', expected 'text' or 'json'");
}

config parse_config(const YAML::Node &node)
{
  config result;
  if (!node || node.IsNull())
    return result;
  if (!node.IsMap())
    throw std::invalid_argument("configuration must be a YAML mapping");

  if (node["log_file"])
    result.log_file = node["log_file"].as<std::string>();
  if (node["log_level"])
    result.log_level = parse_log_level(node["log_level"].as<std::string>());
  if (node["output"])
    result.output = parse_output_format(node["output"].as<std::string>());
  if (node["history_directory"])
    result.history_directory = node["history_directory"].as<std::string>();

  return result;
}

std::expected<config, std::error_code> load_config_file(const std::filesystem::path &config_file_path)
{
  std::error_code ec;
  if (!std::filesystem::exists(config_file_path, ec))
    return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));

  return parse_config(YAML::LoadFile(config_file_path.string()));
}

} // namespace jsubset
