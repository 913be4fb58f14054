#include "jsubset_cli_actions.hpp"
#include "jsubset_config.hpp"
#include "cxxopts.hpp"
#include "spdlog/spdlog.h"
#include <iostream>
#include <optional>

static std::optional<jsubset::config> load_configuration(const cxxopts::ParseResult &result);

int main(int argc, char **argv)
{
  auto options = jsubset::cli_options();

  cxxopts::ParseResult result;
  try {
    result = options.parse(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << e.what() << "\n" << options.help() << std::endl;
    return jsubset::EXIT_FAULT;
  }

  if (result.count("help") || !result.count("action")) {
    std::cout << options.help() << std::endl;
    return 0;
  }

  auto config = load_configuration(result);
  if (!config)
    return jsubset::EXIT_FAULT;

  if (jsubset::setup_logging(config.value()) != 0)
    return jsubset::EXIT_FAULT;

  const auto action = result["action"].as<std::string>();
  auto action_it    = jsubset::cli_actions.find(action);
  if (action_it == jsubset::cli_actions.end()) {
    spdlog::error("Unknown action '{}'", action);
    std::cout << options.help() << std::endl;
    spdlog::shutdown();
    return jsubset::EXIT_FAULT;
  }

  const int status = action_it->second(config.value(), result);
  spdlog::shutdown();
  return status;
}

static std::optional<jsubset::config> load_configuration(const cxxopts::ParseResult &result)
{
  jsubset::config config;
  try {
    if (result.count("config")) {
      const auto config_file = result["config"].as<std::string>();
      auto loaded            = jsubset::load_config_file(config_file);
      if (!loaded.has_value()) {
        std::cerr << "Cannot open configuration '" << config_file << "': " << loaded.error().message() << "\n";
        return std::nullopt;
      }
      config = loaded.value();
    } else {
      // The default file is optional
      auto loaded = jsubset::load_config_file(jsubset::default_config_filename);
      if (loaded.has_value())
        config = loaded.value();
    }

    if (result["json"].as<bool>())
      config.output = jsubset::config::output_format::JSON;
    if (result.count("log-level"))
      config.log_level = jsubset::parse_log_level(result["log-level"].as<std::string>());
    if (result.count("history-dir"))
      config.history_directory = result["history-dir"].as<std::string>();
  } catch (const std::exception &e) {
    std::cerr << "Invalid configuration: " << e.what() << "\n";
    return std::nullopt;
  }
  return config;
}
