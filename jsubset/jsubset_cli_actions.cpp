#include "jsubset_cli_actions.hpp"
#include "jsubset_checker.hpp"
#include "jsubset_history.hpp"
#include "jsubset_resolver.hpp"
#include "jsubset_schema.hpp"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include <chrono>
#include <iostream>

namespace jsubset {

cxxopts::Options cli_options()
{
  cxxopts::Options options("jsubset", "Checks that every value accepted by one JSON schema is accepted by another");
  options.allow_unrecognised_options();
  options.positional_help("<action> [schema files]");
  // clang-format off
  options.add_options()("h,help", "Print usage")
                       ("c,config", "Configuration file", cxxopts::value<std::string>())
                       ("json", "Report incompatibilities as JSON", cxxopts::value<bool>()->default_value("false"))
                       ("log-level", "Log file level (trace, debug, info, warn, err, critical, off)", cxxopts::value<std::string>())
                       ("history-dir", "Directory holding the schema versions", cxxopts::value<std::string>())
                       ("record", "Schema file to record into the history before checking it", cxxopts::value<std::string>())
                       ("action", "Select from 'check', 'resolve' or 'history'", cxxopts::value<std::string>());
  // clang-format on
  options.parse_positional({ "action" });
  return options;
}

std::string format_incompatibilities(const std::vector<incompatibility> &errors, config::output_format format)
{
  if (format == config::output_format::JSON) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto &e: errors)
      list.push_back(e.as_json());
    return list.dump(4);
  }

  std::string text;
  for (const auto &e: errors)
    text += e.to_string() + "\n";
  return text;
}

int check_action(const config &config, const cxxopts::ParseResult &result)
{
  if (result.unmatched().size() != 2) {
    spdlog::error("'check' needs two schema files: <a.json> <b.json>");
    return EXIT_FAULT;
  }
  const auto &a_path = result.unmatched()[0];
  const auto &b_path = result.unmatched()[1];

  try {
    auto t1 = std::chrono::high_resolution_clock::now();
    auto a  = load(a_path);
    if (!a.has_value()) {
      spdlog::error("Failed to load '{}': {}", a_path, a.error().message());
      return EXIT_FAULT;
    }
    auto b = load(b_path);
    if (!b.has_value()) {
      spdlog::error("Failed to load '{}': {}", b_path, b.error().message());
      return EXIT_FAULT;
    }

    auto errors   = is_subset(a.value(), b.value());
    auto t2       = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(t2 - t1).count();
    spdlog::info("{}ms to compare '{}' with '{}'", duration, a_path, b_path);

    if (config.output == config::output_format::JSON || !errors.empty())
      std::cout << format_incompatibilities(errors, config.output);
    if (config.output == config::output_format::JSON)
      std::cout << "\n";

    if (!errors.empty()) {
      spdlog::get("console")->info("'{}' is not a subset of '{}': {} incompatibilities", a_path, b_path, errors.size());
      return EXIT_INCOMPATIBLE;
    }
    spdlog::get("console")->info("'{}' is a subset of '{}'", a_path, b_path);
    return EXIT_COMPATIBLE;
  } catch (const resolution_fault &e) {
    spdlog::error("Cannot resolve schema: {}", e.what());
  } catch (const std::exception &e) {
    spdlog::error("Cannot read schema: {}", e.what());
  }
  return EXIT_FAULT;
}

int resolve_action(const config &config, const cxxopts::ParseResult &result)
{
  if (result.unmatched().size() != 1) {
    spdlog::error("'resolve' needs one schema file");
    return EXIT_FAULT;
  }

  try {
    auto resolved = load(result.unmatched()[0]);
    if (!resolved.has_value()) {
      spdlog::error("Failed to load '{}': {}", result.unmatched()[0], resolved.error().message());
      return EXIT_FAULT;
    }
    std::cout << as_json(value{ resolved.value() }).dump(4) << "\n";
    return EXIT_COMPATIBLE;
  } catch (const std::exception &e) {
    spdlog::error("Cannot resolve '{}': {}", result.unmatched()[0], e.what());
  }
  return EXIT_FAULT;
}

int history_action(const config &config, const cxxopts::ParseResult &result)
{
  directory_version_history history(config.history_directory);

  try {
    if (result.count("record")) {
      const auto schema_file = result["record"].as<std::string>();
      auto document          = load_schema_document(schema_file);
      if (!document.has_value()) {
        spdlog::error("Failed to load '{}': {}", schema_file, document.error().message());
        return EXIT_FAULT;
      }
      auto version = record_version(history, document.value());
      if (!version.has_value()) {
        spdlog::error("Failed to record '{}': {}", schema_file, version.error().message());
        return EXIT_FAULT;
      }
      spdlog::get("console")->info("'{}' is stored as {}", schema_file, history.describe(version.value()));
    }

    auto failures = check_history(history);
    if (!failures.has_value()) {
      spdlog::error("Failed to read schema history in '{}': {}", config.history_directory.string(), failures.error().message());
      return EXIT_FAULT;
    }

    for (const auto &f: failures.value()) {
      std::cout << "Backwards compatible schema failure between " << history.describe(f.older) << " and " << history.describe(f.newer) << ":\n";
      std::cout << format_incompatibilities(f.errors, config.output) << "\n";
    }
    if (!failures->empty())
      return EXIT_INCOMPATIBLE;

    spdlog::get("console")->info("{} schema versions are backwards compatible", history.versions().size());
    return EXIT_COMPATIBLE;
  } catch (const std::exception &e) {
    spdlog::error("Schema history check failed: {}", e.what());
  }
  return EXIT_FAULT;
}

int setup_logging(const config &config)
{
  std::error_code error_code;
  std::filesystem::remove(config.log_file, error_code);

  auto console = spdlog::stdout_color_mt("console");
  // Keep stdout parseable when reporting as JSON
  if (config.output == config::output_format::JSON)
    console->set_level(spdlog::level::warn);

  auto console_error = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_error->set_level(spdlog::level::warn);
  console_error->set_pattern("[%^%l%$]: %v");
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_log;
  try {
    file_log = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file, true);
  } catch (const spdlog::spdlog_ex &) {
    try {
      auto time = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
      file_log  = std::make_shared<spdlog::sinks::basic_file_sink_mt>("jsubset-" + std::to_string(time) + ".log", true);
    } catch (const spdlog::spdlog_ex &e) {
      std::cerr << "Cannot open " << config.log_file << ": " << e.what() << "\n";
      return -1;
    }
  }
  file_log->set_level(config.log_level);

  auto jsubsetlog = std::make_shared<spdlog::logger>("jsubsetlog", spdlog::sinks_init_list{ console_error, file_log });
  jsubsetlog->set_level(spdlog::level::trace);
  spdlog::set_default_logger(jsubsetlog);
  return 0;
}

} // namespace jsubset
