#pragma once

#include "jsubset_config.hpp"
#include "jsubset_error.hpp"
#include "cxxopts.hpp"
#include "spdlog/spdlog.h"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace jsubset {

enum exit_status : int {
  EXIT_COMPATIBLE   = 0,
  EXIT_INCOMPATIBLE = 1,
  EXIT_FAULT        = 2,
};

using action_handler = std::function<int(const jsubset::config &, const cxxopts::ParseResult &)>;

int check_action(const config &config, const cxxopts::ParseResult &result);
int resolve_action(const config &config, const cxxopts::ParseResult &result);
int history_action(const config &config, const cxxopts::ParseResult &result);

// clang-format off
const std::unordered_map<std::string, action_handler> cli_actions = {
  { "check", check_action },
  { "resolve", resolve_action },
  { "history", history_action }
};
// clang-format on

// Options shared by the executable and its tests. Schema file arguments are left in unmatched().
cxxopts::Options cli_options();

/**
 * @brief Creates the "console" logger and a default logger writing to stderr and the log file
 * @return 0 on success, -1 when no log file can be opened
 */
int setup_logging(const config &config);

std::string format_incompatibilities(const std::vector<incompatibility> &errors, config::output_format format);

} // namespace jsubset
