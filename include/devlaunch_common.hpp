#pragma once

#include <algorithm>
#include <array>
#include <boost/program_options.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common_macros.hpp"

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace devlaunch {

// Subcommand used when none is given on the command line.
inline constexpr const char kDefaultSubcommand[] = "launch";

struct CliParams {
  fs::path base_dir;
  std::string subcmd;
  std::string verbose; // vvvv
  bool silent = false;
  bool no_pause = false;
  bool force = false;
  // Tokens after "--", appended to the application's command line.
  std::vector<std::string> passthrough;
};

struct CliCtx {
  po::variables_map vm;
  std::vector<std::string> positionals;
  devlaunch::CliParams params;
  CliCtx(po::variables_map &&vm,                 //
         std::vector<std::string> &&positionals, //
         devlaunch::CliParams &&params_)
      : vm(std::move(vm)), positionals(std::move(positionals)),
        params(std::move(params_)) {}
  // Returns true iff the option exists in variables_map and was not defaulted,
  // i.e., explicitly specified by the user on the command line.
  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }
  bool positional_contains(const std::string &name) const {
    return std::find(positionals.begin(), positionals.end(), name) !=
           positionals.end();
  }

  // Positional argument following the subcommand, if any.
  std::optional<std::string> subcommand_argument() const {
    if (positionals.size() < 2) {
      return std::nullopt;
    }
    return positionals[1];
  }

  size_t verbosity_level() const {
    if (params.silent) {
      return 0;
    }
    if (params.verbose.empty()) {
      return 3;
    }
    if (params.verbose == "trace") {
      return 5;
    } else if (params.verbose == "debug") {
      return 4;
    } else if (params.verbose == "info") {
      return 3;
    } else if (params.verbose == "warning") {
      return 2;
    } else if (params.verbose == "error") {
      return 1;
    }
    return std::count(params.verbose.begin(), params.verbose.end(), 'v');
  }
  ~CliCtx() { DEBUG_PRINT("CliCtx destroyed"); }
};

inline bool is_known_subcommand(std::string_view candidate) {
  static constexpr std::array<std::string_view, 4> kKnown{
      "launch", "resolve-id", "info", "reset"};
  return std::find(kKnown.begin(), kKnown.end(), candidate) != kKnown.end();
}

// Splits argv at the first "--": the launcher parses the part before it,
// the rest is handed to the application untouched.
inline std::pair<std::vector<std::string>, std::vector<std::string>>
split_passthrough(int argc, char *argv[]) {
  std::vector<std::string> own;
  std::vector<std::string> passthrough;
  bool seen_separator = false;
  for (int i = 0; i < argc; ++i) {
    std::string arg = argv[i] ? std::string(argv[i]) : std::string{};
    if (!seen_separator && i > 0 && arg == "--") {
      seen_separator = true;
      continue;
    }
    (seen_separator ? passthrough : own).push_back(std::move(arg));
  }
  return {std::move(own), std::move(passthrough)};
}

} // namespace devlaunch
