#pragma once

#include <optional>
#include <string>
#include <vector>

#include "conf/launcher_config.hpp"
#include "customio/console_output.hpp"
#include "identity/identifier_resolver.hpp"
#include "launch/launch_state.hpp"
#include "launch/marker_file.hpp"
#include "launch/operator_prompt.hpp"
#include "launch/process_runner.hpp"
#include "launch_error.hpp"

namespace devlaunch::launch {

inline constexpr const char kPauseMessage[] = "Press Enter to close this window...";

struct LaunchOutcome {
  // Process exit status for main(): the application's own status when it
  // ran, otherwise one of exit_status::*.
  int exit_code{exit_status::OK};
  // Launcher-owned failure; unset when the application ran (whatever its
  // exit status).
  std::optional<Error> error;
  bool application_ran{false};
  LaunchState final_state{LaunchState::NeedsIdentifier};
  std::string identifier;
};

// Drives the one-time initialization gates and then runs the bundled
// application:
//   1. the runtime interpreter and target entry must exist (nothing is
//      written otherwise);
//   2. the device identifier is resolved when no file holds one;
//   3. the setup command runs when the unpack gate is enabled and the marker
//      is absent; the marker is written only after it succeeds;
//   4. the application is started and waited for;
//   5. the operator prompt is acknowledged.
class FirstRunLauncher {
public:
  FirstRunLauncher(const ILauncherConfigProvider &config_provider,
                   customio::ConsoleOutput &output,
                   identity::IdentifierResolver &resolver,
                   IProcessRunner &runner, IOperatorPrompt &prompt);

  LaunchOutcome
  ensure_initialized_and_launch(const std::vector<std::string> &extra_args);

  // Command line used for the application: interpreter, entry, configured
  // args, then `extra_args`.
  std::vector<std::string>
  application_argv(const std::vector<std::string> &extra_args) const;

  // Setup command with argv[0] resolved against the base directory when it
  // is a relative path containing a directory component.
  std::vector<std::string> setup_argv() const;

private:
  std::optional<Error> check_assets(const LaunchStateSnapshot &snapshot);
  std::optional<Error> run_setup_step();
  LaunchOutcome finish(LaunchOutcome outcome);

  const LauncherConfig &config_;
  customio::ConsoleOutput &output_;
  identity::IdentifierResolver &resolver_;
  IProcessRunner &runner_;
  IOperatorPrompt &prompt_;
};

} // namespace devlaunch::launch
