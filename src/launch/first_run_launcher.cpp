#include "launch/first_run_launcher.hpp"

#include <fmt/format.h>

#include "util/device_info.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace devlaunch::launch {

FirstRunLauncher::FirstRunLauncher(
    const ILauncherConfigProvider &config_provider,
    customio::ConsoleOutput &output, identity::IdentifierResolver &resolver,
    IProcessRunner &runner, IOperatorPrompt &prompt)
    : config_(config_provider.get()), output_(output), resolver_(resolver),
      runner_(runner), prompt_(prompt) {}

std::vector<std::string> FirstRunLauncher::application_argv(
    const std::vector<std::string> &extra_args) const {
  std::vector<std::string> argv;
  argv.reserve(2 + config_.target_args.size() + extra_args.size());
  argv.push_back(config_.interpreter_path().string());
  argv.push_back(config_.target_entry_path().string());
  argv.insert(argv.end(), config_.target_args.begin(),
              config_.target_args.end());
  argv.insert(argv.end(), extra_args.begin(), extra_args.end());
  return argv;
}

std::vector<std::string> FirstRunLauncher::setup_argv() const {
  std::vector<std::string> argv = config_.unpack.command;
  if (!argv.empty()) {
    fs::path program(argv[0]);
    // Bare names go through PATH.
    if (program.is_relative() && program.has_parent_path()) {
      argv[0] = config_.resolve(argv[0]).string();
    }
  }
  return argv;
}

std::optional<Error>
FirstRunLauncher::check_assets(const LaunchStateSnapshot &snapshot) {
  if (!snapshot.runtime_present) {
    return make_error(
        my_errors::LAUNCH::MISSING_ASSET,
        fmt::format("Runtime interpreter not found at {}. Extract the bundled "
                    "runtime next to the launcher before starting it.",
                    config_.interpreter_path().string()));
  }
  if (!snapshot.target_present) {
    return make_error(my_errors::LAUNCH::MISSING_ASSET,
                      fmt::format("Application entry point not found at {}",
                                  config_.target_entry_path().string()));
  }
  return std::nullopt;
}

std::optional<Error> FirstRunLauncher::run_setup_step() {
  ProcessSpec spec;
  spec.argv = setup_argv();
  if (spec.argv.empty()) {
    return make_error(my_errors::LAUNCH::CONFIG_ERROR,
                      "unpack.command is empty while unpack is enabled");
  }
  spec.working_dir = config_.base_dir;
  spec.timeout_ms = config_.unpack.timeout_ms;

  output_.printer().cyan(
      "First run: preparing the runtime environment, this can take a while...");
  output_.logger().info() << "Running setup step: "
                          << stringutil::join_for_display(spec.argv)
                          << std::endl;

  auto result = runner_.run(spec);
  if (!result.ok()) {
    return make_error(my_errors::LAUNCH::SETUP_STEP_FAILED,
                      fmt::format("Setup step {} failed: {}",
                                  stringutil::join_for_display(spec.argv),
                                  result.describe()));
  }
  output_.logger().info() << "Setup step completed" << std::endl;
  return std::nullopt;
}

LaunchOutcome FirstRunLauncher::finish(LaunchOutcome outcome) {
  if (outcome.error) {
    output_.printer().red(outcome.error->what);
    output_.logger().error() << *outcome.error << std::endl;
  }
  prompt_.acknowledge(kPauseMessage);
  return outcome;
}

LaunchOutcome FirstRunLauncher::ensure_initialized_and_launch(
    const std::vector<std::string> &extra_args) {
  LaunchOutcome outcome;
  auto snapshot = LaunchStateSnapshot::capture(config_);
  outcome.final_state = snapshot.state();
  output_.logger().debug() << "Launch state at startup: "
                           << to_string(outcome.final_state) << std::endl;

  if (auto err = check_assets(snapshot)) {
    outcome.exit_code = exit_status::MISSING_ASSET;
    outcome.error = std::move(err);
    return finish(std::move(outcome));
  }

  // Read back even when present so the logs carry the device's public id.
  auto resolved = resolver_.resolve_device_identifier();
  outcome.identifier = resolved.value;
  tag_logs_with_device(device::device_public_id(resolved.value));
  if (resolved.fresh) {
    output_.logger().info() << "Device identifier initialized (source: "
                            << resolved.source << ")" << std::endl;
  }
  snapshot.identifier_present = true;
  outcome.final_state = snapshot.state();

  if (outcome.final_state == LaunchState::NeedsUnpack) {
    if (auto err = run_setup_step()) {
      outcome.exit_code = err->code == my_errors::LAUNCH::CONFIG_ERROR
                              ? exit_status::CONFIG_ERROR
                              : exit_status::SETUP_FAILED;
      outcome.error = std::move(err);
      return finish(std::move(outcome));
    }
    MarkerFile marker(config_.marker_path());
    if (auto err = marker.create()) {
      // The setup step is repeatable; it simply runs again next time.
      output_.logger().warning()
          << "Could not record setup completion: " << *err << std::endl;
    }
    snapshot.marker_present = true;
    outcome.final_state = snapshot.state();
  }

  ProcessSpec spec;
  spec.argv = application_argv(extra_args);
  spec.working_dir = config_.base_dir;
  output_.logger().info() << "Launching: "
                          << stringutil::join_for_display(spec.argv)
                          << std::endl;

  auto result = runner_.run(spec);
  if (result.error) {
    outcome.exit_code = exit_status::LAUNCH_FAILED;
    outcome.error =
        make_error(my_errors::LAUNCH::SPAWN_FAILED,
                   fmt::format("Failed to start the application: {}",
                               result.error->what));
    return finish(std::move(outcome));
  }

  outcome.application_ran = true;
  outcome.exit_code = result.exit_code;
  if (result.exit_code != 0) {
    output_.printer().yellow(
        fmt::format("The application exited with status {}", result.exit_code));
    output_.logger().warning() << "Application " << result.describe()
                               << std::endl;
  } else {
    output_.logger().info() << "Application exited normally" << std::endl;
  }
  return finish(std::move(outcome));
}

} // namespace devlaunch::launch
