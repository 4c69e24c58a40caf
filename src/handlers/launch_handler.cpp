#include "handlers/launch_handler.hpp"

#include "launch/first_run_launcher.hpp"

namespace devlaunch {

int LaunchHandler::start() {
  launch::FirstRunLauncher launcher(config_provider_, output_hub_, resolver_,
                                    runner_, prompt_);
  auto outcome =
      launcher.ensure_initialized_and_launch(cli_ctx_.params.passthrough);
  output_hub_.logger().debug()
      << "Launcher finished in state " << launch::to_string(outcome.final_state)
      << " with exit status " << outcome.exit_code << std::endl;
  return outcome.exit_code;
}

} // namespace devlaunch
