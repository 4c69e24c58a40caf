#pragma once

#include <string>

#include "conf/launcher_config.hpp"
#include "customio/console_output.hpp"
#include "devlaunch_common.hpp"
#include "handlers/i_handler.hpp"

namespace devlaunch {

// `reset marker|device-id|all`: removes the persisted first-run state so the
// corresponding step runs again on the next launch.
class ResetHandler : public IHandler {
  ILauncherConfigProvider &config_provider_;
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;

public:
  ResetHandler(ILauncherConfigProvider &config_provider,
               customio::ConsoleOutput &output_hub, CliCtx &cli_ctx)
      : config_provider_(config_provider), output_hub_(output_hub),
        cli_ctx_(cli_ctx) {}

  std::string command() const override { return "reset"; }

  int start() override;
};

} // namespace devlaunch
