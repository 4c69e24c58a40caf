#pragma once

#include <string>

#include "conf/launcher_config.hpp"
#include "customio/console_output.hpp"
#include "devlaunch_common.hpp"
#include "handlers/i_handler.hpp"
#include "identity/identifier_resolver.hpp"
#include "launch/operator_prompt.hpp"
#include "launch/process_runner.hpp"

namespace devlaunch {

// Default subcommand: first-run initialization followed by the application.
class LaunchHandler : public IHandler {
  ILauncherConfigProvider &config_provider_;
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;
  identity::IdentifierResolver &resolver_;
  launch::IProcessRunner &runner_;
  launch::IOperatorPrompt &prompt_;

public:
  LaunchHandler(ILauncherConfigProvider &config_provider,
                customio::ConsoleOutput &output_hub, CliCtx &cli_ctx,
                identity::IdentifierResolver &resolver,
                launch::IProcessRunner &runner,
                launch::IOperatorPrompt &prompt)
      : config_provider_(config_provider), output_hub_(output_hub),
        cli_ctx_(cli_ctx), resolver_(resolver), runner_(runner),
        prompt_(prompt) {}

  std::string command() const override { return "launch"; }

  int start() override;
};

} // namespace devlaunch
