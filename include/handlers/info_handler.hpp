#pragma once

#include <string>

#include "conf/launcher_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "identity/identifier_resolver.hpp"

namespace devlaunch {

// Read-only summary of the installation: paths, identifier, gates.
class InfoHandler : public IHandler {
  ILauncherConfigProvider &config_provider_;
  customio::ConsoleOutput &output_hub_;
  identity::IdentifierResolver &resolver_;

public:
  InfoHandler(ILauncherConfigProvider &config_provider,
              customio::ConsoleOutput &output_hub,
              identity::IdentifierResolver &resolver)
      : config_provider_(config_provider), output_hub_(output_hub),
        resolver_(resolver) {}

  std::string command() const override { return "info"; }

  int start() override;
};

} // namespace devlaunch
