#pragma once

#include <string>

#include "customio/console_output.hpp"
#include "devlaunch_common.hpp"
#include "handlers/i_handler.hpp"
#include "identity/identifier_resolver.hpp"

namespace devlaunch {

// `resolve-id [--force]`: prints the device identifier, resolving and
// persisting it first when needed. --force re-queries the providers and
// overwrites the file.
class ResolveIdHandler : public IHandler {
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;
  identity::IdentifierResolver &resolver_;

public:
  ResolveIdHandler(customio::ConsoleOutput &output_hub, CliCtx &cli_ctx,
                   identity::IdentifierResolver &resolver)
      : output_hub_(output_hub), cli_ctx_(cli_ctx), resolver_(resolver) {}

  std::string command() const override { return "resolve-id"; }

  int start() override;
};

} // namespace devlaunch
