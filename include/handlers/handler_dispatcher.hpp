#pragma once

#include <optional>
#include <string>

#include "customio/output.hpp"
#include "handlers/i_handler.hpp"

namespace devlaunch {

// Lifetime: created on the stack in the entrypoint for the duration of the
// run. Handlers are created per dispatch and released afterwards.
class HandlerDispatcher {
  customio::IOutput &output_;
  IHandlerFactory &handler_factory_;

public:
  HandlerDispatcher(customio::IOutput &out, IHandlerFactory &handler_factory)
      : output_(out), handler_factory_(handler_factory) {}

  // nullopt when no handler serves `subcmd`.
  std::optional<int> dispatch_run(const std::string &subcmd) {
    auto handler = handler_factory_.create(subcmd);
    if (!handler) {
      return std::nullopt;
    }
    output_.debug() << "Dispatching subcommand '" << handler->command() << "'"
                    << std::endl;
    return handler->start();
  }
};

} // namespace devlaunch
