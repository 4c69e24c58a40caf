#include "handlers/resolve_id_handler.hpp"

#include <cstdlib>

namespace devlaunch {

int ResolveIdHandler::start() {
  auto resolved = cli_ctx_.params.force ? resolver_.regenerate()
                                        : resolver_.resolve_device_identifier();
  if (!resolved.fresh) {
    // Fresh values are echoed by the resolver itself.
    output_hub_.logger().stream() << resolved.value << std::endl;
  }
  if (resolved.persist_error) {
    output_hub_.printer().red("Device identifier could not be saved: " +
                              resolved.persist_error->what);
    return EXIT_FAILURE;
  }
  output_hub_.logger().info() << "Device identifier source: " << resolved.source
                              << std::endl;
  return EXIT_SUCCESS;
}

} // namespace devlaunch
