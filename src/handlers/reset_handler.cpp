#include "handlers/reset_handler.hpp"

#include <cstdlib>
#include <optional>

#include "identity/identifier_store.hpp"
#include "launch/marker_file.hpp"

namespace devlaunch {

int ResetHandler::start() {
  auto target = cli_ctx_.subcommand_argument();
  if (!target ||
      (*target != "marker" && *target != "device-id" && *target != "all")) {
    output_hub_.printer().red(
        "Usage: devlaunch reset marker|device-id|all");
    return EXIT_FAILURE;
  }

  const auto &config = config_provider_.get();
  std::optional<Error> failure;
  auto report = [&](const fs::path &path, std::optional<Error> err) {
    if (err) {
      output_hub_.logger().error() << *err << std::endl;
      failure = std::move(err);
      return;
    }
    output_hub_.logger().info() << "Removed " << path.string() << std::endl;
  };

  if (*target == "marker" || *target == "all") {
    launch::MarkerFile marker(config.marker_path());
    report(marker.path(), marker.remove());
  }
  if (*target == "device-id" || *target == "all") {
    identity::DeviceIdentifierStore store(config.device_id_path());
    report(store.path(), store.remove());
  }
  return failure ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace devlaunch
