#include "handlers/info_handler.hpp"

#include <system_error>

#include "launch/launch_state.hpp"
#include "util/device_info.hpp"
#include "util/string_util.hpp"
#include "version.h"

namespace devlaunch {
namespace {

const char *present_or_missing(bool present) {
  return present ? "present" : "missing";
}

} // namespace

int InfoHandler::start() {
  const auto &config = config_provider_.get();
  auto &printer = output_hub_.printer();
  printer.green() << "devlaunch " << MYAPP_VERSION << " installation summary"
                  << std::endl;

  printer.cyan() << "Configuration" << std::endl;
  {
    std::error_code ec;
    const fs::path config_file = config.base_dir / kConfigFileName;
    auto proxy = printer.white();
    proxy << "  Base dir: " << config.base_dir.string() << std::endl;
    proxy << "  Config file: " << config_file.string();
    if (!fs::exists(config_file, ec)) {
      proxy << " (missing, defaults in use)";
    }
    proxy << std::endl;
    proxy << "  Log dir: " << config.log_dir_path().string() << std::endl;
  }

  const auto snapshot = launch::LaunchStateSnapshot::capture(config);

  printer.cyan() << "Device" << std::endl;
  {
    auto host = device::gather_host_info();
    auto proxy = printer.white();
    proxy << "  Hostname: "
          << (host.hostname.empty() ? std::string{"<unknown>"} : host.hostname)
          << std::endl;
    proxy << "  Platform: " << host.platform;
    if (!host.os_name.empty()) {
      proxy << " (" << host.os_name << ')';
    }
    proxy << std::endl;
  }
  {
    auto stored = resolver_.store().load();
    auto proxy = printer.white();
    proxy << "  Identifier file: " << resolver_.store().path().string()
          << std::endl;
    if (stored) {
      proxy << "  Identifier: " << *stored << std::endl;
      proxy << "  Public id: " << device::device_public_id(*stored)
            << std::endl;
    } else {
      proxy << "  Identifier: <not resolved yet>" << std::endl;
    }
    std::vector<std::string> names;
    for (const auto &provider : resolver_.providers()) {
      names.push_back(provider->name());
    }
    proxy << "  Providers: " << stringutil::join_for_display(names)
          << std::endl;
  }

  printer.cyan() << "First run" << std::endl;
  {
    auto proxy = printer.white();
    proxy << "  Runtime interpreter: " << config.interpreter_path().string()
          << " (" << present_or_missing(snapshot.runtime_present) << ")"
          << std::endl;
    proxy << "  Application entry: " << config.target_entry_path().string()
          << " (" << present_or_missing(snapshot.target_present) << ")"
          << std::endl;
    proxy << "  Unpack step: "
          << (config.unpack.enabled ? "enabled" : "disabled") << std::endl;
    proxy << "  Unpack marker: " << config.marker_path().string() << " ("
          << present_or_missing(snapshot.marker_present) << ")" << std::endl;
    proxy << "  Launch state: " << launch::to_string(snapshot.state())
          << std::endl;
  }
  return 0;
}

} // namespace devlaunch
