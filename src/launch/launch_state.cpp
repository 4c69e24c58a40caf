#include "launch/launch_state.hpp"

#include <system_error>

#include "util/string_util.hpp"

namespace devlaunch::launch {

const char *to_string(LaunchState state) {
  switch (state) {
  case LaunchState::NeedsIdentifier:
    return "needs-identifier";
  case LaunchState::NeedsUnpack:
    return "needs-unpack";
  case LaunchState::Ready:
    return "ready";
  }
  return "unknown";
}

LaunchStateSnapshot LaunchStateSnapshot::capture(const LauncherConfig &config) {
  std::error_code ec;
  LaunchStateSnapshot snap;
  // A blank identifier file does not count; it is regenerated.
  snap.identifier_present =
      stringutil::read_trimmed_first_line(config.device_id_path()).has_value();
  snap.marker_present = fs::exists(config.marker_path(), ec);
  snap.unpack_enabled = config.unpack.enabled;
  snap.runtime_present = fs::is_regular_file(config.interpreter_path(), ec);
  snap.target_present = fs::exists(config.target_entry_path(), ec);
  return snap;
}

} // namespace devlaunch::launch
