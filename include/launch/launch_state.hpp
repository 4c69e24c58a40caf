#pragma once

#include "conf/launcher_config.hpp"

namespace devlaunch::launch {

// Gates are satisfied in this order; Ready means only the launch remains.
enum class LaunchState { NeedsIdentifier, NeedsUnpack, Ready };

const char *to_string(LaunchState state);

// Files on disk, read once at startup and advanced in memory by the
// launcher as each gate is passed.
struct LaunchStateSnapshot {
  bool identifier_present{false};
  bool marker_present{false};
  bool unpack_enabled{true};
  bool runtime_present{false};
  bool target_present{false};

  LaunchState state() const {
    if (!identifier_present) {
      return LaunchState::NeedsIdentifier;
    }
    if (unpack_enabled && !marker_present) {
      return LaunchState::NeedsUnpack;
    }
    return LaunchState::Ready;
  }

  static LaunchStateSnapshot capture(const LauncherConfig &config);
};

} // namespace devlaunch::launch
