#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace devlaunch {
namespace device {

// Host description printed by `info`. Never used to derive the identifier.
struct HostInfo {
  std::string platform; // Linux, macOS, Windows
  std::string os_name;  // PRETTY_NAME from os-release when available
  std::string hostname;
};

HostInfo gather_host_info();

// Value of `key` in os-release formatted text, unquoted. nullopt when the
// key is absent or its value is blank.
std::optional<std::string> os_release_field(std::string_view content,
                                            std::string_view key);

// Identifier as it appears in logs: the first 128 bits of SHA-256(identifier)
// in 8-4-4-4-12 form, so log files never carry the raw hardware value.
std::string device_public_id(const std::string &identifier);

} // namespace device
} // namespace devlaunch
