#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "launch_error.hpp"

namespace devlaunch::identity {

// device_id.txt: a single line holding the identifier.
class DeviceIdentifierStore {
public:
  explicit DeviceIdentifierStore(std::filesystem::path path)
      : path_(std::move(path)) {}

  const std::filesystem::path &path() const { return path_; }

  bool exists() const;

  // Persisted identifier; nullopt when the file is missing, unreadable or
  // blank.
  std::optional<std::string> load() const;

  // Writes `identifier` + newline to a sibling temporary file and renames it
  // over the target, so readers never see a partial line. Empty identifiers
  // are rejected.
  std::optional<Error> save(const std::string &identifier) const;

  std::optional<Error> remove() const;

private:
  std::filesystem::path path_;
};

} // namespace devlaunch::identity
