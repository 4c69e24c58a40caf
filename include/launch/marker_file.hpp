#pragma once

#include <filesystem>
#include <optional>
#include <utility>

#include "launch_error.hpp"

namespace devlaunch::launch {

// Presence-only sentinel. Content is irrelevant.
class MarkerFile {
public:
  explicit MarkerFile(std::filesystem::path path) : path_(std::move(path)) {}

  const std::filesystem::path &path() const { return path_; }

  bool exists() const;

  // Creates the file if absent; an existing marker is left untouched, so
  // two instances racing on first run both succeed.
  std::optional<Error> create() const;

  std::optional<Error> remove() const;

private:
  std::filesystem::path path_;
};

} // namespace devlaunch::launch
