#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "launch_error.hpp"

namespace devlaunch::launch {

struct ProcessSpec {
  // argv[0] is resolved through PATH when it has no directory component.
  std::vector<std::string> argv;
  // Empty keeps the launcher's working directory.
  std::filesystem::path working_dir;
  // 0 waits without limit.
  std::uint32_t timeout_ms{0};
  // Capture stdout into ProcessResult::output instead of inheriting it.
  bool capture_stdout{false};
};

struct ProcessResult {
  // Set when the process could not be started, waited for, or timed out.
  std::optional<Error> error;
  int exit_code{0};
  std::optional<int> signal;
  std::string output;

  bool ok() const { return !error && !signal && exit_code == 0; }

  // One-line description for logs.
  std::string describe() const;
};

class IProcessRunner {
public:
  using Ptr = std::shared_ptr<IProcessRunner>;
  virtual ~IProcessRunner() = default;

  virtual ProcessResult run(const ProcessSpec &spec) = 0;
};

// fork/execvp on POSIX, CreateProcessW on Windows. Children inherit the
// console unless stdout capture is requested.
class SystemProcessRunner : public IProcessRunner {
public:
  ProcessResult run(const ProcessSpec &spec) override;
};

class FunctionProcessRunner : public IProcessRunner {
public:
  explicit FunctionProcessRunner(
      std::function<ProcessResult(const ProcessSpec &)> fn)
      : fn_(std::move(fn)) {}

  ProcessResult run(const ProcessSpec &spec) override {
    if (!fn_) {
      ProcessResult r;
      r.error = make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                           "process runner callback missing");
      return r;
    }
    return fn_(spec);
  }

private:
  std::function<ProcessResult(const ProcessSpec &)> fn_;
};

} // namespace devlaunch::launch
