#pragma once

#include <ostream>
#include <string>
#include <utility>

#include "my_error_codes.hpp"

namespace devlaunch {

struct Error {
  int code{0};
  std::string what;
};

inline Error make_error(int code, std::string what) {
  return Error{code, std::move(what)};
}

inline std::ostream &operator<<(std::ostream &os, const Error &e) {
  return os << "[" << e.code << "] " << e.what;
}

// Process exit statuses owned by the launcher. Anything else returned from
// main() is the launched application's own exit status.
namespace exit_status {
constexpr int OK = 0;
constexpr int MISSING_ASSET = 121;
constexpr int SETUP_FAILED = 122;
constexpr int LAUNCH_FAILED = 123;
constexpr int CONFIG_ERROR = 124;
} // namespace exit_status

} // namespace devlaunch
