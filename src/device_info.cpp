#include "util/device_info.hpp"

#include <fstream>
#include <sstream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <unistd.h>
#endif

#include <fmt/format.h>

#include "openssl/openssl_raii.hpp"
#include "util/string_util.hpp"

namespace devlaunch {
namespace device {

namespace {

#if defined(__linux__)
constexpr const char kPlatform[] = "Linux";
#elif defined(__APPLE__)
constexpr const char kPlatform[] = "macOS";
#elif defined(_WIN32)
constexpr const char kPlatform[] = "Windows";
#else
constexpr const char kPlatform[] = "Unknown";
#endif

std::string local_hostname() {
#ifdef _WIN32
  char buf[MAX_COMPUTERNAME_LENGTH + 1] = {0};
  DWORD size = sizeof(buf);
  if (::GetComputerNameA(buf, &size)) {
    return std::string(buf, size);
  }
#else
  char buf[256] = {0};
  if (::gethostname(buf, sizeof(buf) - 1) == 0) {
    return std::string(buf);
  }
#endif
  return {};
}

std::string local_os_name() {
#if defined(__linux__)
  for (const char *candidate : {"/etc/os-release", "/usr/lib/os-release"}) {
    std::ifstream in(candidate);
    if (!in.is_open()) {
      continue;
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (auto name = os_release_field(content.str(), "PRETTY_NAME")) {
      return *name;
    }
  }
#endif
  return {};
}

} // namespace

HostInfo gather_host_info() {
  HostInfo info;
  info.platform = kPlatform;
  info.os_name = local_os_name();
  info.hostname = local_hostname();
  return info;
}

std::optional<std::string> os_release_field(std::string_view content,
                                            std::string_view key) {
  for (auto &line : stringutil::split_lines(content)) {
    stringutil::trim(line);
    if (line.size() <= key.size() || line.compare(0, key.size(), key) != 0 ||
        line[key.size()] != '=') {
      continue;
    }
    std::string value = line.substr(key.size() + 1);
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }
    stringutil::trim(value);
    if (value.empty()) {
      return std::nullopt;
    }
    return value;
  }
  return std::nullopt;
}

std::string device_public_id(const std::string &identifier) {
  const std::string digest = opensslutil::sha256_hex(identifier);
  return fmt::format("{}-{}-{}-{}-{}", digest.substr(0, 8),
                     digest.substr(8, 4), digest.substr(12, 4),
                     digest.substr(16, 4), digest.substr(20, 12));
}

} // namespace device
} // namespace devlaunch
