#include "identity/identity_provider.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <fmt/format.h>

#include "util/string_util.hpp"

namespace devlaunch::identity {

namespace {

constexpr std::uint32_t kQueryTimeoutMs = 10000;

std::optional<std::string> non_blank(std::optional<std::string> value) {
  if (!value) {
    return std::nullopt;
  }
  stringutil::trim(*value);
  if (value->empty()) {
    return std::nullopt;
  }
  return value;
}

[[maybe_unused]] std::optional<std::string>
capture(launch::IProcessRunner &runner, std::vector<std::string> argv) {
  launch::ProcessSpec spec;
  spec.argv = std::move(argv);
  spec.capture_stdout = true;
  spec.timeout_ms = kQueryTimeoutMs;
  auto result = runner.run(spec);
  if (!result.ok()) {
    return std::nullopt;
  }
  return result.output;
}

[[maybe_unused]] std::optional<std::string>
read_sysfs_value(const fs::path &file) {
  return non_blank(stringutil::read_trimmed_first_line(file));
}

} // namespace

std::optional<std::string> ProductUuidProvider::query() {
#if defined(_WIN32)
  auto out = capture(runner_, {"wmic", "csproduct", "get", "uuid"});
  return out ? parse_wmic_value(*out) : std::nullopt;
#else
  (void)runner_;
  return read_sysfs_value(dmi_dir_ / "product_uuid");
#endif
}

std::optional<std::string> BiosSerialProvider::query() {
#if defined(_WIN32)
  auto out = capture(runner_, {"wmic", "bios", "get", "serialnumber"});
  return out ? parse_wmic_value(*out) : std::nullopt;
#else
  (void)runner_;
  return read_sysfs_value(dmi_dir_ / "product_serial");
#endif
}

std::optional<std::string> MacAddressProvider::query() {
#if defined(_WIN32)
  auto out = capture(runner_, {"getmac", "/fo", "csv", "/nh"});
  return out ? parse_getmac_csv(*out) : std::nullopt;
#else
  (void)runner_;
  return first_mac_from_sysfs(net_dir_);
#endif
}

ProviderChain make_provider_chain(const std::vector<std::string> &names,
                                  launch::IProcessRunner &runner) {
  ProviderChain chain;
  for (const auto &name : names) {
    if (name == kProductUuid) {
      chain.providers.push_back(std::make_shared<ProductUuidProvider>(runner));
    } else if (name == kBiosSerial) {
      chain.providers.push_back(std::make_shared<BiosSerialProvider>(runner));
    } else if (name == kMacAddress) {
      chain.providers.push_back(std::make_shared<MacAddressProvider>(runner));
    } else {
      chain.providers.clear();
      chain.error = make_error(
          my_errors::IDENTITY::UNKNOWN_PROVIDER,
          fmt::format("Unknown identity provider '{}', supported providers "
                      "are: {}, {}, {}",
                      name, kProductUuid, kBiosSerial, kMacAddress));
      return chain;
    }
  }
  return chain;
}

std::optional<std::string> parse_wmic_value(std::string_view output) {
  bool header_seen = false;
  for (auto &line : stringutil::split_lines(output)) {
    stringutil::trim(line);
    if (line.empty()) {
      continue;
    }
    if (!header_seen) {
      header_seen = true;
      continue;
    }
    return line;
  }
  return std::nullopt;
}

bool looks_like_mac(std::string_view value) {
  if (value.size() != 17) {
    return false;
  }
  const char sep = value[2];
  if (sep != ':' && sep != '-') {
    return false;
  }
  for (size_t i = 0; i < value.size(); ++i) {
    if (i % 3 == 2) {
      if (value[i] != sep) {
        return false;
      }
    } else if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
      return false;
    }
  }
  return true;
}

std::optional<std::string> parse_getmac_csv(std::string_view output) {
  for (auto &line : stringutil::split_lines(output)) {
    stringutil::trim(line);
    if (line.empty()) {
      continue;
    }
    std::string first = line.substr(0, line.find(','));
    first = stringutil::trimmed(stringutil::strip_chars(first, "\""));
    if (looks_like_mac(first)) {
      return first;
    }
  }
  return std::nullopt;
}

std::optional<std::string> first_mac_from_sysfs(const fs::path &net_dir) {
  std::error_code ec;
  std::vector<fs::path> interfaces;
  for (fs::directory_iterator it(net_dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    interfaces.push_back(it->path());
  }
  if (ec) {
    return std::nullopt;
  }
  std::sort(interfaces.begin(), interfaces.end());
  for (const auto &iface : interfaces) {
    if (iface.filename() == "lo") {
      continue;
    }
    auto address = stringutil::read_trimmed_first_line(iface / "address");
    if (!address) {
      continue;
    }
    std::string mac = stringutil::strip_chars(*address, "\"");
    if (mac == "00:00:00:00:00:00" || !looks_like_mac(mac)) {
      continue;
    }
    return mac;
  }
  return std::nullopt;
}

} // namespace devlaunch::identity
