#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "launch/process_runner.hpp"
#include "launch_error.hpp"

namespace devlaunch::identity {

namespace fs = std::filesystem;

inline constexpr const char kProductUuid[] = "product_uuid";
inline constexpr const char kBiosSerial[] = "bios_serial";
inline constexpr const char kMacAddress[] = "mac_address";

// An OS-level hardware query. query() returns nullopt when the value is
// unavailable or blank; it never throws.
class IIdentityProvider {
public:
  using Ptr = std::shared_ptr<IIdentityProvider>;
  virtual ~IIdentityProvider() = default;

  virtual std::string name() const = 0;
  virtual std::optional<std::string> query() = 0;
};

// System product UUID: /sys/class/dmi/id/product_uuid on Linux,
// `wmic csproduct get uuid` on Windows.
class ProductUuidProvider : public IIdentityProvider {
public:
  ProductUuidProvider(launch::IProcessRunner &runner,
                      fs::path dmi_dir = "/sys/class/dmi/id")
      : runner_(runner), dmi_dir_(std::move(dmi_dir)) {}

  std::string name() const override { return kProductUuid; }
  std::optional<std::string> query() override;

private:
  launch::IProcessRunner &runner_;
  fs::path dmi_dir_;
};

// BIOS serial number: /sys/class/dmi/id/product_serial on Linux,
// `wmic bios get serialnumber` on Windows.
class BiosSerialProvider : public IIdentityProvider {
public:
  BiosSerialProvider(launch::IProcessRunner &runner,
                     fs::path dmi_dir = "/sys/class/dmi/id")
      : runner_(runner), dmi_dir_(std::move(dmi_dir)) {}

  std::string name() const override { return kBiosSerial; }
  std::optional<std::string> query() override;

private:
  launch::IProcessRunner &runner_;
  fs::path dmi_dir_;
};

// First network interface MAC: first non-loopback, non-zero entry of
// /sys/class/net/*/address (name order) on Linux, first data row of
// `getmac /fo csv /nh` on Windows. Quote characters are removed.
class MacAddressProvider : public IIdentityProvider {
public:
  MacAddressProvider(launch::IProcessRunner &runner,
                     fs::path net_dir = "/sys/class/net")
      : runner_(runner), net_dir_(std::move(net_dir)) {}

  std::string name() const override { return kMacAddress; }
  std::optional<std::string> query() override;

private:
  launch::IProcessRunner &runner_;
  fs::path net_dir_;
};

class FunctionIdentityProvider : public IIdentityProvider {
public:
  FunctionIdentityProvider(std::string name,
                           std::function<std::optional<std::string>()> fn)
      : name_(std::move(name)), fn_(std::move(fn)) {}

  std::string name() const override { return name_; }
  std::optional<std::string> query() override {
    if (!fn_) {
      return std::nullopt;
    }
    return fn_();
  }

private:
  std::string name_;
  std::function<std::optional<std::string>()> fn_;
};

struct ProviderChain {
  std::vector<IIdentityProvider::Ptr> providers;
  std::optional<Error> error;
};

// Builds providers in the given priority order. Unknown names produce an
// error naming the offending entry.
ProviderChain make_provider_chain(const std::vector<std::string> &names,
                                  launch::IProcessRunner &runner);

// ---- output parsers (platform independent) ----

// `wmic <class> get <prop>` output: the first non-blank line is the column
// header; the value is the first non-blank line after it.
std::optional<std::string> parse_wmic_value(std::string_view output);

// `getmac /fo csv [/nh]` output: header rows and rows whose first field is
// not a MAC (e.g. "N/A") are skipped; the first field of the first data row
// is returned with quotes stripped.
std::optional<std::string> parse_getmac_csv(std::string_view output);

// True for 12 hex digits separated by ':' or '-' in pairs.
bool looks_like_mac(std::string_view value);

// Linux interface enumeration below `net_dir` (normally /sys/class/net).
std::optional<std::string> first_mac_from_sysfs(const fs::path &net_dir);

} // namespace devlaunch::identity
