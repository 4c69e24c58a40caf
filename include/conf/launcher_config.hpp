#pragma once

#include <boost/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common_macros.hpp"

namespace devlaunch {
namespace fs = std::filesystem;
namespace json = boost::json;

#if defined(_WIN32)
inline const std::string kDefaultInterpreter = "python_env/python.exe";
inline const std::string kDefaultUnpackTool =
    "python_env/Scripts/conda-unpack.exe";
#else
inline const std::string kDefaultInterpreter = "python_env/bin/python";
inline const std::string kDefaultUnpackTool = "python_env/bin/conda-unpack";
#endif

inline const std::string kConfigFileName = "launcher.json";

namespace detail {

inline std::string string_field(const json::object &obj, const char *key,
                                const std::string &fallback) {
  if (auto *p = obj.if_contains(key)) {
    if (!p->is_string()) {
      throw std::runtime_error(std::string("'") + key +
                               "' must be a string");
    }
    return std::string(p->as_string().c_str());
  }
  DEVLAUNCH_VERBOSE_LOG(key << " not found, using default " << fallback);
  return fallback;
}

inline bool bool_field(const json::object &obj, const char *key,
                       bool fallback) {
  if (auto *p = obj.if_contains(key)) {
    return p->as_bool();
  }
  DEVLAUNCH_VERBOSE_LOG(key << " not found, using default " << fallback);
  return fallback;
}

inline std::vector<std::string>
string_list_field(const json::object &obj, const char *key,
                  const std::vector<std::string> &fallback) {
  if (auto *p = obj.if_contains(key)) {
    if (!p->is_array()) {
      throw std::runtime_error(std::string("'") + key +
                               "' must be an array of strings");
    }
    return json::value_to<std::vector<std::string>>(*p);
  }
  DEVLAUNCH_VERBOSE_LOG(key << " not found, using default list");
  return fallback;
}

inline const json::object *object_field(const json::object &obj,
                                        const char *key) {
  if (auto *p = obj.if_contains(key)) {
    if (!p->is_object()) {
      throw std::runtime_error(std::string("'") + key +
                               "' must be an object");
    }
    return &p->as_object();
  }
  return nullptr;
}

} // namespace detail

struct LoggingConfig {
  std::string level{"info"};
  std::string log_dir{"log"};
  std::string log_file{"devlaunch"};
  std::size_t rotation_size{5 * 1024 * 1024};

  friend LoggingConfig tag_invoke(const json::value_to_tag<LoggingConfig> &,
                                  const json::value &jv) {
    if (!jv.is_object()) {
      throw std::runtime_error("log config is not an object");
    }
    const auto &obj = jv.as_object();
    LoggingConfig lc{};
    lc.level = detail::string_field(obj, "level", lc.level);
    lc.log_dir = detail::string_field(obj, "log_dir", lc.log_dir);
    lc.log_file = detail::string_field(obj, "log_file", lc.log_file);
    if (auto *p = obj.if_contains("rotation_size")) {
      lc.rotation_size = json::value_to<std::size_t>(*p);
    }
    return lc;
  }

  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const LoggingConfig &lc) {
    jv = json::object{{"level", lc.level},
                      {"log_dir", lc.log_dir},
                      {"log_file", lc.log_file},
                      {"rotation_size", lc.rotation_size}};
  }
};

struct UnpackConfig {
  bool enabled{true};
  std::string marker_file{".unpacked"};
  std::vector<std::string> command{kDefaultUnpackTool};
  // 0 waits without limit.
  std::uint32_t timeout_ms{0};

  friend UnpackConfig tag_invoke(const json::value_to_tag<UnpackConfig> &,
                                 const json::value &jv) {
    if (!jv.is_object()) {
      throw std::runtime_error("unpack config is not an object");
    }
    const auto &obj = jv.as_object();
    UnpackConfig uc{};
    uc.enabled = detail::bool_field(obj, "enabled", uc.enabled);
    uc.marker_file = detail::string_field(obj, "marker_file", uc.marker_file);
    uc.command = detail::string_list_field(obj, "command", uc.command);
    if (auto *p = obj.if_contains("timeout_ms")) {
      uc.timeout_ms = json::value_to<std::uint32_t>(*p);
    }
    return uc;
  }

  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const UnpackConfig &uc) {
    jv = json::object{{"enabled", uc.enabled},
                      {"marker_file", uc.marker_file},
                      {"command", json::value_from(uc.command)},
                      {"timeout_ms", uc.timeout_ms}};
  }
};

struct LauncherConfig {
  // Directory holding the launcher; every relative path below resolves
  // against it. Not part of the JSON document.
  fs::path base_dir{};

  std::string device_id_file{"device_id.txt"};
  std::string interpreter{kDefaultInterpreter};
  UnpackConfig unpack{};
  std::string target_entry{"main.py"};
  std::vector<std::string> target_args{};
  std::vector<std::string> identity_providers{"product_uuid", "bios_serial",
                                              "mac_address"};
  bool pause_on_exit{true};
  LoggingConfig log{};

  fs::path resolve(const std::string &relative) const {
    fs::path p(relative);
    if (p.is_absolute() || base_dir.empty()) {
      return p;
    }
    return base_dir / p;
  }

  fs::path device_id_path() const { return resolve(device_id_file); }
  fs::path marker_path() const { return resolve(unpack.marker_file); }
  fs::path interpreter_path() const { return resolve(interpreter); }
  fs::path target_entry_path() const { return resolve(target_entry); }
  fs::path log_dir_path() const { return resolve(log.log_dir); }

  friend LauncherConfig tag_invoke(const json::value_to_tag<LauncherConfig> &,
                                   const json::value &jv) {
    auto *jo_p = jv.if_object();
    if (!jo_p) {
      throw std::runtime_error("LauncherConfig is not an object");
    }
    const auto &obj = *jo_p;
    LauncherConfig lc{};
    lc.device_id_file =
        detail::string_field(obj, "device_id_file", lc.device_id_file);
    if (auto *runtime = detail::object_field(obj, "runtime")) {
      lc.interpreter =
          detail::string_field(*runtime, "interpreter", lc.interpreter);
    }
    if (auto *p = obj.if_contains("unpack")) {
      lc.unpack = json::value_to<UnpackConfig>(*p);
    }
    if (auto *target = detail::object_field(obj, "target")) {
      lc.target_entry =
          detail::string_field(*target, "entry", lc.target_entry);
      lc.target_args =
          detail::string_list_field(*target, "args", lc.target_args);
    }
    if (auto *identity = detail::object_field(obj, "identity")) {
      lc.identity_providers = detail::string_list_field(
          *identity, "providers", lc.identity_providers);
    }
    lc.pause_on_exit =
        detail::bool_field(obj, "pause_on_exit", lc.pause_on_exit);
    if (auto *p = obj.if_contains("log")) {
      lc.log = json::value_to<LoggingConfig>(*p);
    }
    return lc;
  }

  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const LauncherConfig &lc) {
    jv = json::object{
        {"device_id_file", lc.device_id_file},
        {"runtime", json::object{{"interpreter", lc.interpreter}}},
        {"unpack", json::value_from(lc.unpack)},
        {"target", json::object{{"entry", lc.target_entry},
                                {"args", json::value_from(lc.target_args)}}},
        {"identity",
         json::object{{"providers", json::value_from(lc.identity_providers)}}},
        {"pause_on_exit", lc.pause_on_exit},
        {"log", json::value_from(lc.log)}};
  }
};

class ILauncherConfigProvider {
public:
  virtual ~ILauncherConfigProvider() = default;

  virtual const LauncherConfig &get() const = 0;
  virtual LauncherConfig &get() = 0;
};

// Loads <base_dir>/launcher.json once. A missing file yields the defaults
// (and a best-effort write of them so operators have something to edit);
// a malformed file throws std::runtime_error.
class LauncherConfigProviderFile : public ILauncherConfigProvider {
public:
  explicit LauncherConfigProviderFile(const fs::path &base_dir);

  const LauncherConfig &get() const override { return config_; }
  LauncherConfig &get() override { return config_; }

  const fs::path &config_file() const { return config_file_; }
  bool loaded_from_file() const { return loaded_from_file_; }

private:
  LauncherConfig config_;
  fs::path config_file_;
  bool loaded_from_file_{false};
};

// In-memory provider used by tests and by callers that assemble the
// configuration themselves.
class StaticLauncherConfigProvider : public ILauncherConfigProvider {
public:
  explicit StaticLauncherConfigProvider(LauncherConfig config)
      : config_(std::move(config)) {}

  const LauncherConfig &get() const override { return config_; }
  LauncherConfig &get() override { return config_; }

private:
  LauncherConfig config_;
};

LauncherConfig parse_launcher_config(const std::string &content,
                                     const fs::path &base_dir);

} // namespace devlaunch
