#include "conf/launcher_config.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

namespace devlaunch {

namespace {

void write_json_if_missing(const fs::path &file_path,
                           const json::value &content) {
  if (fs::exists(file_path)) {
    return;
  }
  std::ofstream ofs(file_path);
  if (!ofs) {
    throw std::runtime_error("Unable to write default config file: " +
                             file_path.string());
  }
  ofs << json::serialize(content) << std::endl;
}

} // namespace

LauncherConfig parse_launcher_config(const std::string &content,
                                     const fs::path &base_dir) {
  boost::system::error_code ec;
  json::value jv = json::parse(content, ec);
  if (ec) {
    throw std::runtime_error("Failed to parse launcher configuration: " +
                             ec.message());
  }
  LauncherConfig config;
  try {
    config = json::value_to<LauncherConfig>(jv);
  } catch (const std::exception &ex) {
    throw std::runtime_error(
        std::string("error in parsing LauncherConfig: ") + ex.what());
  }
  config.base_dir = base_dir;
  return config;
}

LauncherConfigProviderFile::LauncherConfigProviderFile(const fs::path &base_dir)
    : config_file_(base_dir / kConfigFileName) {
  std::error_code ec;
  if (!fs::exists(config_file_, ec)) {
    config_.base_dir = base_dir;
    try {
      write_json_if_missing(config_file_, json::value_from(config_));
    } catch (const std::exception &ex) {
      std::cerr << "Warning: failed to write default configuration file: "
                << ex.what() << std::endl;
    }
    return;
  }

  std::ifstream ifs(config_file_);
  if (!ifs) {
    throw std::runtime_error("Unable to open configuration file: " +
                             config_file_.string());
  }
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  config_ = parse_launcher_config(content, base_dir);
  loaded_from_file_ = true;
}

} // namespace devlaunch
