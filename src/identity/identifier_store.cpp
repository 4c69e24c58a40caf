#include "identity/identifier_store.hpp"

#include <fstream>
#include <system_error>

#include <fmt/format.h>

#include "util/string_util.hpp"

namespace devlaunch::identity {

namespace fs = std::filesystem;

bool DeviceIdentifierStore::exists() const {
  std::error_code ec;
  return fs::is_regular_file(path_, ec);
}

std::optional<std::string> DeviceIdentifierStore::load() const {
  return stringutil::read_trimmed_first_line(path_);
}

std::optional<Error>
DeviceIdentifierStore::save(const std::string &identifier) const {
  std::string value = stringutil::trimmed(identifier);
  if (value.empty()) {
    return make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                      "refusing to persist an empty device identifier");
  }

  std::error_code ec;
  if (auto parent = path_.parent_path(); !parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      return make_error(my_errors::IDENTITY::PERSIST_FAILED,
                        fmt::format("create_directories failed for {}: {}",
                                    parent.string(), ec.message()));
    }
  }

  fs::path tmp = path_;
  tmp += ".tmp-" + stringutil::generate_uuid("", true).substr(0, 8);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
      return make_error(my_errors::IDENTITY::PERSIST_FAILED,
                        "open failed for " + tmp.string());
    }
    ofs << value << '\n';
    ofs.flush();
    if (!ofs) {
      ofs.close();
      fs::remove(tmp, ec);
      return make_error(my_errors::IDENTITY::PERSIST_FAILED,
                        "write failed for " + tmp.string());
    }
  }

  fs::rename(tmp, path_, ec);
  if (ec) {
    std::error_code ignore;
    fs::remove(tmp, ignore);
    return make_error(my_errors::IDENTITY::PERSIST_FAILED,
                      fmt::format("rename {} -> {} failed: {}", tmp.string(),
                                  path_.string(), ec.message()));
  }
  return std::nullopt;
}

std::optional<Error> DeviceIdentifierStore::remove() const {
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    return make_error(my_errors::GENERAL::FILE_READ_WRITE,
                      fmt::format("remove {} failed: {}", path_.string(),
                                  ec.message()));
  }
  return std::nullopt;
}

} // namespace devlaunch::identity
