#include "launch/marker_file.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

#include <fmt/format.h>

namespace devlaunch::launch {

namespace fs = std::filesystem;

bool MarkerFile::exists() const {
  std::error_code ec;
  return fs::exists(path_, ec);
}

std::optional<Error> MarkerFile::create() const {
  std::error_code ec;
  if (auto parent = path_.parent_path(); !parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      return make_error(my_errors::LAUNCH::MARKER_WRITE_FAILED,
                        fmt::format("create_directories failed for {}: {}",
                                    parent.string(), ec.message()));
    }
  }
#if defined(_WIN32)
  HANDLE h = CreateFileW(path_.wstring().c_str(), GENERIC_WRITE, 0, nullptr,
                         CREATE_NEW, FILE_ATTRIBUTE_NORMAL, nullptr);
  if (h == INVALID_HANDLE_VALUE) {
    DWORD err = GetLastError();
    if (err == ERROR_FILE_EXISTS) {
      return std::nullopt;
    }
    return make_error(my_errors::LAUNCH::MARKER_WRITE_FAILED,
                      fmt::format("CreateFile {} failed with Win32 error {}",
                                  path_.string(), err));
  }
  CloseHandle(h);
#else
  int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) {
    if (errno == EEXIST) {
      return std::nullopt;
    }
    return make_error(my_errors::LAUNCH::MARKER_WRITE_FAILED,
                      fmt::format("open {} failed: {}", path_.string(),
                                  std::strerror(errno)));
  }
  ::close(fd);
#endif
  return std::nullopt;
}

std::optional<Error> MarkerFile::remove() const {
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    return make_error(my_errors::GENERAL::FILE_READ_WRITE,
                      fmt::format("remove {} failed: {}", path_.string(),
                                  ec.message()));
  }
  return std::nullopt;
}

} // namespace devlaunch::launch
