#include "util/string_util.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <fstream>

namespace devlaunch {
namespace stringutil {

std::string generate_uuid(const std::string &prefix, bool no_dash) {
  static boost::uuids::random_generator generator;
  std::string v = boost::uuids::to_string(generator());
  if (no_dash) {
    v.erase(std::remove(v.begin(), v.end(), '-'), v.end());
  }
  return prefix + v;
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t next = text.find('\n', pos);
    std::string_view line = text.substr(
        pos, next == std::string_view::npos ? std::string_view::npos
                                            : next - pos);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.emplace_back(line);
    if (next == std::string_view::npos) {
      break;
    }
    pos = next + 1;
  }
  return lines;
}

std::optional<std::string> read_trimmed_first_line(const fs::path &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    return std::nullopt;
  }
  std::string line;
  if (!std::getline(ifs, line)) {
    return std::nullopt;
  }
  trim(line);
  if (line.empty()) {
    return std::nullopt;
  }
  return line;
}

std::string join_for_display(const std::vector<std::string> &tokens) {
  std::string out;
  for (const auto &t : tokens) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    if (t.empty() || t.find_first_of(" \t") != std::string::npos) {
      out += '"' + t + '"';
    } else {
      out += t;
    }
  }
  return out;
}

} // namespace stringutil
} // namespace devlaunch
