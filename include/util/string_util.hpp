#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace devlaunch {
namespace stringutil {

namespace fs = std::filesystem;

std::string generate_uuid(const std::string &prefix = "", bool no_dash = false);

// Trim leading and trailing whitespace from a string
inline void trim(std::string &str) {
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto start = std::find_if(str.begin(), str.end(), not_space);
  auto end = std::find_if(str.rbegin(), str.rend(), not_space).base();
  str = start < end ? std::string(start, end) : std::string{};
}

inline std::string trimmed(std::string str) {
  trim(str);
  return str;
}

// Remove every occurrence of any character in `chars`.
inline std::string strip_chars(std::string str, std::string_view chars) {
  str.erase(std::remove_if(str.begin(), str.end(),
                           [&](char c) {
                             return chars.find(c) != std::string_view::npos;
                           }),
            str.end());
  return str;
}

std::vector<std::string> split_lines(std::string_view text);

// First line of the file with surrounding whitespace removed; nullopt when
// the file cannot be opened or the line is blank.
std::optional<std::string> read_trimmed_first_line(const fs::path &path);

// Join argv-style tokens for display; tokens with spaces are quoted.
std::string join_for_display(const std::vector<std::string> &tokens);

} // namespace stringutil
} // namespace devlaunch
