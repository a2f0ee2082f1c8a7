// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_UTIL_IO_HPP
#define PROSAIC_UTIL_IO_HPP

#include "text.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace prosaic {
namespace util {

template<typename Arg>
void pout(Arg&& arg) {
  std::cout << arg << std::endl;
}

template<typename... Args>
void poutf(std::string_view fmt, Args&&... args) {
  std::cout << std::vformat(fmt, std::make_format_args(args...)) << std::endl;
}

template<typename... Args>
void perrf(std::string_view fmt, Args&&... args) {
  std::cerr << std::vformat(fmt, std::make_format_args(args...)) << std::endl;
}

inline std::optional<std::string> read_file(const std::filesystem::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    return std::nullopt;
  }
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

inline std::string read_stream(std::istream& is) {
  std::ostringstream ss;
  ss << is.rdbuf();
  return ss.str();
}

// One entry per line; blank lines and '#' comments are skipped.
inline std::vector<std::string> split_entries(const std::string& src) {
  std::vector<std::string> entries;
  std::istringstream lines(src);
  std::string line;
  while (std::getline(lines, line)) {
    trim(line);
    if (!line.empty() && line[0] != '#') {
      entries.push_back(line);
    }
  }
  return entries;
}

} // namespace util
} // namespace prosaic

#endif  // PROSAIC_UTIL_IO_HPP
