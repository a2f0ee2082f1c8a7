// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_TOOL_GRAMMARLOADER_HPP
#define PROSAIC_TOOL_GRAMMARLOADER_HPP

#include "../runtime/Errors.hpp"
#include "../util/io.hpp"
#include "../util/log.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace prosaic {
namespace tool {

class GrammarLoader {
public:
  GrammarLoader() = default;
  GrammarLoader(const GrammarLoader& other) = delete;
  GrammarLoader& operator=(const GrammarLoader& other) = delete;
  GrammarLoader(GrammarLoader&& other) = delete;
  GrammarLoader& operator=(GrammarLoader&& other) = delete;

  std::string load(const std::string& fn) const {
    if (!std::filesystem::is_regular_file(fn)) {
      throw runtime::GrammarFileNotFound(fn);
    }
    std::optional<std::string> src = util::read_file(fn);
    if (!src) {
      throw runtime::GrammarFileNotFound(fn);
    }
    PROSAIC_LOG_DEBUG("loaded grammar {} ({} bytes)", fn, src->size());
    return *src;
  }

  // Key lists and message wordlists: one entry per line.
  std::vector<std::string> load_entries(const std::string& fn) const {
    std::optional<std::string> src = util::read_file(fn);
    if (!src) {
      util::perrf("Failed to open the list file for reading: {}", fn);
      return {};
    }
    return util::split_entries(*src);
  }
};

} // namespace tool
} // namespace prosaic

#endif // PROSAIC_TOOL_GRAMMARLOADER_HPP
