// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_TOOL_JSONPROFILELOADER_HPP
#define PROSAIC_TOOL_JSONPROFILELOADER_HPP

#include "../runtime/Detector.hpp"
#include "../util/io.hpp"

#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

namespace prosaic {
namespace tool {

/*
 * Reads a detector profile:
 *
 *   {"marker": "Hello", "slots": ["CITY", "WEATHER"], "excluded": ["Intro"]}
 *
 * Missing fields keep their current value in profile.
 */
class JsonProfileLoader {
public:
  JsonProfileLoader() = default;
  JsonProfileLoader(const JsonProfileLoader& other) = delete;
  JsonProfileLoader& operator=(const JsonProfileLoader& other) = delete;
  JsonProfileLoader(JsonProfileLoader&& other) = delete;
  JsonProfileLoader& operator=(JsonProfileLoader&& other) = delete;

  bool load(const std::string& fn, runtime::DetectorProfile& profile) const {
    std::ifstream pf(fn);
    if (!pf) {
      util::perrf("Failed to open the profile JSON file for reading: {}", fn);
      return false;
    }

    nlohmann::json data = nlohmann::json::parse(pf, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
      util::perrf("Invalid JSON in profile file: {}", fn);
      return false;
    }
    return parse(data, profile, fn);
  }

  bool parse(const nlohmann::json& data, runtime::DetectorProfile& profile, const std::string& origin = "<json>") const {
    try {
      if (data.contains("marker")) {
        profile.marker = data["marker"].get<std::string>();
      }
      if (data.contains("slots")) {
        profile.slots = data["slots"].get<std::vector<std::string>>();
      }
      if (data.contains("excluded")) {
        for (const auto& symbol : data["excluded"]) {
          profile.excluded.insert(symbol.get<std::string>());
        }
      }
    } catch (const nlohmann::json::exception& e) {
      util::perrf("Invalid profile in {}: {}", origin, e.what());
      return false;
    }
    return true;
  }
};

} // namespace tool
} // namespace prosaic

#endif // PROSAIC_TOOL_JSONPROFILELOADER_HPP
