// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_TOOL_JSONREPORT_HPP
#define PROSAIC_TOOL_JSONREPORT_HPP

#include "../runtime/Detector.hpp"
#include "../runtime/Encoder.hpp"
#include "../runtime/Grammar.hpp"
#include "../runtime/KeySearch.hpp"

#include <format>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace prosaic {
namespace tool {

class JsonReport {
public:
  JsonReport() = default;
  JsonReport(const JsonReport& other) = delete;
  JsonReport& operator=(const JsonReport& other) = delete;
  JsonReport(JsonReport&& other) = delete;
  JsonReport& operator=(JsonReport&& other) = delete;

  static std::string fingerprint(const runtime::Grammar& grammar) {
    return std::format("{:016x}", grammar.fingerprint());
  }

  nlohmann::json toJson(const runtime::EncodeResult& result) const {
    nlohmann::json j;
    j["text"] = result.text;
    j["payload"] = result.payload;
    j["bits_embedded"] = result.bits_embedded;
    j["attempts"] = result.attempts;
    j["natural"] = result.natural;
    return j;
  }

  nlohmann::json toJson(const runtime::DetectionResult& result) const {
    nlohmann::json j;
    j["detected"] = result.detected;
    j["sentence"] = result.sentence;
    j["bits"] = result.bits;
    j["trace"] = nlohmann::json::array();
    for (const runtime::SlotMatch& match : result.trace) {
      j["trace"].push_back({
        {"symbol", match.symbol},
        {"alternative", match.alternative},
        {"codeword", match.codeword},
        {"span", {match.begin, match.end}},
        {"overlaps", match.overlaps},
      });
    }
    j["missing"] = result.missing;
    return j;
  }

  nlohmann::json toJson(const std::vector<runtime::KeyCandidate>& ranked) const {
    nlohmann::json j = nlohmann::json::array();
    for (const runtime::KeyCandidate& candidate : ranked) {
      j.push_back({
        {"key", candidate.key},
        {"message", candidate.message},
        {"confidence", candidate.confidence},
        {"message_recovered", candidate.message_recovered},
      });
    }
    return j;
  }

  nlohmann::json capacity(const runtime::Grammar& grammar) const {
    nlohmann::json j;
    j["fingerprint"] = fingerprint(grammar);
    j["symbols"] = nlohmann::json::object();
    for (const std::string& symbol : grammar.symbols()) {
      unsigned bits = grammar.capacity(symbol);
      if (bits > 0) {
        j["symbols"][symbol] = bits;
      }
    }
    j["total"] = grammar.capacity();
    return j;
  }
};

} // namespace tool
} // namespace prosaic

#endif // PROSAIC_TOOL_JSONREPORT_HPP
