// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_RUNTIME_DETECTOR_HPP
#define PROSAIC_RUNTIME_DETECTOR_HPP

#include "../util/log.hpp"
#include "../util/text.hpp"
#include "Grammar.hpp"
#include "HuffmanCoder.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace prosaic {
namespace runtime {

/*
 * Agreement between an encoder grammar and the detector: the word that marks
 * the carrier sentence, the slot symbols in derivation order, and the symbols
 * that never carry payload (the start symbol is always among them).
 *
 * An empty marker selects the first sentence, an empty slot list selects every
 * multi-alternative symbol in declaration order.
 */
class DetectorProfile {
public:
  std::string marker;
  std::vector<std::string> slots{};
  std::unordered_set<std::string> excluded{};
};

class SlotMatch {
public:
  std::string symbol;
  std::string alternative;
  std::string codeword;
  size_t begin{0};  // byte offsets into the carrier sentence
  size_t end{0};
  bool overlaps{false};  // shares text with an earlier match
};

class DetectionResult {
public:
  bool detected{false};
  std::string sentence;
  std::string bits;
  std::vector<SlotMatch> trace{};
  std::vector<std::string> missing{};
};

// Best-effort reconstruction: each slot's alternative is assumed to appear
// unmodified and once in the carrier sentence. Alternatives shared between
// slots are only told apart by slot order; such matches are flagged.
class Detector {
private:
  const Grammar& grammar_;
  HuffmanCoder& coder_;
  std::string marker_;
  std::unordered_set<std::string> excluded_;
  std::vector<std::string> slots_{};

public:
  explicit Detector(HuffmanCoder& coder, const DetectorProfile& profile = {})
      : grammar_(coder.grammar()), coder_(coder), marker_(profile.marker), excluded_(profile.excluded) {
    excluded_.insert(grammar_.start());
    resolve_slots(profile.slots);
  }

  Detector(const Detector& other) = delete;
  Detector& operator=(const Detector& other) = delete;
  Detector(Detector&& other) = delete;
  Detector& operator=(Detector&& other) = delete;
  ~Detector() = default;

  const std::vector<std::string>& slots() const noexcept { return slots_; }

  std::optional<std::string> carrier_sentence(const std::string& text) const {
    for (const std::string& sentence : util::split_sentences(text)) {
      if (marker_.empty() || util::find_word(sentence, marker_) != std::string::npos) {
        return sentence;
      }
    }
    return std::nullopt;
  }

  DetectionResult detect(const std::string& text) {
    DetectionResult result;
    std::optional<std::string> sentence = carrier_sentence(text);
    if (!sentence) {
      PROSAIC_LOG_INFO("no sentence carries the marker '{}'", marker_);
      return result;
    }
    result.sentence = *sentence;
    coder_.prepare(excluded_);

    for (const std::string& slot : slots_) {
      std::optional<SlotMatch> match = match_slot(slot, result.sentence);
      if (!match) {
        PROSAIC_LOG_WARN("slot '{}' has no match in the carrier sentence", slot);
        result.missing.push_back(slot);
        continue;
      }

      for (const SlotMatch& prev : result.trace) {
        if (match->begin < prev.end && prev.begin < match->end) {
          match->overlaps = true;
          PROSAIC_LOG_WARN("slot '{}' match '{}' overlaps the match of slot '{}'", slot, match->alternative, prev.symbol);
        }
      }
      PROSAIC_LOG_DEBUG("slot '{}' matched '{}' at {}, codeword {}", slot, match->alternative, match->begin, match->codeword);
      result.bits += match->codeword;
      result.trace.push_back(*match);
    }

    result.detected = !result.bits.empty();
    return result;
  }

private:
  void resolve_slots(const std::vector<std::string>& requested) {
    if (requested.empty()) {
      for (const std::string& symbol : grammar_.symbols()) {
        if (grammar_.alternatives(symbol).size() > 1 && !excluded_.contains(symbol)) {
          slots_.push_back(symbol);
        }
      }
      return;
    }

    for (const std::string& symbol : requested) {
      if (!grammar_.contains(symbol)) {
        PROSAIC_LOG_WARN("slot symbol '{}' is not defined by the grammar, ignored", symbol);
      } else if (excluded_.contains(symbol)) {
        PROSAIC_LOG_WARN("slot symbol '{}' is excluded from payload, ignored", symbol);
      } else if (grammar_.alternatives(symbol).size() < 2) {
        PROSAIC_LOG_WARN("slot symbol '{}' has a single alternative, ignored", symbol);
      } else {
        slots_.push_back(symbol);
      }
    }
  }

  std::optional<SlotMatch> match_slot(const std::string& slot, const std::string& sentence) {
    for (const Alternative& alt : grammar_.alternatives(slot)) {
      std::optional<std::string> surface = grammar_.surface(alt);
      if (!surface || surface->empty()) {
        PROSAIC_LOG_TRACE("alternative '{}' of '{}' has no fixed text", alt.text, slot);
        continue;
      }
      size_t pos = util::find_word(sentence, *surface);
      if (pos != std::string::npos) {
        return SlotMatch{slot, alt.text, coder_.codeword(slot, alt), pos, pos + surface->size()};
      }
    }
    return std::nullopt;
  }
};

} // namespace runtime
} // namespace prosaic

#endif // PROSAIC_RUNTIME_DETECTOR_HPP
