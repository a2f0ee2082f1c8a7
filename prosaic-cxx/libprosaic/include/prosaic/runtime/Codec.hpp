// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_RUNTIME_CODEC_HPP
#define PROSAIC_RUNTIME_CODEC_HPP

#include "DefaultModel.hpp"
#include "Detector.hpp"
#include "Encoder.hpp"
#include "Grammar.hpp"
#include "HuffmanCoder.hpp"
#include "KeySearch.hpp"
#include "Model.hpp"
#include "Payload.hpp"

#include <string>
#include <vector>

namespace prosaic {
namespace runtime {

/*
 * Owns a grammar together with its code-table cache and runs single encode,
 * detect and key-recovery calls against them. Encoders and detectors created
 * per call only borrow the shared cache.
 */
class Codec {
private:
  Grammar grammar_;
  HuffmanCoder coder_;

public:
  explicit Codec(const std::string& src, const std::string& start = Grammar::default_start,
                 Grammar::ParseMode mode = Grammar::StrictParse)
      : grammar_(src, start, mode), coder_(grammar_) { }

  Codec(const Codec& other) = delete;
  Codec& operator=(const Codec& other) = delete;
  Codec(Codec&& other) = delete;
  Codec& operator=(Codec&& other) = delete;
  ~Codec() = default;

  const Grammar& grammar() const noexcept { return grammar_; }
  HuffmanCoder& coder() noexcept { return coder_; }

  unsigned capacity() const { return grammar_.capacity(); }

  EncodeResult encode(const std::string& message, const std::string& key, size_t bits = default_payload_bits,
                      size_t max_bits = 0, const DetectorProfile& profile = {}, Model* model = new DefaultModel()) {
    Encoder encoder(coder_, model);
    encoder.exclude(profile.excluded);
    return encoder.encode(message, key, bits, max_bits);
  }

  DetectionResult detect(const std::string& text, const DetectorProfile& profile = {}) {
    Detector detector(coder_, profile);
    return detector.detect(text);
  }

  std::vector<KeyCandidate> recover(const DetectionResult& detection, const std::vector<std::string>& keys,
                                    const std::vector<std::string>& messages = {}) const {
    return KeySearchEngine().recover(detection.bits, keys, messages);
  }

  // Detects the carrier in text and searches keys against its bits.
  std::vector<KeyCandidate> recover(const std::string& text, const std::vector<std::string>& keys,
                                    const std::vector<std::string>& messages = {},
                                    const DetectorProfile& profile = {}) {
    return recover(detect(text, profile), keys, messages);
  }
};

} // namespace runtime
} // namespace prosaic

#endif // PROSAIC_RUNTIME_CODEC_HPP
