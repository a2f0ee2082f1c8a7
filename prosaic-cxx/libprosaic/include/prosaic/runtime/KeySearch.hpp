// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_RUNTIME_KEYSEARCH_HPP
#define PROSAIC_RUNTIME_KEYSEARCH_HPP

#include "../util/log.hpp"
#include "Payload.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace prosaic {
namespace runtime {

class KeyCandidate {
public:
  std::string key;
  std::string message;  // recovered message, or a note for key-only hits
  double confidence{0.0};
  bool message_recovered{false};
};

/*
 * Nearest-match search over candidate keys and messages for an extracted bit
 * string. For every key the first message whose derived payload agrees with
 * the bits on more than message_threshold of the positions wins; failing
 * that, the key alone is compared on its first key_prefix_bits payload bits.
 * The result is ordered by descending confidence, ties keep key order. A key
 * whose derivation throws is logged and skipped.
 */
class KeySearchEngine {
public:
  virtual ~KeySearchEngine() = default;

  static constexpr double message_threshold = 0.8;
  static constexpr double key_threshold = 0.5;
  static constexpr size_t key_prefix_bits = 16;
  static constexpr const char* possible_key_note = "possible key";

  static const std::vector<std::string>& default_messages() {
    static const std::vector<std::string> messages = {
      "hi", "hello", "yes", "no", "ok", "secret", "test", "message", "help",
      "meet me", "attack at dawn", "all clear", "abort", "go", "wait",
    };
    return messages;
  }

  // Fraction of equal positions over the common prefix of a and b.
  static double similarity(const std::string& a, const std::string& b) {
    size_t n = std::min(a.size(), b.size());
    if (n == 0) {
      return 0.0;
    }
    size_t same = 0;
    for (size_t i = 0; i < n; ++i) {
      if (a[i] == b[i]) {
        ++same;
      }
    }
    return static_cast<double>(same) / n;
  }

  std::vector<KeyCandidate> recover(const std::string& bits, const std::vector<std::string>& keys,
                                    const std::vector<std::string>& messages = {}) const {
    std::vector<KeyCandidate> ranked;
    if (bits.empty()) {
      return ranked;
    }
    const std::vector<std::string>& guesses = messages.empty() ? default_messages() : messages;

    for (const std::string& key : keys) {
      try {
        std::optional<KeyCandidate> candidate = try_key(bits, key, guesses);
        if (candidate) {
          ranked.push_back(*candidate);
        }
      } catch (const std::exception& e) {
        PROSAIC_LOG_ERROR("key '{}' skipped: {}", key, e.what());
      }
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const KeyCandidate& a, const KeyCandidate& b) {
      return a.confidence > b.confidence;
    });
    return ranked;
  }

protected:
  virtual std::string derive(const std::string& message, const std::string& key, size_t bits) const {
    return derive_payload(message, key, bits);
  }

private:
  std::optional<KeyCandidate> try_key(const std::string& bits, const std::string& key,
                                      const std::vector<std::string>& guesses) const {
    for (const std::string& message : guesses) {
      double score = similarity(bits, derive(message, key, bits.size()));
      if (score > message_threshold) {
        PROSAIC_LOG_DEBUG("key '{}': message '{}' matches {:.3f}", key, message, score);
        return KeyCandidate{key, message, score, true};
      }
    }

    double score = similarity(bits, derive("", key, key_prefix_bits));
    PROSAIC_LOG_DEBUG("key '{}': key-only similarity {:.3f}", key, score);
    if (score > key_threshold) {
      return KeyCandidate{key, possible_key_note, score, false};
    }
    return std::nullopt;
  }
};

} // namespace runtime
} // namespace prosaic

#endif // PROSAIC_RUNTIME_KEYSEARCH_HPP
