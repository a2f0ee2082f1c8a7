// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_RUNTIME_NATURALNESS_HPP
#define PROSAIC_RUNTIME_NATURALNESS_HPP

#include "../util/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <string>
#include <string_view>

namespace prosaic {
namespace runtime {

/*
 * Letter-frequency heuristic comparing a text against reference English.
 *
 * is_natural() is the encoder's gate: every key letter, frequent (e t a o i n
 * s) or rare (z q x), must stay within half of its expected frequency in
 * either direction. A sentence lacking z, q and x therefore fails as soon as
 * it reaches min_sample letters. naturality() averages the absolute deviation
 * over the whole alphabet and maps it onto [0, 1]. Texts shorter than
 * min_sample letters are always considered natural.
 */
class NaturalnessEvaluator {
public:
  static constexpr size_t min_sample = 20;
  static constexpr double tolerance = 0.5;
  static constexpr double calibration = 0.05;
  static constexpr std::string_view key_letters = "etaoinszqx";

  // Relative letter frequencies of English text, a..z.
  static constexpr std::array<double, 26> reference = {
    0.08167, 0.01492, 0.02782, 0.04253, 0.12702, 0.02228, 0.02015, 0.06094, 0.06966,
    0.00153, 0.00772, 0.04025, 0.02406, 0.06749, 0.07507, 0.01929, 0.00095, 0.05987,
    0.06327, 0.09056, 0.02758, 0.00978, 0.02360, 0.00150, 0.01974, 0.00074,
  };

  class Histogram {
  public:
    std::array<size_t, 26> counts{};
    size_t total{0};

    explicit Histogram(std::string_view text) {
      for (char c : text) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x80 && std::isalpha(u)) {
          counts[std::tolower(u) - 'a']++;
          total++;
        }
      }
    }

    double frequency(char letter) const {
      return total ? static_cast<double>(counts[letter - 'a']) / total : 0.0;
    }
  };

  NaturalnessEvaluator() = default;

  bool is_natural(std::string_view text) const {
    Histogram hist(text);
    if (hist.total < min_sample) {
      return true;
    }

    for (char letter : key_letters) {
      double expected = reference[letter - 'a'];
      double observed = hist.frequency(letter);
      if (std::abs(observed - expected) > tolerance * expected) {
        PROSAIC_LOG_DEBUG("letter '{}' at {:.4f}, expected {:.4f}", letter, observed, expected);
        return false;
      }
    }
    return true;
  }

  double naturality(std::string_view text) const {
    Histogram hist(text);
    if (hist.total < min_sample) {
      return 1.0;
    }

    double deviation = 0.0;
    for (char letter = 'a'; letter <= 'z'; ++letter) {
      deviation += std::abs(hist.frequency(letter) - reference[letter - 'a']);
    }
    deviation /= reference.size();
    return 1.0 - std::min(deviation / calibration, 1.0);
  }
};

} // namespace runtime
} // namespace prosaic

#endif // PROSAIC_RUNTIME_NATURALNESS_HPP
