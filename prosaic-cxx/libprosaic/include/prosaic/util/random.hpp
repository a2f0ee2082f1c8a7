// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_UTIL_RANDOM_HPP
#define PROSAIC_UTIL_RANDOM_HPP

#include <random>
#include <vector>

namespace prosaic {
namespace util {

// Process-wide source for the fallback choices of the encoder. Tools seed it
// from a fixed --random-seed or from system entropy, tests seed it directly.
inline std::default_random_engine random_engine;

inline void seed_random(unsigned int seed) {
  random_engine.seed(seed);
}

inline unsigned int seed_random_from_entropy() {
  unsigned int seed = std::random_device()();
  random_engine.seed(seed);
  return seed;
}

inline size_t random_weighted_choice(const std::vector<double>& weights) {
  std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
  return dist(random_engine);
}

} // namespace util
} // namespace prosaic

#endif // PROSAIC_UTIL_RANDOM_HPP
