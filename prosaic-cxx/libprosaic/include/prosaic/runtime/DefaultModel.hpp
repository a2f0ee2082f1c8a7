// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_RUNTIME_DEFAULTMODEL_HPP
#define PROSAIC_RUNTIME_DEFAULTMODEL_HPP

#include "../util/random.hpp"
#include "Model.hpp"

#include <numeric>

namespace prosaic {
namespace runtime {

class DefaultModel : public Model {
public:
  DefaultModel() = default;
  DefaultModel(const DefaultModel& other) = delete;
  DefaultModel& operator=(const DefaultModel& other) = delete;
  DefaultModel(DefaultModel&& other) = delete;
  DefaultModel& operator=(DefaultModel&& other) = delete;
  ~DefaultModel() override = default;

  size_t choice(const std::string& symbol, const std::vector<double>& weights) override {
    double sum = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (sum == 0) {
      // All alternatives are weightless, fall back to the last one
      return weights.size() - 1;
    }
    return prosaic::util::random_weighted_choice(weights);
  }
};

} // namespace runtime
} // namespace prosaic

#endif // PROSAIC_RUNTIME_DEFAULTMODEL_HPP
