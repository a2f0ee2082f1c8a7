// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_RUNTIME_MODEL_HPP
#define PROSAIC_RUNTIME_MODEL_HPP

#include <string>
#include <vector>

namespace prosaic {
namespace runtime {

/*
 * Decides the alternative of a symbol whenever no payload bits drive the
 * choice. Returns an index into weights.
 */
class Model {
public:
  Model() = default;
  Model(const Model& other) = delete;
  Model& operator=(const Model& other) = delete;
  Model(Model&& other) = delete;
  Model& operator=(Model&& other) = delete;
  virtual ~Model() = default;

  virtual size_t choice(const std::string& symbol, const std::vector<double>& weights) = 0;
};

} // namespace runtime
} // namespace prosaic

#endif // PROSAIC_RUNTIME_MODEL_HPP
