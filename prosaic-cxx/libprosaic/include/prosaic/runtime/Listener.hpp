// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_RUNTIME_LISTENER_HPP
#define PROSAIC_RUNTIME_LISTENER_HPP

#include "Grammar.hpp"

#include <string>

namespace prosaic {
namespace runtime {

class Listener {
public:
  Listener() = default;
  Listener(const Listener& other) = delete;
  Listener& operator=(const Listener& other) = delete;
  Listener(Listener&& other) = delete;
  Listener& operator=(Listener&& other) = delete;
  virtual ~Listener() = default;

  // Called for every nonterminal expansion. codeword is empty unless the
  // alternative was selected by payload bits.
  virtual void expand(const std::string& symbol, const Alternative& alternative, const std::string& codeword) {}

  // Called after each derivation attempt of an encode call.
  virtual void attempt(int index, const std::string& text, bool natural) {}
};

} // namespace runtime
} // namespace prosaic

#endif // PROSAIC_RUNTIME_LISTENER_HPP
