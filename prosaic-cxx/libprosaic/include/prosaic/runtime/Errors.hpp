// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_RUNTIME_ERRORS_HPP
#define PROSAIC_RUNTIME_ERRORS_HPP

#include <format>
#include <stdexcept>
#include <string>

namespace prosaic {
namespace runtime {

class GrammarError : public std::runtime_error {
public:
  explicit GrammarError(const std::string& what) : std::runtime_error(what) { }
};

class GrammarSyntaxError : public GrammarError {
public:
  int line;

  GrammarSyntaxError(int line, const std::string& reason)
      : GrammarError(std::format("grammar syntax error on line {}: {}", line, reason)), line(line) { }
};

class GrammarIncompleteError : public GrammarError {
public:
  explicit GrammarIncompleteError(const std::string& start)
      : GrammarError(std::format("grammar does not define the start symbol '{}'", start)) { }
};

class GrammarFileNotFound : public GrammarError {
public:
  explicit GrammarFileNotFound(const std::string& path)
      : GrammarError(std::format("grammar file not found: {}", path)) { }
};

class DerivationLimitError : public std::runtime_error {
public:
  explicit DerivationLimitError(int attempts)
      : std::runtime_error(std::format("every derivation of {} attempt(s) exceeded the expansion limit", attempts)) { }
};

} // namespace runtime
} // namespace prosaic

#endif // PROSAIC_RUNTIME_ERRORS_HPP
