// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_RUNTIME_GRAMMAR_HPP
#define PROSAIC_RUNTIME_GRAMMAR_HPP

#include "../util/log.hpp"
#include "../util/text.hpp"
#include "Errors.hpp"

#include <xxhash.h>

#include <bit>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <format>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace prosaic {
namespace runtime {

class Token {
public:
  std::string text;
  bool quoted{false};

  Token() = default;
  Token(const std::string& text, bool quoted) : text(text), quoted(quoted) { }
};

class Alternative {
public:
  std::string text;  // as declared, weight annotation stripped
  double weight;
  std::vector<Token> tokens;

  Alternative(const std::string& text, double weight, const std::vector<Token>& tokens)
      : text(text), weight(weight), tokens(tokens) { }
};

/*
 * Weighted context-free grammar read from the line-oriented rule syntax
 *
 *   SYMBOL -> ALT1 [p1] | ALT2 [p2] | ...
 *
 * Symbols keep their declaration order and every symbol keeps the declaration
 * order of its alternatives, both are relied upon for deterministic code
 * construction. A grammar is immutable once constructed; any parse error is
 * thrown from the constructor.
 */
class Grammar {
public:
  enum ParseMode { StrictParse, LenientParse };

  static constexpr const char* default_start = "Start";
  static constexpr const char* static_symbol = "static";
  static constexpr double weight_tolerance = 0.01;

private:
  std::string start_;
  std::vector<std::string> order_{};
  std::unordered_map<std::string, std::vector<Alternative>> rules_{};

public:
  explicit Grammar(const std::string& src, const std::string& start = default_start, ParseMode mode = StrictParse)
      : start_(start) {
    parse(src, mode);
  }

  Grammar(const Grammar& other) = delete;
  Grammar& operator=(const Grammar& other) = delete;
  Grammar(Grammar&& other) = delete;
  Grammar& operator=(Grammar&& other) = delete;
  ~Grammar() = default;

  const std::string& start() const noexcept { return start_; }
  const std::vector<std::string>& symbols() const noexcept { return order_; }

  bool contains(const std::string& symbol) const { return rules_.contains(symbol); }
  bool is_terminal(const Token& token) const { return token.quoted || !contains(token.text); }

  const std::vector<Alternative>& alternatives(const std::string& symbol) const { return rules_.at(symbol); }

  std::vector<double> weights(const std::string& symbol) const {
    std::vector<double> result;
    for (const Alternative& alt : alternatives(symbol)) {
      result.push_back(alt.weight);
    }
    return result;
  }

  // Text an alternative produces verbatim, if it consists of terminals only.
  std::optional<std::string> surface(const Alternative& alt) const {
    std::vector<std::string> words;
    for (const Token& token : alt.tokens) {
      if (!is_terminal(token)) {
        return std::nullopt;
      }
      words.push_back(token.text);
    }
    return util::join(" ", words);
  }

  // Number of whole bits a symbol can carry: floor(log2(#alternatives)).
  unsigned capacity(const std::string& symbol) const {
    if (symbol == static_symbol) {
      return 0;
    }
    return std::bit_width(alternatives(symbol).size()) - 1;
  }

  unsigned capacity() const {
    unsigned bits = 0;
    for (const std::string& symbol : order_) {
      bits += capacity(symbol);
    }
    return bits;
  }

  std::string format() const {
    std::string result;
    for (const std::string& symbol : order_) {
      std::vector<std::string> alts;
      for (const Alternative& alt : rules_.at(symbol)) {
        alts.push_back(std::format("{} [{}]", alt.text, alt.weight));
      }
      result += std::format("{} -> {}\n", symbol, util::join(" | ", alts));
    }
    return result;
  }

  XXH64_hash_t fingerprint() const {
    std::string normalized = format();
    return XXH64(normalized.data(), normalized.size(), 0);
  }

private:
  struct PendingRule {
    int line;
    std::vector<Alternative> alts{};
    std::vector<bool> declared{};
  };

  void parse(const std::string& src, ParseMode mode) {
    std::unordered_map<std::string, PendingRule> pending;
    std::istringstream lines(src);
    std::string line;
    int lineno = 0;
    while (std::getline(lines, line)) {
      ++lineno;
      util::trim(line);
      if (line.empty() || line[0] == '#') {
        continue;
      }

      size_t arrow = line.find("->");
      if (arrow == std::string::npos) {
        throw GrammarSyntaxError(lineno, "missing '->' rule separator");
      }
      std::string lhs = util::trimmed(line.substr(0, arrow));
      if (lhs.empty()) {
        throw GrammarSyntaxError(lineno, "missing symbol before '->'");
      }
      if (lhs.find_first_of(" \t\"|") != std::string::npos) {
        throw GrammarSyntaxError(lineno, std::format("invalid symbol name '{}'", lhs));
      }

      auto [it, inserted] = pending.try_emplace(lhs, PendingRule{lineno});
      if (inserted) {
        order_.push_back(lhs);
      }
      PendingRule& rule = it->second;

      for (std::string alt : split_alternatives(line.substr(arrow + 2), lineno)) {
        util::trim(alt);
        if (alt.empty()) {
          throw GrammarSyntaxError(lineno, std::format("empty alternative for '{}'", lhs));
        }
        std::optional<double> weight = parse_weight(alt, lineno, mode);
        if (alt.empty()) {
          throw GrammarSyntaxError(lineno, std::format("alternative of '{}' has a weight but no body", lhs));
        }
        for (const Alternative& other : rule.alts) {
          if (other.text == alt) {
            throw GrammarSyntaxError(lineno, std::format("duplicate alternative '{}' for '{}'", alt, lhs));
          }
        }
        rule.alts.emplace_back(alt, weight.value_or(1.0), tokenize(alt, lineno));
        rule.declared.push_back(weight.has_value());
      }
    }

    if (!pending.contains(start_)) {
      throw GrammarIncompleteError(start_);
    }

    for (const std::string& symbol : order_) {
      PendingRule& rule = pending.at(symbol);
      normalize(symbol, rule, mode);
      rules_.emplace(symbol, std::move(rule.alts));
    }
  }

  static std::vector<std::string> split_alternatives(const std::string& rhs, int lineno) {
    std::vector<std::string> parts(1);
    bool in_quote = false;
    for (char c : rhs) {
      if (c == '"') {
        in_quote = !in_quote;
      }
      if (c == '|' && !in_quote) {
        parts.emplace_back();
      } else {
        parts.back() += c;
      }
    }
    if (in_quote) {
      throw GrammarSyntaxError(lineno, "unterminated quoted terminal");
    }
    return parts;
  }

  // Strips a trailing "[p]" annotation from alt and returns its value.
  static std::optional<double> parse_weight(std::string& alt, int lineno, ParseMode mode) {
    if (alt.back() != ']') {
      return std::nullopt;
    }
    size_t open = alt.rfind('[');
    if (open == std::string::npos) {
      throw GrammarSyntaxError(lineno, std::format("unbalanced probability bracket in '{}'", alt));
    }
    std::string number = util::trimmed(alt.substr(open + 1, alt.size() - open - 2));
    char* endp = nullptr;
    double value = std::strtod(number.c_str(), &endp);
    if (number.empty() || endp != number.c_str() + number.size() || std::isnan(value)) {
      throw GrammarSyntaxError(lineno, std::format("invalid probability '{}'", number));
    }
    alt = util::trimmed(alt.substr(0, open));

    if (value < 0.0 || value > 1.0) {
      if (mode == StrictParse) {
        throw GrammarSyntaxError(lineno, std::format("probability {} is outside [0, 1]", value));
      }
      PROSAIC_LOG_WARN("line {}: probability {} is outside [0, 1], using 1.0", lineno, value);
      value = 1.0;
    }
    return value;
  }

  static std::vector<Token> tokenize(const std::string& alt, int lineno) {
    std::vector<Token> tokens;
    size_t pos = 0;
    while (pos < alt.size()) {
      if (std::isspace(static_cast<unsigned char>(alt[pos]))) {
        ++pos;
      } else if (alt[pos] == '"') {
        size_t close = alt.find('"', pos + 1);
        if (close == std::string::npos) {
          throw GrammarSyntaxError(lineno, "unterminated quoted terminal");
        }
        tokens.emplace_back(alt.substr(pos + 1, close - pos - 1), true);
        pos = close + 1;
      } else {
        size_t end = pos;
        while (end < alt.size() && !std::isspace(static_cast<unsigned char>(alt[end])) && alt[end] != '"') {
          ++end;
        }
        tokens.emplace_back(alt.substr(pos, end - pos), false);
        pos = end;
      }
    }
    return tokens;
  }

  static void normalize(const std::string& symbol, PendingRule& rule, ParseMode mode) {
    size_t n = rule.alts.size();
    if (n == 1) {
      rule.alts[0].weight = 1.0;
      return;
    }

    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
      if (!rule.declared[i]) {
        rule.alts[i].weight = 1.0 / n;
      }
      sum += rule.alts[i].weight;
    }

    if (sum <= 0.0) {
      if (mode == StrictParse) {
        throw GrammarSyntaxError(rule.line, std::format("weights of '{}' sum to zero", symbol));
      }
      PROSAIC_LOG_WARN("weights of '{}' sum to zero, using uniform weights", symbol);
      for (Alternative& alt : rule.alts) {
        alt.weight = 1.0 / n;
      }
      return;
    }

    if (std::abs(sum - 1.0) > weight_tolerance) {
      PROSAIC_LOG_WARN("weights of '{}' sum to {}, renormalizing", symbol, sum);
      for (Alternative& alt : rule.alts) {
        alt.weight /= sum;
      }
    }
  }
};

} // namespace runtime
} // namespace prosaic

#endif // PROSAIC_RUNTIME_GRAMMAR_HPP
