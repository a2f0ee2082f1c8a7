// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_RUNTIME_ENCODER_HPP
#define PROSAIC_RUNTIME_ENCODER_HPP

#include "../util/log.hpp"
#include "DefaultModel.hpp"
#include "Errors.hpp"
#include "Grammar.hpp"
#include "HuffmanCoder.hpp"
#include "Listener.hpp"
#include "Model.hpp"
#include "Naturalness.hpp"
#include "Payload.hpp"
#include "Serializer.hpp"

#include <algorithm>
#include <deque>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace prosaic {
namespace runtime {

class EncodeResult {
public:
  std::string text;
  std::string payload;
  size_t bits_embedded{0};
  int attempts{0};
  bool natural{false};
};

/*
 * Hides a bit string in a sentence derived top-down from the grammar.
 *
 * The leftmost pending token is expanded first. A multi-alternative symbol
 * that has not carried payload yet in the current derivation takes the first
 * alternative (in declaration order) whose codeword equals the next payload
 * bits; every other choice is left to the model. Each symbol carries payload
 * at most once per derivation, so the detector can read one codeword per slot
 * symbol. Excluded symbols, the start symbol among them, are always left to
 * the model.
 *
 * Derivations are retried with fresh model choices until the text passes the
 * naturalness gate or max_attempts is reached, in which case the last
 * candidate is returned anyway.
 */
class Encoder {
public:
  static constexpr int default_max_attempts = 15;
  static constexpr int default_expansion_limit = 10000;

private:
  struct Derivation {
    std::deque<Token> pending{};
    size_t cursor{0};
    std::unordered_set<std::string> used{};
    std::vector<std::string> words{};
  };

  const Grammar& grammar_;
  HuffmanCoder& coder_;
  Model* model_;
  std::vector<Listener*> listeners_;
  SerializerFn serializer_;
  NaturalnessEvaluator evaluator_{};
  int max_attempts_;
  int expansion_limit_;
  std::unordered_set<std::string> excluded_{};

public:
  explicit Encoder(HuffmanCoder& coder, Model* model = new DefaultModel(), const std::vector<Listener*>& listeners = {},
                   SerializerFn serializer = SimpleSpaceSerializer, int max_attempts = default_max_attempts,
                   int expansion_limit = default_expansion_limit)
      : grammar_(coder.grammar()), coder_(coder), model_(model), listeners_(listeners), serializer_(serializer),
        max_attempts_(std::max(max_attempts, 1)), expansion_limit_(expansion_limit) {
    excluded_.insert(grammar_.start());
  }

  Encoder(const Encoder& other) = delete;
  Encoder& operator=(const Encoder& other) = delete;
  Encoder(Encoder&& other) = delete;
  Encoder& operator=(Encoder&& other) = delete;

  ~Encoder() {
    delete model_;
    for (Listener* listener : listeners_) {
      delete listener;
    }
  }

  // Symbols that never carry payload, mirroring the detector profile.
  void exclude(const std::unordered_set<std::string>& symbols) {
    excluded_.insert(symbols.begin(), symbols.end());
  }

  // max_bits of 0 means no cap below bits.
  EncodeResult encode(const std::string& message, const std::string& key,
                      size_t bits = default_payload_bits, size_t max_bits = 0) {
    std::string payload = derive_payload(message, key, bits);
    if (max_bits > 0 && payload.size() > max_bits) {
      payload.resize(max_bits);
    }
    return embed(payload);
  }

  EncodeResult embed(const std::string& payload) {
    EncodeResult result;
    result.payload = payload;
    bool have_candidate = false;

    for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
      result.attempts = attempt;
      std::optional<Derivation> derivation = derive(payload);
      if (!derivation) {
        PROSAIC_LOG_WARN("attempt {}: derivation exceeded {} expansions, discarded", attempt, expansion_limit_);
        continue;
      }

      std::string text = terminate_sentence(serializer_(derivation->words));
      bool natural = evaluator_.is_natural(text);
      for (Listener* listener : listeners_) {
        listener->attempt(attempt, text, natural);
      }

      result.text = text;
      result.bits_embedded = derivation->cursor;
      result.natural = natural;
      have_candidate = true;

      if (natural) {
        PROSAIC_LOG_DEBUG("attempt {}: accepted, {}/{} bits embedded", attempt, result.bits_embedded, payload.size());
        return result;
      }
      PROSAIC_LOG_DEBUG("attempt {}: rejected as unnatural: {}", attempt, text);
    }

    if (!have_candidate) {
      throw DerivationLimitError(max_attempts_);
    }
    PROSAIC_LOG_WARN("no natural candidate within {} attempts, keeping the last one", max_attempts_);
    if (result.bits_embedded < payload.size()) {
      PROSAIC_LOG_WARN("grammar capacity exhausted: {} of {} bits embedded", result.bits_embedded, payload.size());
    }
    return result;
  }

private:
  std::optional<Derivation> derive(const std::string& payload) {
    Derivation d;
    d.pending.emplace_back(grammar_.start(), false);
    int expansions = 0;

    while (!d.pending.empty()) {
      Token token = d.pending.front();
      d.pending.pop_front();

      if (grammar_.is_terminal(token)) {
        d.words.push_back(token.text);
        continue;
      }
      if (++expansions > expansion_limit_) {
        return std::nullopt;
      }

      const std::string& symbol = token.text;
      const std::vector<Alternative>& alts = grammar_.alternatives(symbol);
      const Alternative* chosen = nullptr;
      std::string codeword;

      if (alts.size() == 1) {
        chosen = &alts[0];
      } else {
        const CodeTable& codes = coder_.codes(symbol);
        if (d.cursor < payload.size() && !d.used.contains(symbol) && !excluded_.contains(symbol)) {
          for (const Alternative& alt : alts) {
            const std::string& word = codes.at(alt.text);
            if (!word.empty() && d.cursor + word.size() <= payload.size()
                && payload.compare(d.cursor, word.size(), word) == 0) {
              chosen = &alt;
              codeword = word;
              d.cursor += word.size();
              d.used.insert(symbol);
              break;
            }
          }
        }
        if (!chosen) {
          chosen = &alts.at(model_->choice(symbol, grammar_.weights(symbol)));
        }
      }

      PROSAIC_LOG_TRACE("{} -> {} [{}]", symbol, chosen->text, codeword);
      for (Listener* listener : listeners_) {
        listener->expand(symbol, *chosen, codeword);
      }
      d.pending.insert(d.pending.begin(), chosen->tokens.begin(), chosen->tokens.end());
    }
    return d;
  }
};

} // namespace runtime
} // namespace prosaic

#endif // PROSAIC_RUNTIME_ENCODER_HPP
