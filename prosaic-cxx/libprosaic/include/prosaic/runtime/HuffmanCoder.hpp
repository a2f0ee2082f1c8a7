// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_RUNTIME_HUFFMANCODER_HPP
#define PROSAIC_RUNTIME_HUFFMANCODER_HPP

#include "../util/log.hpp"
#include "Grammar.hpp"

#include <queue>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace prosaic {
namespace runtime {

// Alternative text -> codeword ('0'/'1' characters).
using CodeTable = std::unordered_map<std::string, std::string>;

/*
 * Builds one minimum-redundancy prefix code per grammar symbol from the
 * weights of its alternatives and caches it for the lifetime of the coder.
 *
 * The two lightest pending nodes are merged repeatedly; ties are broken by
 * declaration order (merged nodes order after every original alternative and
 * after earlier merges), the first popped node receives the '0' branch. A
 * symbol with a single alternative gets the empty codeword.
 */
class HuffmanCoder {
private:
  const Grammar& grammar_;
  std::unordered_map<std::string, CodeTable> cache_{};

public:
  explicit HuffmanCoder(const Grammar& grammar) : grammar_(grammar) { }

  HuffmanCoder(const HuffmanCoder& other) = delete;
  HuffmanCoder& operator=(const HuffmanCoder& other) = delete;
  HuffmanCoder(HuffmanCoder&& other) = delete;
  HuffmanCoder& operator=(HuffmanCoder&& other) = delete;
  ~HuffmanCoder() = default;

  const Grammar& grammar() const noexcept { return grammar_; }

  // The reference stays valid for the lifetime of the coder.
  const CodeTable& codes(const std::string& symbol) {
    auto it = cache_.find(symbol);
    if (it != cache_.end()) {
      return it->second;
    }
    return cache_.emplace(symbol, build(grammar_.alternatives(symbol))).first->second;
  }

  const std::string& codeword(const std::string& symbol, const Alternative& alt) {
    return codes(symbol).at(alt.text);
  }

  // Builds the tables of every multi-alternative symbol not in excluded.
  void prepare(const std::unordered_set<std::string>& excluded = {}) {
    for (const std::string& symbol : grammar_.symbols()) {
      if (grammar_.alternatives(symbol).size() > 1 && !excluded.contains(symbol)) {
        codes(symbol);
      }
    }
  }

  bool cached(const std::string& symbol) const { return cache_.contains(symbol); }

  static CodeTable build(const std::vector<Alternative>& alts) {
    CodeTable table;
    if (alts.size() == 1) {
      table.emplace(alts[0].text, "");
      return table;
    }

    struct Node {
      double weight;
      size_t order;
      std::vector<size_t> members;
    };
    auto heavier = [](const Node& a, const Node& b) {
      return a.weight != b.weight ? a.weight > b.weight : a.order > b.order;
    };
    std::priority_queue<Node, std::vector<Node>, decltype(heavier)> heap(heavier);

    std::vector<std::string> words(alts.size());
    for (size_t i = 0; i < alts.size(); ++i) {
      heap.push(Node{alts[i].weight, i, {i}});
    }

    size_t next_order = alts.size();
    while (heap.size() > 1) {
      Node lo = heap.top();
      heap.pop();
      Node hi = heap.top();
      heap.pop();

      for (size_t i : lo.members) {
        words[i].insert(words[i].begin(), '0');
      }
      for (size_t i : hi.members) {
        words[i].insert(words[i].begin(), '1');
      }
      lo.members.insert(lo.members.end(), hi.members.begin(), hi.members.end());
      heap.push(Node{lo.weight + hi.weight, next_order++, std::move(lo.members)});
    }

    for (size_t i = 0; i < alts.size(); ++i) {
      PROSAIC_LOG_TRACE("codeword {} for '{}' (weight {})", words[i], alts[i].text, alts[i].weight);
      table.emplace(alts[i].text, words[i]);
    }
    return table;
  }
};

} // namespace runtime
} // namespace prosaic

#endif // PROSAIC_RUNTIME_HUFFMANCODER_HPP
