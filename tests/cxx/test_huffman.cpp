// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <prosaic/runtime/Grammar.hpp>
#include <prosaic/runtime/HuffmanCoder.hpp>

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace prosaic::runtime;

namespace {

bool is_prefix_free(const CodeTable& table) {
  for (const auto& [alt1, word1] : table) {
    for (const auto& [alt2, word2] : table) {
      if (alt1 != alt2 && word2.compare(0, word1.size(), word1) == 0) {
        return false;
      }
    }
  }
  return true;
}

double expected_length(const Grammar& grammar, const std::string& symbol, const CodeTable& table) {
  double length = 0.0;
  for (const auto& alt : grammar.alternatives(symbol)) {
    length += alt.weight * table.at(alt.text).size();
  }
  return length;
}

} // namespace

TEST(HuffmanCoderTest, TwoEqualAlternatives) {
  Grammar grammar("Start -> CITY\nCITY -> \"Boston\" [0.5] | \"Denver\" [0.5]\n");
  HuffmanCoder coder(grammar);
  const CodeTable& codes = coder.codes("CITY");

  ASSERT_EQ(codes.size(), 2);
  EXPECT_EQ(codes.at("\"Boston\""), "0");
  EXPECT_EQ(codes.at("\"Denver\""), "1");
}

TEST(HuffmanCoderTest, SkewedWeights) {
  Grammar grammar("Start -> CITY\nCITY -> Boston [0.4] | Denver [0.3] | Seattle [0.2] | Austin [0.1]\n");
  HuffmanCoder coder(grammar);
  const CodeTable& codes = coder.codes("CITY");

  ASSERT_EQ(codes.size(), 4);
  EXPECT_EQ(codes.at("Boston"), "0");
  EXPECT_EQ(codes.at("Denver"), "10");
  EXPECT_EQ(codes.at("Austin"), "110");
  EXPECT_EQ(codes.at("Seattle"), "111");
  EXPECT_NEAR(expected_length(grammar, "CITY", codes), 1.9, 1e-12);
}

TEST(HuffmanCoderTest, TiesFollowDeclarationOrder) {
  Grammar grammar("Start -> X\nX -> a [0.25] | b [0.25] | c [0.25] | d [0.25]\n");
  HuffmanCoder coder(grammar);
  const CodeTable& codes = coder.codes("X");

  EXPECT_EQ(codes.at("a"), "00");
  EXPECT_EQ(codes.at("b"), "01");
  EXPECT_EQ(codes.at("c"), "10");
  EXPECT_EQ(codes.at("d"), "11");
}

TEST(HuffmanCoderTest, MergedNodesOrderAfterLeaves) {
  // After merging b and c (0.5), the tie with a (0.5) is won by the leaf
  Grammar grammar("Start -> X\nX -> a [0.5] | b [0.25] | c [0.25]\n");
  HuffmanCoder coder(grammar);
  const CodeTable& codes = coder.codes("X");

  EXPECT_EQ(codes.at("a"), "0");
  EXPECT_EQ(codes.at("b"), "10");
  EXPECT_EQ(codes.at("c"), "11");
}

TEST(HuffmanCoderTest, SingleAlternativeHasEmptyCodeword) {
  Grammar grammar("Start -> Greeting\nGreeting -> \"Hello\"\n");
  HuffmanCoder coder(grammar);
  const CodeTable& codes = coder.codes("Greeting");

  ASSERT_EQ(codes.size(), 1);
  EXPECT_EQ(codes.at("\"Hello\""), "");
}

TEST(HuffmanCoderTest, CodesArePrefixFreeBijections) {
  Grammar grammar(
      "Start -> A B C\n"
      "A -> a1 [0.05] | a2 [0.05] | a3 [0.1] | a4 [0.1] | a5 [0.2] | a6 [0.5]\n"
      "B -> b1 [0.9] | b2 [0.05] | b3 [0.05]\n"
      "C -> c1 | c2 | c3 | c4 | c5 | c6 | c7\n");
  HuffmanCoder coder(grammar);

  for (const char* symbol : {"A", "B", "C"}) {
    const CodeTable& codes = coder.codes(symbol);
    ASSERT_EQ(codes.size(), grammar.alternatives(symbol).size()) << symbol;
    EXPECT_TRUE(is_prefix_free(codes)) << symbol;

    std::set<std::string> words;
    for (const auto& [alt, word] : codes) {
      EXPECT_FALSE(word.empty()) << symbol;
      words.insert(word);
    }
    EXPECT_EQ(words.size(), codes.size()) << symbol;
  }

  // Code lengths 1, 3, 3, 3, 4, 4 for a6, a3, a4, a5, a1, a2
  EXPECT_NEAR(expected_length(grammar, "A", coder.codes("A")), 2.1, 1e-12);
  EXPECT_NEAR(expected_length(grammar, "B", coder.codes("B")), 1.1, 1e-12);
}

TEST(HuffmanCoderTest, CacheReturnsSameTable) {
  Grammar grammar("Start -> CITY\nCITY -> \"Boston\" [0.5] | \"Denver\" [0.5]\n");
  HuffmanCoder coder(grammar);

  EXPECT_FALSE(coder.cached("CITY"));
  const CodeTable& first = coder.codes("CITY");
  CodeTable copy = first;
  EXPECT_TRUE(coder.cached("CITY"));

  const CodeTable& second = coder.codes("CITY");
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(copy, second);
}

TEST(HuffmanCoderTest, PrepareSkipsExcludedAndSingleSymbols) {
  Grammar grammar("Start -> A B C\nA -> x | y\nB -> x | y\nC -> z\n");
  HuffmanCoder coder(grammar);
  coder.prepare({"B"});

  EXPECT_TRUE(coder.cached("A"));
  EXPECT_FALSE(coder.cached("B"));
  EXPECT_FALSE(coder.cached("C"));
  EXPECT_FALSE(coder.cached("Start"));
}
