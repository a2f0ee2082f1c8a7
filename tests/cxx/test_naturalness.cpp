// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <prosaic/runtime/Naturalness.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <string>

using namespace prosaic::runtime;

namespace {

// Text whose letter histogram follows the reference table, minus the letters in drop.
std::string reference_text(const std::string& drop = "") {
  std::string text;
  for (char letter = 'a'; letter <= 'z'; ++letter) {
    if (drop.find(letter) != std::string::npos) {
      continue;
    }
    text.append(std::lround(NaturalnessEvaluator::reference[letter - 'a'] * 100000), letter);
  }
  return text;
}

} // namespace

TEST(NaturalnessTest, ShortTextIsNatural) {
  NaturalnessEvaluator evaluator;

  EXPECT_TRUE(evaluator.is_natural("Hello Denver."));
  EXPECT_DOUBLE_EQ(evaluator.naturality("Hello Denver."), 1.0);
  EXPECT_TRUE(evaluator.is_natural("zzzz qqqq xxxx 1234567890 !!!"));
  EXPECT_TRUE(evaluator.is_natural(""));
}

TEST(NaturalnessTest, ReferenceDistributionScoresNearOne) {
  NaturalnessEvaluator evaluator;
  std::string text = reference_text();

  EXPECT_TRUE(evaluator.is_natural(text));
  EXPECT_NEAR(evaluator.naturality(text), 1.0, 1e-3);
}

TEST(NaturalnessTest, SingleLetterTextScoresZero) {
  NaturalnessEvaluator evaluator;
  std::string text(40, 'a');

  EXPECT_FALSE(evaluator.is_natural(text));
  EXPECT_DOUBLE_EQ(evaluator.naturality(text), 0.0);
}

TEST(NaturalnessTest, MissingRareLettersAreRejected) {
  NaturalnessEvaluator evaluator;
  EXPECT_FALSE(evaluator.is_natural(reference_text("zqx")));
  EXPECT_FALSE(evaluator.is_natural(reference_text("z")));
  // Long enough to be judged, but without z, q or x
  EXPECT_FALSE(evaluator.is_natural("the cat sat on the mat and ate its dinner"));
}

TEST(NaturalnessTest, ExcessRareLettersAreRejected) {
  NaturalnessEvaluator evaluator;
  EXPECT_FALSE(evaluator.is_natural(reference_text() + std::string(1000, 'q')));
}

TEST(NaturalnessTest, MissingFrequentLetterIsRejected) {
  NaturalnessEvaluator evaluator;
  EXPECT_FALSE(evaluator.is_natural(reference_text("e")));
  EXPECT_FALSE(evaluator.is_natural(reference_text("t")));
}

TEST(NaturalnessTest, IgnoresCaseAndNonLetters) {
  NaturalnessEvaluator evaluator;
  std::string lower = "the quick brown fox jumps over the lazy dog";
  std::string mixed = "The QUICK brown fox, jumps over... the lazy DOG! 42";

  EXPECT_DOUBLE_EQ(evaluator.naturality(lower), evaluator.naturality(mixed));
  EXPECT_EQ(evaluator.is_natural(lower), evaluator.is_natural(mixed));
}
