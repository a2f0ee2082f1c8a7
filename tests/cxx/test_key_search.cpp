// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <prosaic/runtime/KeySearch.hpp>
#include <prosaic/runtime/Payload.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace prosaic::runtime;

namespace {

// Fixed payloads per key; "bad" cannot be derived at all.
class FixedPayloadEngine : public KeySearchEngine {
protected:
  std::string derive(const std::string& message, const std::string& key, size_t bits) const override {
    if (key == "bad") {
      throw std::runtime_error("digest unavailable");
    }
    if (key == "exact") {
      return "1111";
    }
    return message.empty() ? "1110" : "0000";
  }
};

} // namespace

TEST(KeySearchTest, Similarity) {
  EXPECT_DOUBLE_EQ(KeySearchEngine::similarity("1010", "1010"), 1.0);
  EXPECT_DOUBLE_EQ(KeySearchEngine::similarity("1010", "0101"), 0.0);
  EXPECT_DOUBLE_EQ(KeySearchEngine::similarity("1010", "1000"), 0.75);
  // Only the common prefix counts
  EXPECT_DOUBLE_EQ(KeySearchEngine::similarity("10", "1011110000"), 1.0);
  EXPECT_DOUBLE_EQ(KeySearchEngine::similarity("", "1"), 0.0);
}

TEST(KeySearchTest, EmptyBitsYieldNothing) {
  EXPECT_TRUE(KeySearchEngine().recover("", {"k1", "k2"}).empty());
}

TEST(KeySearchTest, RecoversMessageFromDefaultList) {
  std::string bits = derive_payload("hello", "k2", 24);
  ASSERT_EQ(bits, "101100100101110111010110");

  std::vector<KeyCandidate> ranked = KeySearchEngine().recover(bits, {"k1", "k2", "k3"});

  ASSERT_EQ(ranked.size(), 2);
  EXPECT_EQ(ranked[0].key, "k2");
  EXPECT_EQ(ranked[0].message, "hello");
  EXPECT_DOUBLE_EQ(ranked[0].confidence, 1.0);
  EXPECT_TRUE(ranked[0].message_recovered);

  EXPECT_EQ(ranked[1].key, "k3");
  EXPECT_EQ(ranked[1].message, KeySearchEngine::possible_key_note);
  EXPECT_DOUBLE_EQ(ranked[1].confidence, 0.5625);
  EXPECT_FALSE(ranked[1].message_recovered);
}

TEST(KeySearchTest, RecoversMessageFromWordlist) {
  std::vector<KeyCandidate> ranked =
      KeySearchEngine().recover(derive_payload("zebra", "k2", 32), {"k1", "k2"}, {"lion", "zebra"});

  ASSERT_EQ(ranked.size(), 2);
  EXPECT_EQ(ranked[0].key, "k2");
  EXPECT_EQ(ranked[0].message, "zebra");
  EXPECT_EQ(ranked[1].key, "k1");
  EXPECT_DOUBLE_EQ(ranked[1].confidence, 0.5625);
}

TEST(KeySearchTest, FallsBackToKeyOnlyPayload) {
  std::string bits = derive_payload("", "k9", 16);
  ASSERT_EQ(bits, "1100001111001000");

  std::vector<KeyCandidate> ranked = KeySearchEngine().recover(bits, {"a", "k9", "d"}, {"nomatch"});

  ASSERT_EQ(ranked.size(), 2);
  EXPECT_EQ(ranked[0].key, "k9");
  EXPECT_EQ(ranked[0].message, KeySearchEngine::possible_key_note);
  EXPECT_DOUBLE_EQ(ranked[0].confidence, 1.0);
  EXPECT_FALSE(ranked[0].message_recovered);
  EXPECT_EQ(ranked[1].key, "d");
  EXPECT_DOUBLE_EQ(ranked[1].confidence, 0.625);
}

TEST(KeySearchTest, FailingKeyIsSkipped) {
  std::vector<KeyCandidate> ranked = FixedPayloadEngine().recover("1111", {"bad", "exact"}, {"m"});

  ASSERT_EQ(ranked.size(), 1);
  EXPECT_EQ(ranked[0].key, "exact");
  EXPECT_EQ(ranked[0].message, "m");
  EXPECT_TRUE(ranked[0].message_recovered);
}

TEST(KeySearchTest, TiesKeepKeyOrder) {
  std::vector<KeyCandidate> ranked = FixedPayloadEngine().recover("1111", {"t2", "bad", "t1", "exact", "t3"}, {"m"});

  ASSERT_EQ(ranked.size(), 4);
  EXPECT_EQ(ranked[0].key, "exact");
  EXPECT_DOUBLE_EQ(ranked[0].confidence, 1.0);
  EXPECT_EQ(ranked[1].key, "t2");
  EXPECT_EQ(ranked[2].key, "t1");
  EXPECT_EQ(ranked[3].key, "t3");
  for (size_t i = 1; i < ranked.size(); ++i) {
    EXPECT_DOUBLE_EQ(ranked[i].confidence, 0.75);
    EXPECT_FALSE(ranked[i].message_recovered);
  }
}
