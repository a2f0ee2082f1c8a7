// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <prosaic/runtime/Payload.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace prosaic::runtime;

TEST(PayloadTest, Sha256KnownDigest) {
  EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(PayloadTest, HexToBinaryStripsLeadingZeros) {
  EXPECT_EQ(hex_to_binary("018c"), "110001100");
  EXPECT_EQ(hex_to_binary("F"), "1111");
  EXPECT_EQ(hex_to_binary("000"), "0");
}

TEST(PayloadTest, HashesConcatenationOfMessageAndKey) {
  EXPECT_EQ(derive_payload("abc", "", 16), "1011101001111000");
  EXPECT_EQ(derive_payload("ab", "c", 16), derive_payload("abc", "", 16));
  EXPECT_EQ(derive_payload("", "", 8), "11100011");
}

TEST(PayloadTest, ShortPrefixes) {
  EXPECT_EQ(derive_payload("hi", "k1", 2), "11");
  EXPECT_EQ(derive_payload("hi", "k1", 8), "11101001");
  EXPECT_EQ(derive_payload("hi", "k1").substr(0, 8), "11101001");
}

TEST(PayloadTest, LeadingZeroNibbleIsDropped) {
  // The digest of "m7" starts with 0x01, so the payload starts at its first set bit
  EXPECT_EQ(derive_payload("m7", "", 12), "110001100001");
}

TEST(PayloadTest, PadsBeyondDigestLength) {
  std::string payload = derive_payload("x", "y", 300);

  ASSERT_EQ(payload.size(), 300);
  EXPECT_EQ(payload.substr(0, 8), "00000000");
  EXPECT_EQ(payload.find_first_not_of("01"), std::string::npos);
}

TEST(PayloadTest, DeterministicWithExactLength) {
  EXPECT_EQ(derive_payload("hello", "k2"), derive_payload("hello", "k2"));
  EXPECT_NE(derive_payload("hello", "k2"), derive_payload("hello", "k3"));
  EXPECT_EQ(derive_payload("hello", "k2").size(), default_payload_bits);
  EXPECT_EQ(derive_payload("hello", "k2", 0), "");
}
