// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_RUNTIME_PAYLOAD_HPP
#define PROSAIC_RUNTIME_PAYLOAD_HPP

#include <openssl/evp.h>

#include <format>
#include <memory>
#include <stdexcept>
#include <string>

namespace prosaic {
namespace runtime {

constexpr size_t default_payload_bits = 96;

inline std::string sha256_hex(const std::string& data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int size = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
      || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1
      || EVP_DigestFinal_ex(ctx.get(), digest, &size) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }

  std::string hex;
  for (unsigned int i = 0; i < size; ++i) {
    hex += std::format("{:02x}", digest[i]);
  }
  return hex;
}

// Binary notation of a hexadecimal number without leading zeros ("0" for zero).
inline std::string hex_to_binary(const std::string& hex) {
  std::string binary;
  for (char c : hex) {
    int nibble = std::stoi(std::string(1, c), nullptr, 16);
    for (int bit = 3; bit >= 0; --bit) {
      binary += (nibble >> bit) & 1 ? '1' : '0';
    }
  }
  size_t first = binary.find('1');
  return first == std::string::npos ? "0" : binary.substr(first);
}

/*
 * Fixed-length payload of a (message, key) pair: SHA-256 of message ++ key read
 * as an unsigned integer, written in binary, left-padded with zeros to at
 * least bits characters and cut to exactly bits characters.
 */
inline std::string derive_payload(const std::string& message, const std::string& key, size_t bits = default_payload_bits) {
  std::string binary = hex_to_binary(sha256_hex(message + key));
  if (binary.size() < bits) {
    binary.insert(0, bits - binary.size(), '0');
  }
  return binary.substr(0, bits);
}

} // namespace runtime
} // namespace prosaic

#endif // PROSAIC_RUNTIME_PAYLOAD_HPP
