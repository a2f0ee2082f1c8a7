// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_RUNTIME_SERIALIZER_HPP
#define PROSAIC_RUNTIME_SERIALIZER_HPP

#include <string>
#include <string_view>
#include <vector>

namespace prosaic {
namespace runtime {

using SerializerFn = std::string (*)(const std::vector<std::string>&);

inline std::string SimpleSpaceSerializer(const std::vector<std::string>& words) {
  std::string src;
  for (const std::string& word : words) {
    if (word.empty()) {
      continue;
    }
    if (!src.empty()) {
      src += " ";
    }
    src += word;
  }
  return src;
}

// Punctuation tokens stick to the preceding word.
inline std::string ProseSerializer(const std::vector<std::string>& words) {
  static constexpr std::string_view punctuation = ".,;:!?";
  std::string src;
  for (const std::string& word : words) {
    if (word.empty()) {
      continue;
    }
    bool attach = word.find_first_not_of(punctuation) == std::string::npos;
    if (!src.empty() && !attach) {
      src += " ";
    }
    src += word;
  }
  return src;
}

// Appends a full stop unless the text already ends in . ? ! or :
inline std::string terminate_sentence(std::string text) {
  if (text.empty() || std::string_view(".?!:").find(text.back()) == std::string_view::npos) {
    text += ".";
  }
  return text;
}

} // namespace runtime
} // namespace prosaic

#endif // PROSAIC_RUNTIME_SERIALIZER_HPP
