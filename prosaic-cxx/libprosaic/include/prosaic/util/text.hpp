// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_UTIL_TEXT_HPP
#define PROSAIC_UTIL_TEXT_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace prosaic {
namespace util {

// Trim from both ends (in place)
inline void trim(std::string& s) {
  auto not_space = [](unsigned char c) { return !std::isspace(c); };

  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

inline std::string trimmed(std::string s) {
  trim(s);
  return s;
}

inline std::string to_lower(std::string_view s) {
  std::string result(s);
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return std::tolower(c); });
  return result;
}

inline std::string join(const std::string& delim, const std::vector<std::string>& parts) {
  std::string result;
  for (const auto& part : parts) {
    if (!result.empty()) {
      result += delim;
    }
    result += part;
  }
  return result;
}

inline bool is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Case-insensitive search for needle delimited by word boundaries. The
// boundary is only required on a side where needle itself starts or ends with
// a word character.
inline size_t find_word(std::string_view haystack, std::string_view needle, size_t from = 0) {
  if (needle.empty() || haystack.size() < needle.size()) {
    return std::string_view::npos;
  }
  std::string hay = to_lower(haystack);
  std::string pat = to_lower(needle);
  bool open = is_word_char(pat.front());
  bool close = is_word_char(pat.back());
  for (size_t pos = hay.find(pat, from); pos != std::string::npos; pos = hay.find(pat, pos + 1)) {
    size_t end = pos + pat.size();
    if (open && pos > 0 && is_word_char(hay[pos - 1])) {
      continue;
    }
    if (close && end < hay.size() && is_word_char(hay[end])) {
      continue;
    }
    return pos;
  }
  return std::string_view::npos;
}

// Split on sentence terminators (. ! ?), dropping blank pieces.
inline std::vector<std::string> split_sentences(std::string_view text) {
  std::vector<std::string> sentences;
  std::string current;
  auto flush = [&]() {
    trim(current);
    if (!current.empty()) {
      sentences.push_back(current);
    }
    current.clear();
  };
  for (char c : text) {
    if (c == '.' || c == '!' || c == '?') {
      flush();
    } else {
      current += c;
    }
  }
  flush();
  return sentences;
}

} // namespace util
} // namespace prosaic

#endif  // PROSAIC_UTIL_TEXT_HPP
