// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_UTIL_LOG_HPP
#define PROSAIC_UTIL_LOG_HPP

#include <algorithm>
#include <cctype>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#define PROSAIC_LOG_LEVEL_OFF   0
#define PROSAIC_LOG_LEVEL_FATAL 1
#define PROSAIC_LOG_LEVEL_ERROR 2
#define PROSAIC_LOG_LEVEL_WARN  3
#define PROSAIC_LOG_LEVEL_INFO  4
#define PROSAIC_LOG_LEVEL_DEBUG 5
#define PROSAIC_LOG_LEVEL_TRACE 6

// Compile-time ceiling. Messages above it are compiled out entirely, the rest
// are filtered by the runtime threshold set with init_logging().
#ifndef PROSAIC_LOG_LEVEL
#define PROSAIC_LOG_LEVEL PROSAIC_LOG_LEVEL_TRACE
#endif

namespace prosaic {
namespace util {

inline int log_threshold = PROSAIC_LOG_LEVEL_WARN;

inline void init_logging(int level) {
  log_threshold = std::clamp(level, PROSAIC_LOG_LEVEL_OFF, PROSAIC_LOG_LEVEL_TRACE);
}

inline bool log_enabled(int level) {
  return level <= log_threshold;
}

inline std::optional<int> parse_log_level(std::string_view name) {
  static constexpr std::string_view names[] = {"off", "fatal", "error", "warn", "info", "debug", "trace"};
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
  for (int level = PROSAIC_LOG_LEVEL_OFF; level <= PROSAIC_LOG_LEVEL_TRACE; ++level) {
    if (lower == names[level]) {
      return level;
    }
  }
  return std::nullopt;
}

template<typename... Args>
void log(std::string_view fmt, Args&&... args) {
  std::string message;
  if constexpr (sizeof...(Args) == 0) {
    message = std::string(fmt);
  } else {
    message = std::vformat(fmt, std::make_format_args(args...));
  }
  std::clog << message << std::endl;
}

}  // namespace util
}  // namespace prosaic

#define PROSAIC_LOG_AT(LEVEL, TAG, FMT, ...) \
  do { \
    if (::prosaic::util::log_enabled(LEVEL)) { \
      ::prosaic::util::log(TAG " " FMT __VA_OPT__(, ) __VA_ARGS__); \
    } \
  } while (false)

#if PROSAIC_LOG_LEVEL >= PROSAIC_LOG_LEVEL_FATAL
#define PROSAIC_LOG_FATAL(FMT, ...) PROSAIC_LOG_AT(PROSAIC_LOG_LEVEL_FATAL, "\033[95m[F]\033[0m", FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define PROSAIC_LOG_FATAL(FMT, ...) do { } while (false)
#endif

#if PROSAIC_LOG_LEVEL >= PROSAIC_LOG_LEVEL_ERROR
#define PROSAIC_LOG_ERROR(FMT, ...) PROSAIC_LOG_AT(PROSAIC_LOG_LEVEL_ERROR, "\033[91m[E]\033[0m", FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define PROSAIC_LOG_ERROR(FMT, ...) do { } while (false)
#endif

#if PROSAIC_LOG_LEVEL >= PROSAIC_LOG_LEVEL_WARN
#define PROSAIC_LOG_WARN(FMT, ...) PROSAIC_LOG_AT(PROSAIC_LOG_LEVEL_WARN, "\033[93m[W]\033[0m", FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define PROSAIC_LOG_WARN(FMT, ...) do { } while (false)
#endif

#if PROSAIC_LOG_LEVEL >= PROSAIC_LOG_LEVEL_INFO
#define PROSAIC_LOG_INFO(FMT, ...) PROSAIC_LOG_AT(PROSAIC_LOG_LEVEL_INFO, "\033[92m[I]\033[0m", FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define PROSAIC_LOG_INFO(FMT, ...) do { } while (false)
#endif

#if PROSAIC_LOG_LEVEL >= PROSAIC_LOG_LEVEL_DEBUG
#define PROSAIC_LOG_DEBUG(FMT, ...) PROSAIC_LOG_AT(PROSAIC_LOG_LEVEL_DEBUG, "\033[94m[D]\033[0m", FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define PROSAIC_LOG_DEBUG(FMT, ...) do { } while (false)
#endif

#if PROSAIC_LOG_LEVEL >= PROSAIC_LOG_LEVEL_TRACE
#define PROSAIC_LOG_TRACE(FMT, ...) PROSAIC_LOG_AT(PROSAIC_LOG_LEVEL_TRACE, "\033[96m[T]\033[0m", FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define PROSAIC_LOG_TRACE(FMT, ...) do { } while (false)
#endif

#endif  // PROSAIC_UTIL_LOG_HPP
