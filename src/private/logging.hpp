#pragma once

// Compile-time levelled logging. REGEXP_LOG_LEVEL selects the most verbose
// level that is still emitted (0 disables logging, 5 is debug). Disabled
// statements are discarded at compile time.
//
//   REGEXP_LOG(warn, "group ", name, " is unset");
//
// prints `>> WARN [L42 @ collect_named]: group key is unset` to stderr.

#include <iostream>
#include <string_view>

#if !defined(REGEXP_LOG_LEVEL)
#define REGEXP_LOG_LEVEL 0
#endif

#if !defined(REGEXP_LOG_USE_COLORS)
#define REGEXP_LOG_USE_COLORS 1
#endif

namespace regexp::logging {
enum class Level {
  crit = 1,
  err = 2,
  warn = 3,
  info = 4,
  debug = 5,
};

constexpr auto is_enabled(Level level) -> bool {
  return static_cast<int>(level) <= REGEXP_LOG_LEVEL;
}

constexpr auto level_name(Level level) -> std::string_view {
  switch (level) {
  case Level::crit:
    return "CRITICAL";
  case Level::err:
    return "ERROR";
  case Level::warn:
    return "WARN";
  case Level::info:
    return "INFO";
  case Level::debug:
    return "DEBUG";
  }
  return "<UNKNOWN>";
}

constexpr auto level_color(Level level) -> std::string_view {
  switch (level) {
  case Level::crit:
    return "\033[0;91m"; // light red
  case Level::err:
    return "\033[0;31m"; // red
  case Level::warn:
    return "\033[0;33m"; // yellow
  case Level::info:
    return "\033[0;94m"; // light blue
  case Level::debug:
    return "\033[0;32m"; // green
  }
  return "";
}

template <typename... Args>
auto write(Level level, long line, std::string_view function,
           Args const &...args) -> void {
  auto &out = std::cerr;
  if constexpr (REGEXP_LOG_USE_COLORS != 0) {
    out << level_color(level);
  }
  out << ">> " << level_name(level) << " [L" << line << " @ " << function
      << "]: ";
  (out << ... << args);
  if constexpr (REGEXP_LOG_USE_COLORS != 0) {
    out << "\033[0m";
  }
  out << '\n';
}
} // namespace regexp::logging

#define REGEXP_LOG(level, ...)                                                 \
  do {                                                                         \
    if constexpr (::regexp::logging::is_enabled(                               \
                      ::regexp::logging::Level::level)) {                      \
      ::regexp::logging::write(::regexp::logging::Level::level, __LINE__,      \
                               __func__, __VA_ARGS__);                         \
    }                                                                          \
  } while (false)
