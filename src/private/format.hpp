#pragma once

#include <sstream>
#include <string>

namespace regexp {
// Streams every argument into one string. Stands in for std::format, which
// the supported standard libraries do not all ship yet.
template <typename... Args>
auto format_message(Args const &...args) -> std::string {
  std::ostringstream message;
  (message << ... << args);
  return message.str();
}
} // namespace regexp
