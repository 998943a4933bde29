#include "regexp/error.hpp"

#include "private/format.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

using namespace regexp;

namespace {
constexpr size_t context_length = 12;

auto describe_syntax_error(std::string_view pattern, size_t offset,
                           std::string const &reason) -> std::string {
  if (offset < pattern.size()) {
    return format_message(reason, " at offset ", offset, " near \"",
                          pattern.substr(offset, context_length), "\"");
  }
  return format_message(reason, " at offset ", offset, " (end of pattern)");
}
} // namespace

auto regexp::to_string(ErrorKind kind) -> std::string_view {
  switch (kind) {
  case ErrorKind::syntax:
    return "syntax error";
  case ErrorKind::encoding:
    return "encoding error";
  case ErrorKind::unknown_group:
    return "unknown group";
  case ErrorKind::bad_argument:
    return "bad argument";
  }
  return "unknown error";
}

SyntaxError::SyntaxError(std::string_view pattern, size_t offset,
                         std::string reason)
    : RegExpError(ErrorKind::syntax,
                  describe_syntax_error(pattern, offset, reason)),
      m_offset{offset}, m_reason{std::move(reason)} {}

EncodingError::EncodingError(std::string_view what, size_t offset)
    : RegExpError(ErrorKind::encoding,
                  format_message("invalid UTF-8 in ", what, " at offset ",
                                 offset)),
      m_offset{offset} {}

UnknownGroupError::UnknownGroupError(std::string_view name)
    : RegExpError(ErrorKind::unknown_group,
                  format_message("no group named \"", name, "\"")),
      m_name{name} {}
