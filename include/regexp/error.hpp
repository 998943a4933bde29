#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace regexp {
enum class ErrorKind {
  syntax,
  encoding,
  unknown_group,
  bad_argument,
};

auto to_string(ErrorKind) -> std::string_view;

class RegExpError : public std::runtime_error {
  ErrorKind m_kind;

public:
  RegExpError(ErrorKind kind, std::string const &message)
      : std::runtime_error(message), m_kind{kind} {}

  auto kind() const -> ErrorKind { return m_kind; }
};

// Malformed pattern. The offset is the byte offset into the pattern.
class SyntaxError : public RegExpError {
  size_t m_offset;
  std::string m_reason;

public:
  SyntaxError(std::string_view pattern, size_t offset, std::string reason);

  auto offset() const -> size_t { return m_offset; }
  auto reason() const -> std::string const & { return m_reason; }
};

// Invalid UTF-8 in either the pattern or the subject.
class EncodingError : public RegExpError {
  size_t m_offset;

public:
  EncodingError(std::string_view what, size_t offset);

  auto offset() const -> size_t { return m_offset; }
};

class UnknownGroupError : public RegExpError {
  std::string m_name;

public:
  explicit UnknownGroupError(std::string_view name);

  auto name() const -> std::string const & { return m_name; }
};

class ArgumentError : public RegExpError {
public:
  explicit ArgumentError(std::string const &message)
      : RegExpError(ErrorKind::bad_argument, message) {}
};
} // namespace regexp
