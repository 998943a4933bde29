#pragma once

#include "regexp/error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace regexp {
struct Codepoint {
  unsigned value;

  constexpr auto operator==(Codepoint const &) const -> bool = default;
  constexpr auto operator<=>(Codepoint const &) const = default;
};

constexpr unsigned max_byte_unit = 0xffU;
constexpr unsigned max_codepoint = 0x10ffffU;

constexpr auto is_continuation_byte(char c) -> bool {
  return (static_cast<uint8_t>(c) & 0xc0U) == 0x80U;
}

// Strict decoder: rejects truncated sequences, overlong encodings, surrogates
// and values above U+10FFFF.
constexpr auto decode_utf8_char(std::string_view text, size_t &size)
    -> std::optional<Codepoint> {
  size = 0;
  if (text.empty()) {
    return std::nullopt;
  }

  unsigned first_byte = static_cast<uint8_t>(text[0]);
  size_t length;
  unsigned value;
  unsigned minimum;
  if ((first_byte & 0x80U) == 0U) {
    size = 1;
    return Codepoint{first_byte};
  } else if ((first_byte & 0xe0U) == 0xc0U) {
    length = 2;
    value = first_byte & 0x1fU;
    minimum = 0x80U;
  } else if ((first_byte & 0xf0U) == 0xe0U) {
    length = 3;
    value = first_byte & 0x0fU;
    minimum = 0x800U;
  } else if ((first_byte & 0xf8U) == 0xf0U) {
    length = 4;
    value = first_byte & 0x07U;
    minimum = 0x10000U;
  } else {
    return std::nullopt;
  }

  if (text.size() < length) {
    return std::nullopt;
  }
  for (size_t i = 1; i < length; i += 1) {
    if (not is_continuation_byte(text[i])) {
      return std::nullopt;
    }
    value = (value << 6U) | (static_cast<uint8_t>(text[i]) & 0x3fU);
  }

  if (value < minimum || value > max_codepoint ||
      (0xd800U <= value && value <= 0xdfffU)) {
    return std::nullopt;
  }
  size = length;
  return Codepoint{value};
}

// Only valid on text that already passed `find_invalid_utf8`.
constexpr auto parse_utf8_char(std::string_view text, size_t &size)
    -> Codepoint {
  unsigned first_byte = static_cast<uint8_t>(text[0]);
  if ((first_byte & 0x80U) == 0U) [[likely]] {
    size = 1;
    return {first_byte};
  }

  auto continuation = [&](size_t i) -> unsigned {
    return static_cast<uint8_t>(text[i]) & 0x3fU;
  };
  if ((first_byte & 0xe0U) == 0xc0U) {
    size = 2;
    return {((first_byte & 0x1fU) << 6U) | continuation(1)};
  }
  if ((first_byte & 0xf0U) == 0xe0U) {
    size = 3;
    return {((first_byte & 0x0fU) << 12U) | (continuation(1) << 6U) |
            continuation(2)};
  }
  size = 4;
  return {((first_byte & 0x07U) << 18U) | (continuation(1) << 12U) |
          (continuation(2) << 6U) | continuation(3)};
}

constexpr auto find_invalid_utf8(std::string_view text)
    -> std::optional<size_t> {
  size_t offset = 0;
  while (offset < text.size()) {
    size_t size;
    if (not decode_utf8_char(text.substr(offset), size)) {
      return offset;
    }
    offset += size;
  }
  return std::nullopt;
}

constexpr auto codepoint_to_utf8(std::string &output, Codepoint codepoint)
    -> void {
  if (codepoint.value <= 0x7f) [[likely]] {
    output.push_back(static_cast<char>(codepoint.value));
    return;
  }

  if (codepoint.value <= 0x07ff) {
    output.push_back(static_cast<char>(0xc0 | ((codepoint.value >> 6) & 0x1f)));
    output.push_back(static_cast<char>(0x80 | (codepoint.value & 0x3f)));
    return;
  }

  if (codepoint.value <= 0xd7ff ||
      (0xe000 <= codepoint.value && codepoint.value <= 0xffff)) {
    output.push_back(
        static_cast<char>(0xe0 | ((codepoint.value >> 12) & 0x0f)));
    output.push_back(static_cast<char>(0x80 | ((codepoint.value >> 6) & 0x3f)));
    output.push_back(static_cast<char>(0x80 | (codepoint.value & 0x3f)));
    return;
  }

  if (0x10000 <= codepoint.value && codepoint.value <= max_codepoint) {
    output.push_back(
        static_cast<char>(0xf0 | ((codepoint.value >> 18) & 0x07)));
    output.push_back(
        static_cast<char>(0x80 | ((codepoint.value >> 12) & 0x3f)));
    output.push_back(static_cast<char>(0x80 | ((codepoint.value >> 6) & 0x3f)));
    output.push_back(static_cast<char>(0x80 | (codepoint.value & 0x3f)));
    return;
  }

  throw ArgumentError("Cannot encode invalid codepoint " +
                      std::to_string(codepoint.value));
}
} // namespace regexp
