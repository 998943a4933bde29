#pragma once

#include "regexp/error.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace regexp {
// Compilation flags. The values are the matching PCRE2 option bits.
enum Flags : unsigned long {
  RE_CASELESS = 0x00000008UL,
  RE_DOTALL = 0x00000020UL,
  RE_MULTILINE = 0x00000400UL,
  RE_NO_AUTO_CAPTURE = 0x00002000UL,
  RE_UNGREEDY = 0x00040000UL,
  RE_UTF = 0x00080000UL,
};

constexpr unsigned long supported_flags = RE_CASELESS | RE_DOTALL |
                                          RE_MULTILINE | RE_NO_AUTO_CAPTURE |
                                          RE_UNGREEDY | RE_UTF;

struct MatchResult {
  struct Group {
    size_t start_index;
    size_t end_index;

    constexpr auto operator==(Group const &) const -> bool = default;
  };

  std::string_view text;
  // Slot 0 is the whole match, the rest follow the opening parentheses.
  std::vector<std::optional<Group>> groups;
  bool did_match = false;

  constexpr operator bool() const { return did_match; }

  auto group_text(size_t group) const -> std::optional<std::string_view>;
};

// Maps group names onto capture slots. Slot 0 (the whole match) is always
// present and never named.
class GroupTable {
  std::vector<std::pair<std::string, size_t>> m_names;
  size_t m_slot_count = 1;

public:
  auto add_group(std::optional<std::string_view> name) -> size_t;

  auto find(std::string_view name) const -> std::optional<size_t>;
  auto index_of(std::string_view name) const -> size_t;
  auto name_of(size_t slot) const -> std::optional<std::string_view>;

  auto slot_count() const -> size_t { return m_slot_count; }
  auto names() const -> std::vector<std::pair<std::string, size_t>> const & {
    return m_names;
  }

  auto operator==(GroupTable const &) const -> bool = default;
};

struct Program;
class RegExp {
  std::unique_ptr<Program const> m_program;
  std::string m_pattern;
  unsigned long m_flags;

  // Throws ArgumentError on a moved-from handle
  auto program() const -> Program const &;

public:
  explicit RegExp(std::string_view pattern, unsigned long flags = 0);

  RegExp(RegExp &&) noexcept;
  auto operator=(RegExp &&) noexcept -> RegExp &;
  ~RegExp();

  // Leftmost match starting at or after `start`.
  auto search(std::string_view text, size_t start = 0) const -> MatchResult;
  // Match beginning exactly at `offset`.
  auto match_at(std::string_view text, size_t offset) const -> MatchResult;
  // Match covering the whole of `text`.
  auto full_match(std::string_view text) const -> MatchResult;

  auto named_text(MatchResult const &, std::string_view name) const
      -> std::optional<std::string_view>;

  auto collect_named(std::string_view text, std::string_view name) const
      -> std::map<std::string, std::string>;
  auto collect_named(std::string_view text,
                     std::span<std::string_view const> names) const
      -> std::map<std::string, std::string>;

  auto group_table() const -> GroupTable const &;
  auto group_count() const -> size_t;
  auto pattern() const -> std::string const & { return m_pattern; }
  auto flags() const -> unsigned long { return m_flags; }

  auto disassemble(std::ostream &) const -> void;
};
} // namespace regexp
