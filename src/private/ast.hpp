#pragma once

#include "private/unicode.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace regexp::ast {
// A unit is a byte, or a code point when the pattern is compiled with RE_UTF.
struct Range {
  Codepoint lower;
  Codepoint upper;

  constexpr auto operator==(Range const &) const -> bool = default;
};

// \d, \s, \w and their complements
struct PerlClass {
  enum class Kind { digit, space, word };

  Kind kind;
  bool is_complement;

  constexpr auto operator==(PerlClass const &) const -> bool = default;
};

struct Node;

struct Literal {
  std::vector<Codepoint> units;
};

struct Any {};

struct CharacterClass {
  using Item = std::variant<Range, PerlClass>;

  std::vector<Item> items;
  bool is_complement;
};

struct Assertion {
  enum class Kind { line_start, line_end };

  Kind kind;
};

struct Concatenation {
  std::vector<Node> nodes;
};

struct Alternation {
  std::vector<Node> alternatives;
};

struct Repetition {
  std::unique_ptr<Node> node;
  unsigned lower;
  std::optional<unsigned> upper; // nullopt is unbounded
  bool is_greedy;
};

struct Group {
  std::unique_ptr<Node> node;
  std::optional<std::string> name;
  bool is_capturing;
};

struct Node {
  using NodeVariant =
      std::variant<Literal, Any, CharacterClass, Assertion, Concatenation,
                   Alternation, Repetition, Group>;

  NodeVariant type;
  size_t offset; // byte offset into the pattern
};

struct Ast {
  Node root;
  bool is_utf;
};
} // namespace regexp::ast
