#include "private/parser.hpp"

#include "private/ast.hpp"
#include "private/logging.hpp"
#include "private/unicode.hpp"
#include "regexp/error.hpp"
#include "regexp/regexp.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

using namespace regexp;
using namespace regexp::ast;

namespace {
struct Cursor {
  std::string_view text;
  size_t offset;
  bool is_utf;

  [[noreturn]] auto fail(std::string reason) const -> void {
    fail_at(offset, std::move(reason));
  }

  [[noreturn]] auto fail_at(size_t at, std::string reason) const -> void {
    throw SyntaxError(text, at, std::move(reason));
  }

  constexpr auto is_at_end() const -> bool { return offset >= text.size(); }

  constexpr auto peek() const -> char { return text[offset]; }

  constexpr auto eat_next() -> void { offset += 1; }

  auto eat_or_throw(char to_eat, std::string_view reason) -> void {
    if (not try_eat(to_eat)) {
      fail(std::string{reason});
    }
  }

  constexpr auto try_eat(char to_eat) -> bool {
    if (is_next(to_eat)) {
      eat_next();
      return true;
    }
    return false;
  }

  constexpr auto is_next(char test_char) const -> bool {
    if (offset >= text.size()) {
      return false;
    }
    return peek() == test_char;
  }

  constexpr auto is_next_or_end(char test_char) const -> bool {
    if (offset >= text.size()) {
      return true;
    }
    return peek() == test_char;
  }

  // The pattern was validated up front, so decoding cannot fail here.
  auto eat_unit() -> Codepoint {
    if (not is_utf) {
      return Codepoint{static_cast<uint8_t>(text[offset++])};
    }
    size_t size;
    auto codepoint = parse_utf8_char(text.substr(offset), size);
    offset += size;
    return codepoint;
  }
};

struct ParseState {
  Cursor cursor;
  unsigned long flags;
  std::set<std::string, std::less<>> group_names;
  unsigned depth = 0;
};

constexpr auto is_quantifier_char(char c) -> bool {
  return c == '*' || c == '+' || c == '?' || c == '{';
}

constexpr auto is_ascii_alnum(char c) -> bool {
  return ('0' <= c && c <= '9') || ('a' <= c && c <= 'z') ||
         ('A' <= c && c <= 'Z');
}

constexpr auto is_name_start(char c) -> bool {
  return c == '_' || ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z');
}

constexpr auto is_name_char(char c) -> bool {
  return is_name_start(c) || ('0' <= c && c <= '9');
}

constexpr auto hex_value(char c) -> int {
  if ('0' <= c && c <= '9') {
    return c - '0';
  }
  if ('a' <= c && c <= 'f') {
    return c - 'a' + 10;
  }
  if ('A' <= c && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

auto parse_number(Cursor &cursor) -> unsigned {
  size_t start = cursor.offset;
  unsigned long result = 0;
  while (not cursor.is_at_end() && '0' <= cursor.peek() &&
         cursor.peek() <= '9') {
    result = result * 10 + static_cast<unsigned>(cursor.peek() - '0');
    if (result > max_repeat_count) {
      cursor.fail_at(start, "number too big in {} quantifier");
    }
    cursor.eat_next();
  }

  if (cursor.offset == start) {
    cursor.fail("expected number in {} quantifier");
  }
  return static_cast<unsigned>(result);
}

auto parse_regex(ParseState &state) -> Node;

auto parse_escape(Cursor &cursor) -> std::variant<Codepoint, PerlClass> {
  size_t escape_offset = cursor.offset;
  cursor.eat_next(); // '\'
  if (cursor.is_at_end()) {
    cursor.fail_at(escape_offset, "pattern ends with a trailing backslash");
  }

  char next_char = cursor.peek();
  if (not is_ascii_alnum(next_char)) {
    // Escaped punctuation (or any non-ASCII unit) stands for itself
    return cursor.eat_unit();
  }

  cursor.eat_next();
  switch (next_char) {
  default:
    cursor.fail_at(escape_offset, "unrecognized character follows \\");

  // Special characters
  case 'n':
    return Codepoint{'\n'};
  case 'r':
    return Codepoint{'\r'};
  case 't':
    return Codepoint{'\t'};
  case 'f':
    return Codepoint{'\f'};
  case 'v':
    return Codepoint{'\v'};
  case '0':
    return Codepoint{0};
  case 'x': {
    if (cursor.offset + 2 > cursor.text.size()) {
      cursor.fail_at(escape_offset, "\\x must be followed by two hex digits");
    }
    int high = hex_value(cursor.text[cursor.offset]);
    int low = hex_value(cursor.text[cursor.offset + 1]);
    if (high < 0 || low < 0) {
      cursor.fail_at(escape_offset, "\\x must be followed by two hex digits");
    }
    cursor.offset += 2;
    return Codepoint{static_cast<unsigned>(high * 16 + low)};
  }

  // Classes
  case 'd':
  case 'D':
    return PerlClass{PerlClass::Kind::digit, next_char == 'D'};
  case 's':
  case 'S':
    return PerlClass{PerlClass::Kind::space, next_char == 'S'};
  case 'w':
  case 'W':
    return PerlClass{PerlClass::Kind::word, next_char == 'W'};
  }
}

auto parse_class_unit(Cursor &cursor) -> std::variant<Codepoint, PerlClass> {
  if (cursor.is_next('\\')) {
    return parse_escape(cursor);
  }
  return cursor.eat_unit();
}

auto parse_character_class_expression(Cursor &cursor) -> CharacterClass {
  CharacterClass result;
  size_t class_offset = cursor.offset;
  cursor.eat_next(); // '['

  result.is_complement = cursor.try_eat('^');

  // A ']' right after the opening bracket is a literal
  if (cursor.try_eat(']')) {
    result.items.push_back(Range{Codepoint{']'}, Codepoint{']'}});
  }

  while (not cursor.is_next(']')) {
    if (cursor.is_at_end()) {
      cursor.fail_at(class_offset, "missing terminating ] for character class");
    }

    size_t item_offset = cursor.offset;
    auto lower = parse_class_unit(cursor);
    if (std::holds_alternative<PerlClass>(lower)) {
      result.items.push_back(std::get<PerlClass>(lower));
      continue;
    }

    // A '-' is only a range operator when something other than ']' follows
    bool is_range = cursor.offset + 1 < cursor.text.size() &&
                    cursor.peek() == '-' &&
                    cursor.text[cursor.offset + 1] != ']';
    if (not is_range) {
      auto codepoint = std::get<Codepoint>(lower);
      result.items.push_back(Range{codepoint, codepoint});
      continue;
    }

    cursor.eat_next(); // '-'
    auto upper = parse_class_unit(cursor);
    if (std::holds_alternative<PerlClass>(upper)) {
      cursor.fail_at(item_offset, "invalid range in character class");
    }

    auto range = Range{std::get<Codepoint>(lower), std::get<Codepoint>(upper)};
    if (range.upper < range.lower) {
      cursor.fail_at(item_offset, "range out of order in character class");
    }
    result.items.push_back(range);
  }

  cursor.eat_next(); // ']'
  return result;
}

auto parse_group_name(Cursor &cursor) -> std::string {
  size_t name_offset = cursor.offset;
  if (cursor.is_at_end() || not is_name_start(cursor.peek())) {
    cursor.fail_at(name_offset, "group name must start with a letter or "
                                "underscore");
  }
  while (not cursor.is_at_end() && is_name_char(cursor.peek())) {
    cursor.eat_next();
  }
  auto name =
      std::string{cursor.text.substr(name_offset, cursor.offset - name_offset)};
  cursor.eat_or_throw('>', "syntax error in group name: missing terminator");
  return name;
}

auto parse_group(ParseState &state) -> Node {
  auto &cursor = state.cursor;
  size_t group_offset = cursor.offset;
  cursor.eat_next(); // '('

  if (state.depth >= max_group_nesting) {
    cursor.fail_at(group_offset, "parentheses are too deeply nested");
  }

  Group group;
  group.is_capturing = (state.flags & RE_NO_AUTO_CAPTURE) == 0;

  if (cursor.try_eat('?')) {
    // Only named groups are supported: (?P<name>...)
    size_t introducer_offset = cursor.offset;
    if (not(cursor.try_eat('P') && cursor.try_eat('<'))) {
      cursor.fail_at(introducer_offset, "unknown group syntax");
    }

    size_t name_offset = cursor.offset;
    auto name = parse_group_name(cursor);
    if (not state.group_names.insert(name).second) {
      cursor.fail_at(name_offset, "two named subpatterns have the same name");
    }
    group.name = std::move(name);
    group.is_capturing = true;
  }

  state.depth += 1;
  group.node = std::make_unique<Node>(parse_regex(state));
  state.depth -= 1;

  if (not cursor.try_eat(')')) {
    cursor.fail_at(group_offset, "missing closing parenthesis");
  }
  return {std::move(group), group_offset};
}

auto parse_atom(ParseState &state) -> Node {
  auto &cursor = state.cursor;
  size_t atom_offset = cursor.offset;

  switch (cursor.peek()) {
  case '(':
    return parse_group(state);
  case '[':
    return {parse_character_class_expression(cursor), atom_offset};
  case '.':
    cursor.eat_next();
    return {Any{}, atom_offset};
  case '^':
    cursor.eat_next();
    return {Assertion{Assertion::Kind::line_start}, atom_offset};
  case '$':
    cursor.eat_next();
    return {Assertion{Assertion::Kind::line_end}, atom_offset};
  case '*':
  case '+':
  case '?':
  case '{':
    cursor.fail("quantifier does not follow a repeatable item");
  case '\\': {
    auto escaped = parse_escape(cursor);
    if (std::holds_alternative<PerlClass>(escaped)) {
      CharacterClass character_class;
      character_class.items.push_back(std::get<PerlClass>(escaped));
      character_class.is_complement = false;
      return {std::move(character_class), atom_offset};
    }
    return {Literal{{std::get<Codepoint>(escaped)}}, atom_offset};
  }
  default:
    return {Literal{{cursor.eat_unit()}}, atom_offset};
  }
}

struct Quantifier {
  unsigned lower;
  std::optional<unsigned> upper;
};

auto parse_quantifier(Cursor &cursor) -> std::optional<Quantifier> {
  if (cursor.is_at_end()) {
    return std::nullopt;
  }
  switch (cursor.peek()) {
  default:
    return std::nullopt;
  case '*':
    cursor.eat_next();
    return Quantifier{0, std::nullopt};
  case '+':
    cursor.eat_next();
    return Quantifier{1, std::nullopt};
  case '?':
    cursor.eat_next();
    return Quantifier{0, 1};
  case '{':
    break;
  }

  // We're parsing a numeric quantifier (either range or count)
  size_t quantifier_offset = cursor.offset;
  cursor.eat_next();

  unsigned first_number = parse_number(cursor);
  if (not cursor.try_eat(',')) {
    // Count quantifier
    cursor.eat_or_throw('}', "missing } in quantifier");
    return Quantifier{first_number, first_number};
  }

  if (cursor.try_eat('}')) {
    return Quantifier{first_number, std::nullopt};
  }

  // Range quantifier
  unsigned second_number = parse_number(cursor);
  cursor.eat_or_throw('}', "missing } in quantifier");
  if (second_number < first_number) {
    cursor.fail_at(quantifier_offset,
                   "numbers out of order in {} quantifier");
  }
  return Quantifier{first_number, second_number};
}

auto parse_piece(ParseState &state) -> Node {
  auto &cursor = state.cursor;
  auto atom = parse_atom(state);

  size_t quantifier_offset = cursor.offset;
  auto quantifier = parse_quantifier(cursor);
  if (not quantifier) {
    return atom;
  }

  if (std::holds_alternative<Assertion>(atom.type)) {
    cursor.fail_at(quantifier_offset,
                   "quantifier does not follow a repeatable item");
  }

  bool is_greedy = (state.flags & RE_UNGREEDY) == 0;
  if (cursor.try_eat('?')) {
    is_greedy = not is_greedy;
  }

  if (not cursor.is_at_end() && is_quantifier_char(cursor.peek())) {
    cursor.fail("quantifier does not follow a repeatable item");
  }

  size_t atom_offset = atom.offset;
  return {Repetition{
              .node = std::make_unique<Node>(std::move(atom)),
              .lower = quantifier->lower,
              .upper = quantifier->upper,
              .is_greedy = is_greedy,
          },
          atom_offset};
}

auto parse_branch(ParseState &state) -> Node {
  auto &cursor = state.cursor;
  Concatenation result;
  size_t branch_offset = cursor.offset;

  while (not(cursor.is_next_or_end('|') || cursor.is_next_or_end(')'))) {
    auto piece = parse_piece(state);

    // Merge runs of literal units
    if (std::holds_alternative<Literal>(piece.type) &&
        not result.nodes.empty() &&
        std::holds_alternative<Literal>(result.nodes.back().type)) {
      auto &previous = std::get<Literal>(result.nodes.back().type).units;
      for (auto unit : std::get<Literal>(piece.type).units) {
        previous.push_back(unit);
      }
      continue;
    }
    result.nodes.push_back(std::move(piece));
  }

  if (result.nodes.size() == 1) {
    return std::move(result.nodes.front());
  }
  return {std::move(result), branch_offset};
}

auto parse_regex(ParseState &state) -> Node {
  size_t regex_offset = state.cursor.offset;
  Alternation result;
  do {
    result.alternatives.push_back(parse_branch(state));
  } while (state.cursor.try_eat('|'));

  if (result.alternatives.size() == 1) {
    return std::move(result.alternatives.front());
  }
  return {std::move(result), regex_offset};
}
} // namespace

auto regexp::parse(std::string_view pattern, unsigned long flags) -> Ast {
  bool is_utf = (flags & RE_UTF) != 0;
  if (is_utf) {
    if (auto bad_offset = find_invalid_utf8(pattern)) {
      REGEXP_LOG(err, "Invalid UTF-8 in pattern at offset ", *bad_offset);
      throw EncodingError("pattern", *bad_offset);
    }
  }

  ParseState state{
      .cursor = Cursor{.text = pattern, .offset = 0, .is_utf = is_utf},
      .flags = flags,
      .group_names = {},
  };
  auto root = parse_regex(state);

  // parse_regex only stops early on an unbalanced ')'
  if (not state.cursor.is_at_end()) {
    state.cursor.fail("unmatched closing parenthesis");
  }

  REGEXP_LOG(debug, "Parsed pattern of ", pattern.size(), " bytes with ",
             state.group_names.size(), " named groups");
  return {.root = std::move(root), .is_utf = is_utf};
}
