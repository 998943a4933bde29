#pragma once

#include "private/ast.hpp"
#include "private/unicode.hpp"
#include "regexp/regexp.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <variant>
#include <vector>

namespace regexp {
namespace instruction {
// Consuming instructions
struct Char {
  Codepoint unit;
};

struct AnyExceptNewline {};

struct AnyUnit {};

struct Class {
  // Sorted, non-overlapping and non-adjacent
  std::vector<ast::Range> ranges;

  constexpr auto contains(Codepoint unit) const -> bool {
    auto iter = std::upper_bound(
        ranges.begin(), ranges.end(), unit,
        [](Codepoint lhs, ast::Range const &rhs) { return lhs < rhs.lower; });
    if (iter == ranges.begin()) {
      return false;
    }
    return unit <= std::prev(iter)->upper;
  }
};

// Control flow, resolved while building a thread's epsilon closure
struct Split {
  size_t primary; // tried first
  size_t secondary;
};

struct Jump {
  size_t target;
};

// Stores the current position in a register. Capture group `n` owns
// registers 2n (start) and 2n + 1 (end).
struct Save {
  uint32_t index;
};

// Remembers where a repetition iteration began. Loops that are open at the
// same time use distinct registers, one per nesting level.
struct MarkProgress {
  uint32_t index;
};

// End of an iteration of a repetition whose body may match the empty string.
// An iteration that consumed nothing leaves the loop, otherwise the thread
// forks between another iteration and the exit.
struct RepeatProgress {
  uint32_t index;
  size_t loop;
  size_t exit;
  bool is_greedy;
};

struct Assert {
  ast::Assertion::Kind kind;
};

struct Match {};
} // namespace instruction

using Instruction =
    std::variant<instruction::Char, instruction::AnyExceptNewline,
                 instruction::AnyUnit, instruction::Class, instruction::Split,
                 instruction::Jump, instruction::Save,
                 instruction::MarkProgress, instruction::RepeatProgress,
                 instruction::Assert, instruction::Match>;

struct Program {
  std::vector<Instruction> instructions;
  // Number of progress-checked loops enclosing each instruction
  std::vector<uint32_t> loop_depths;
  GroupTable groups;
  size_t progress_registers = 0;
  bool is_utf = false;
  bool is_multiline = false;

  auto progress_base() const -> size_t { return 2 * groups.slot_count(); }

  auto register_count() const -> size_t {
    return progress_base() + progress_registers;
  }

  // Per-match state: registers for every thread plus the closure's visited
  // marks, which are keyed by instruction and loop level.
  auto state_size() const -> size_t {
    return instructions.size() * (register_count() + progress_registers + 1);
  }
};
} // namespace regexp
