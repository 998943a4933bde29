#include "private/compiler.hpp"

#include "private/ast.hpp"
#include "private/logging.hpp"
#include "private/meta.hpp"
#include "private/program.hpp"
#include "regexp/error.hpp"
#include "regexp/regexp.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

using namespace regexp;
using namespace regexp::ast;

namespace {
using SlotMap = std::unordered_map<Group const *, uint32_t>;

// Slots follow the opening parentheses: a pre-order, left-to-right walk.
auto assign_slots(Node const &node, GroupTable &table, SlotMap &slots)
    -> void {
  std::visit(meta::Overload{
                 [&](Group const &group) {
                   if (group.is_capturing) {
                     slots[&group] = static_cast<uint32_t>(
                         table.add_group(group.name));
                   }
                   assign_slots(*group.node, table, slots);
                 },
                 [&](Concatenation const &concatenation) {
                   for (auto const &child : concatenation.nodes) {
                     assign_slots(child, table, slots);
                   }
                 },
                 [&](Alternation const &alternation) {
                   for (auto const &child : alternation.alternatives) {
                     assign_slots(child, table, slots);
                   }
                 },
                 [&](Repetition const &repetition) {
                   assign_slots(*repetition.node, table, slots);
                 },
                 [](auto const &) {},
             },
             node.type);
}

auto can_be_empty(Node const &node) -> bool {
  return std::visit(
      meta::Overload{
          [](Literal const &literal) { return literal.units.empty(); },
          [](Any const &) { return false; },
          [](CharacterClass const &) { return false; },
          [](Assertion const &) { return true; },
          [](Concatenation const &concatenation) {
            return std::all_of(concatenation.nodes.begin(),
                               concatenation.nodes.end(), can_be_empty);
          },
          [](Alternation const &alternation) {
            return std::any_of(alternation.alternatives.begin(),
                               alternation.alternatives.end(), can_be_empty);
          },
          [](Repetition const &repetition) {
            return repetition.lower == 0 || can_be_empty(*repetition.node);
          },
          [](Group const &group) { return can_be_empty(*group.node); },
      },
      node.type);
}

constexpr auto range(unsigned lower, unsigned upper) -> Range {
  return {Codepoint{lower}, Codepoint{upper}};
}

auto perl_class_ranges(PerlClass::Kind kind) -> std::vector<Range> {
  switch (kind) {
  case PerlClass::Kind::digit:
    return {range('0', '9')};
  case PerlClass::Kind::space:
    // \t \n \v \f \r and ' '
    return {range('\t', '\r'), range(' ', ' ')};
  case PerlClass::Kind::word:
    return {range('0', '9'), range('A', 'Z'), range('_', '_'),
            range('a', 'z')};
  }
  return {};
}

auto normalize(std::vector<Range> ranges) -> std::vector<Range> {
  std::sort(ranges.begin(), ranges.end(),
            [](Range const &lhs, Range const &rhs) {
              return lhs.lower < rhs.lower;
            });

  std::vector<Range> result;
  for (auto const &next : ranges) {
    if (not result.empty() &&
        next.lower.value <= result.back().upper.value + 1) {
      result.back().upper = std::max(result.back().upper, next.upper);
      continue;
    }
    result.push_back(next);
  }
  return result;
}

// `ranges` must be normalized
auto complement(std::vector<Range> const &ranges, unsigned max_unit)
    -> std::vector<Range> {
  std::vector<Range> result;
  unsigned next_lower = 0;
  for (auto const &item : ranges) {
    if (item.lower.value > next_lower) {
      result.push_back(range(next_lower, item.lower.value - 1));
    }
    next_lower = item.upper.value + 1;
  }
  if (next_lower <= max_unit) {
    result.push_back(range(next_lower, max_unit));
  }
  return result;
}

auto add_ascii_case_folds(std::vector<Range> ranges) -> std::vector<Range> {
  size_t original_size = ranges.size();
  for (size_t i = 0; i < original_size; i += 1) {
    auto const item = ranges[i];
    auto fold = [&](unsigned first, unsigned last, int shift) {
      unsigned lower = std::max(item.lower.value, first);
      unsigned upper = std::min(item.upper.value, last);
      if (lower <= upper) {
        ranges.push_back(range(static_cast<unsigned>(int(lower) + shift),
                               static_cast<unsigned>(int(upper) + shift)));
      }
    };
    fold('a', 'z', 'A' - 'a');
    fold('A', 'Z', 'a' - 'A');
  }
  return normalize(std::move(ranges));
}

constexpr auto is_ascii_letter(Codepoint unit) -> bool {
  return ('a' <= unit.value && unit.value <= 'z') ||
         ('A' <= unit.value && unit.value <= 'Z');
}

struct Emitter {
  Program &program;
  SlotMap const &slots;
  std::string_view pattern;
  unsigned max_unit;
  bool is_caseless;
  bool is_dotall;
  uint32_t loop_depth = 0;

  auto next_index() const -> size_t { return program.instructions.size(); }

  auto emit(Instruction instruction, size_t pattern_offset) -> size_t {
    if (program.instructions.size() >= max_program_size) {
      throw SyntaxError(pattern, pattern_offset,
                        "compiled pattern is too large");
    }
    program.instructions.push_back(std::move(instruction));
    program.loop_depths.push_back(loop_depth);
    return program.instructions.size() - 1;
  }

  auto set_split(size_t at, size_t preferred, size_t other, bool is_greedy)
      -> void {
    auto &split = std::get<instruction::Split>(program.instructions[at]);
    split.primary = is_greedy ? preferred : other;
    split.secondary = is_greedy ? other : preferred;
  }

  // Sibling and unrolled loops are never open together, so the register is
  // picked by nesting level alone.
  auto progress_register() -> uint32_t {
    program.progress_registers =
        std::max<size_t>(program.progress_registers, loop_depth + 1);
    return static_cast<uint32_t>(program.progress_base() + loop_depth);
  }

  // The mark sits outside the loop, the body and its check inside.
  auto emit_progress_loop(Node const &body, bool is_greedy, size_t offset)
      -> void {
    size_t loop = next_index();
    auto index = progress_register();
    emit(instruction::MarkProgress{index}, offset);
    loop_depth += 1;
    emit_node(body);
    size_t check =
        emit(instruction::RepeatProgress{index, loop, 0, is_greedy}, offset);
    loop_depth -= 1;
    std::get<instruction::RepeatProgress>(program.instructions[check]).exit =
        next_index();
  }

  auto emit_unit(Codepoint unit, size_t offset) -> void {
    if (is_caseless && is_ascii_letter(unit)) {
      emit(instruction::Class{add_ascii_case_folds({Range{unit, unit}})},
           offset);
      return;
    }
    emit(instruction::Char{unit}, offset);
  }

  auto emit_class(CharacterClass const &character_class, size_t offset)
      -> void {
    std::vector<Range> ranges;
    for (auto const &item : character_class.items) {
      std::visit(meta::Overload{
                     [&](Range const &item_range) {
                       ranges.push_back(item_range);
                     },
                     [&](PerlClass const &perl_class) {
                       auto class_ranges = perl_class_ranges(perl_class.kind);
                       if (perl_class.is_complement) {
                         class_ranges = complement(class_ranges, max_unit);
                       }
                       ranges.insert(ranges.end(), class_ranges.begin(),
                                     class_ranges.end());
                     },
                 },
                 item);
    }

    ranges = normalize(std::move(ranges));
    if (is_caseless) {
      ranges = add_ascii_case_folds(std::move(ranges));
    }
    if (character_class.is_complement) {
      ranges = complement(ranges, max_unit);
    }
    emit(instruction::Class{std::move(ranges)}, offset);
  }

  auto emit_alternation(Alternation const &alternation, size_t offset)
      -> void {
    std::vector<size_t> jumps_to_end;
    auto const &alternatives = alternation.alternatives;
    for (size_t i = 0; i < alternatives.size(); i += 1) {
      if (i + 1 == alternatives.size()) {
        emit_node(alternatives[i]);
        break;
      }

      size_t split = emit(instruction::Split{}, offset);
      emit_node(alternatives[i]);
      jumps_to_end.push_back(emit(instruction::Jump{}, offset));
      set_split(split, split + 1, next_index(), /*is_greedy=*/true);
    }

    for (auto jump : jumps_to_end) {
      std::get<instruction::Jump>(program.instructions[jump]).target =
          next_index();
    }
  }

  auto emit_star(Node const &body, bool is_greedy, size_t offset) -> void {
    size_t entry = emit(instruction::Split{}, offset);
    size_t loop = next_index();

    if (can_be_empty(body)) {
      emit_progress_loop(body, is_greedy, offset);
    } else {
      emit_node(body);
      emit(instruction::Jump{entry}, offset);
    }
    set_split(entry, loop, next_index(), is_greedy);
  }

  auto emit_plus(Node const &body, bool is_greedy, size_t offset) -> void {
    if (can_be_empty(body)) {
      emit_progress_loop(body, is_greedy, offset);
      return;
    }

    size_t loop = next_index();
    emit_node(body);
    size_t split = emit(instruction::Split{}, offset);
    set_split(split, loop, next_index(), is_greedy);
  }

  auto emit_repetition(Repetition const &repetition, size_t offset) -> void {
    auto const &body = *repetition.node;

    if (not repetition.upper.has_value()) {
      if (repetition.lower == 0) {
        emit_star(body, repetition.is_greedy, offset);
        return;
      }
      for (unsigned i = 0; i + 1 < repetition.lower; i += 1) {
        emit_node(body);
      }
      emit_plus(body, repetition.is_greedy, offset);
      return;
    }

    for (unsigned i = 0; i < repetition.lower; i += 1) {
      emit_node(body);
    }

    // Each optional copy may be skipped, which skips all of the later ones
    std::vector<size_t> optional_splits;
    for (unsigned i = repetition.lower; i < *repetition.upper; i += 1) {
      optional_splits.push_back(emit(instruction::Split{}, offset));
      emit_node(body);
    }
    for (auto split : optional_splits) {
      set_split(split, split + 1, next_index(), repetition.is_greedy);
    }
  }

  auto emit_node(Node const &node) -> void {
    std::visit(
        meta::Overload{
            [&](Literal const &literal) {
              for (auto unit : literal.units) {
                emit_unit(unit, node.offset);
              }
            },
            [&](Any const &) {
              if (is_dotall) {
                emit(instruction::AnyUnit{}, node.offset);
              } else {
                emit(instruction::AnyExceptNewline{}, node.offset);
              }
            },
            [&](CharacterClass const &character_class) {
              emit_class(character_class, node.offset);
            },
            [&](Assertion const &assertion) {
              emit(instruction::Assert{assertion.kind}, node.offset);
            },
            [&](Concatenation const &concatenation) {
              for (auto const &child : concatenation.nodes) {
                emit_node(child);
              }
            },
            [&](Alternation const &alternation) {
              emit_alternation(alternation, node.offset);
            },
            [&](Repetition const &repetition) {
              emit_repetition(repetition, node.offset);
            },
            [&](Group const &group) {
              if (not group.is_capturing) {
                emit_node(*group.node);
                return;
              }
              auto slot = slots.at(&group);
              emit(instruction::Save{2 * slot}, node.offset);
              emit_node(*group.node);
              emit(instruction::Save{2 * slot + 1}, node.offset);
            },
        },
        node.type);
  }
};
} // namespace

auto regexp::compile(Ast &&ast, std::string_view pattern, unsigned long flags)
    -> std::unique_ptr<Program> {
  auto program = std::make_unique<Program>();
  program->is_utf = ast.is_utf;
  program->is_multiline = (flags & RE_MULTILINE) != 0;

  SlotMap slots;
  assign_slots(ast.root, program->groups, slots);

  Emitter emitter{
      .program = *program,
      .slots = slots,
      .pattern = pattern,
      .max_unit = ast.is_utf ? max_codepoint : max_byte_unit,
      .is_caseless = (flags & RE_CASELESS) != 0,
      .is_dotall = (flags & RE_DOTALL) != 0,
  };

  // Slot 0 brackets the whole match
  emitter.emit(instruction::Save{0}, 0);
  emitter.emit_node(ast.root);
  emitter.emit(instruction::Save{1}, pattern.size());
  emitter.emit(instruction::Match{}, pattern.size());

  if (program->state_size() > max_state_size) {
    throw SyntaxError(pattern, 0, "compiled pattern is too large");
  }

  REGEXP_LOG(debug, "Compiled ", program->instructions.size(),
             " instructions, ", program->groups.slot_count(), " slots, ",
             program->progress_registers, " progress registers");
  return program;
}
