#include "private/matcher.hpp"

#include "private/format.hpp"
#include "private/logging.hpp"
#include "private/meta.hpp"
#include "private/program.hpp"
#include "private/sparse_set.hpp"
#include "private/unicode.hpp"
#include "regexp/error.hpp"
#include "regexp/regexp.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

using namespace regexp;

namespace {
constexpr size_t unset = std::numeric_limits<size_t>::max();

// Threads waiting on one input position, in priority order. Only consuming
// instructions and Match hold threads; the n-th thread's registers start at
// n * stride.
//
// `visited` holds the epsilon closure states seen at this position, keyed by
// instruction and loop level (see `progress_level`).
struct ThreadList {
  SparseSet threads;
  SparseSet visited;
  std::vector<size_t> registers;
  size_t stride;
  size_t levels;

  ThreadList(size_t instruction_count, size_t register_count,
             size_t loop_levels)
      : threads{instruction_count},
        visited{instruction_count * (loop_levels + 1)},
        stride{register_count}, levels{loop_levels + 1} {}

  auto add(uint32_t index, size_t const *thread_registers) -> void {
    threads.insert(index);
    registers.insert(registers.end(), thread_registers,
                     thread_registers + stride);
  }

  auto registers_at(size_t rank) const -> size_t const * {
    return registers.data() + rank * stride;
  }

  auto clear() -> void {
    threads.clear();
    visited.clear();
    registers.clear();
  }
};

struct Frame {
  enum class Type { explore, restore };

  Type type;
  size_t index; // instruction to explore, or register to restore
  size_t value;
};

constexpr auto accepts(Instruction const &instruction, Codepoint unit)
    -> bool {
  return std::visit(
      meta::Overload{
          [&](instruction::Char const &character) {
            return character.unit == unit;
          },
          [&](instruction::AnyExceptNewline const &) {
            return unit.value != '\n';
          },
          [](instruction::AnyUnit const &) { return true; },
          [&](instruction::Class const &character_class) {
            return character_class.contains(unit);
          },
          [](auto const &) { return false; },
      },
      instruction);
}

class Executor {
  Program const &m_program;
  std::string_view m_text;
  std::vector<Frame> m_stack;

  auto is_line_start(size_t position) const -> bool {
    if (position == 0) {
      return true;
    }
    return m_program.is_multiline && m_text[position - 1] == '\n';
  }

  auto is_line_end(size_t position) const -> bool {
    if (position == m_text.size()) {
      return true;
    }
    if (m_text[position] != '\n') {
      return false;
    }
    // Outside multiline mode only a final newline counts
    return m_program.is_multiline || position + 1 == m_text.size();
  }

  auto next_unit(size_t position, size_t &size) const -> Codepoint {
    if (not m_program.is_utf) {
      size = 1;
      return Codepoint{static_cast<uint8_t>(m_text[position])};
    }
    return parse_utf8_char(m_text.substr(position), size);
  }

  // Loop level of the closure state at `index`: the outermost enclosing
  // progress loop whose iteration started here, or the depth if none did.
  // An inner loop is always entered after its outer one, so the deeper
  // levels are then at this position as well.
  auto progress_level(size_t index, size_t position,
                      size_t const *registers) const -> size_t {
    size_t const depth = m_program.loop_depths[index];
    size_t const base = m_program.progress_base();
    for (size_t level = 0; level < depth; level += 1) {
      if (registers[base + level] == position) {
        return level;
      }
    }
    return depth;
  }

  // Follows every epsilon transition from `start`, adding the threads that
  // end on a consuming instruction (or Match) to `list`. Register writes are
  // undone on the way back so `registers` is unchanged on return.
  auto add_thread(ThreadList &list, size_t start, size_t position,
                  size_t *registers) -> void {
    m_stack.push_back({Frame::Type::explore, start, 0});

    while (not m_stack.empty()) {
      auto frame = m_stack.back();
      m_stack.pop_back();

      if (frame.type == Frame::Type::restore) {
        registers[frame.index] = frame.value;
        continue;
      }

      size_t index = frame.index;
      bool is_running = true;
      while (is_running) {
        auto state = static_cast<uint32_t>(
            index * list.levels + progress_level(index, position, registers));
        if (list.visited.contains(state)) {
          // A higher priority path already got here
          break;
        }
        list.visited.insert(state);

        auto write_register = [&](uint32_t register_index) {
          m_stack.push_back({Frame::Type::restore, register_index,
                             registers[register_index]});
          registers[register_index] = position;
        };

        std::visit(
            meta::Overload{
                [&](instruction::Split const &split) {
                  m_stack.push_back(
                      {Frame::Type::explore, split.secondary, 0});
                  index = split.primary;
                },
                [&](instruction::Jump const &jump) { index = jump.target; },
                [&](instruction::Save const &save) {
                  write_register(save.index);
                  index += 1;
                },
                [&](instruction::MarkProgress const &mark) {
                  write_register(mark.index);
                  index += 1;
                },
                [&](instruction::RepeatProgress const &repeat) {
                  if (registers[repeat.index] == position) {
                    // Zero-width iteration, stop looping
                    index = repeat.exit;
                    return;
                  }
                  size_t preferred = repeat.is_greedy ? repeat.loop : repeat.exit;
                  size_t other = repeat.is_greedy ? repeat.exit : repeat.loop;
                  m_stack.push_back({Frame::Type::explore, other, 0});
                  index = preferred;
                },
                [&](instruction::Assert const &assertion) {
                  bool is_satisfied =
                      assertion.kind == ast::Assertion::Kind::line_start
                          ? is_line_start(position)
                          : is_line_end(position);
                  if (is_satisfied) {
                    index += 1;
                  } else {
                    is_running = false;
                  }
                },
                [&](auto const &) {
                  // Consuming instruction or Match: the thread waits here.
                  // Once it consumes, the loop level no longer matters.
                  if (not list.threads.contains(static_cast<uint32_t>(index))) {
                    list.add(static_cast<uint32_t>(index), registers);
                  }
                  is_running = false;
                },
            },
            m_program.instructions[index]);
      }
    }
  }

  auto build_result(bool did_match, std::vector<size_t> const &registers) const
      -> MatchResult {
    MatchResult result;
    result.text = m_text;
    result.did_match = did_match;

    size_t const slot_count = m_program.groups.slot_count();
    if (not did_match) {
      result.groups.assign(slot_count, std::nullopt);
      return result;
    }

    result.groups.reserve(slot_count);
    for (size_t slot = 0; slot < slot_count; slot += 1) {
      size_t start_index = registers[2 * slot];
      size_t end_index = registers[2 * slot + 1];
      if (start_index == unset || end_index == unset) {
        // Group did not take part in the match
        result.groups.push_back(std::nullopt);
      } else {
        result.groups.push_back(MatchResult::Group{start_index, end_index});
      }
    }
    return result;
  }

public:
  Executor(Program const &program, std::string_view text)
      : m_program{program}, m_text{text} {}

  auto run(size_t start, Anchor anchor) -> MatchResult {
    size_t const instruction_count = m_program.instructions.size();
    size_t const register_count = m_program.register_count();
    size_t const loop_levels = m_program.progress_registers;

    auto current = ThreadList{instruction_count, register_count, loop_levels};
    auto next = ThreadList{instruction_count, register_count, loop_levels};
    std::vector<size_t> scratch(register_count, unset);
    std::vector<size_t> best;
    bool did_match = false;

    size_t position = start;
    while (true) {
      // New threads start with the lowest priority, so earlier starting
      // positions always win
      if (not did_match && (anchor == Anchor::unanchored || position == start)) {
        std::fill(scratch.begin(), scratch.end(), unset);
        add_thread(current, 0, position, scratch.data());
      }
      if (current.threads.empty()) {
        break;
      }

      bool const is_at_end = position >= m_text.size();
      size_t unit_size = 0;
      Codepoint unit{0};
      if (not is_at_end) {
        unit = next_unit(position, unit_size);
      }

      for (size_t rank = 0; rank < current.threads.size(); rank += 1) {
        auto index = current.threads.begin()[rank];
        auto const &instruction = m_program.instructions[index];
        if (std::holds_alternative<instruction::Match>(instruction)) {
          if (anchor == Anchor::both && not is_at_end) {
            continue;
          }
          auto const *registers = current.registers_at(rank);
          best.assign(registers, registers + register_count);
          did_match = true;
          // Everything after this thread has a lower priority
          break;
        }

        if (is_at_end || not accepts(instruction, unit)) {
          continue;
        }
        std::copy_n(current.registers_at(rank), register_count,
                    scratch.data());
        add_thread(next, index + 1, position + unit_size, scratch.data());
      }

      if (is_at_end) {
        break;
      }
      std::swap(current, next);
      next.clear();
      position += unit_size;
    }

    return build_result(did_match, best);
  }
};
} // namespace

auto regexp::run(Program const &program, std::string_view text,
                 size_t start_offset, Anchor anchor) -> MatchResult {
  if (start_offset > text.size()) {
    throw ArgumentError(format_message("start offset ", start_offset,
                                       " is past the end of the subject (",
                                       text.size(), " bytes)"));
  }

  if (program.is_utf) {
    if (auto bad_offset = find_invalid_utf8(text)) {
      REGEXP_LOG(err, "Invalid UTF-8 in subject at offset ", *bad_offset);
      throw EncodingError("subject", *bad_offset);
    }
    if (start_offset < text.size() && is_continuation_byte(text[start_offset])) {
      REGEXP_LOG(err, "Start offset ", start_offset,
                 " is inside a UTF-8 sequence");
      throw EncodingError("subject", start_offset);
    }
  }

  return Executor{program, text}.run(start_offset, anchor);
}
