#include "regexp/regexp.hpp"

#include "private/format.hpp"
#include "private/program.hpp"
#include "private/unicode.hpp"

#include <cstddef>
#include <iomanip>
#include <ostream>
#include <string>
#include <variant>

using namespace regexp;

namespace {
auto pretty_format(Codepoint unit, bool is_utf) -> std::string {
  if (unit.value == '\n') {
    return "\\n";
  }
  if (unit.value == '\t') {
    return "\\t";
  }
  if (unit.value < 0x20 || unit.value == 0x7f || (not is_utf && unit.value > 0x7f)) {
    static constexpr char digits[] = "0123456789abcdef";
    return std::string{"\\x"} + digits[(unit.value >> 4) & 0xf] +
           digits[unit.value & 0xf];
  }
  std::string output;
  codepoint_to_utf8(output, unit);
  return output;
}

struct Formatter {
  bool is_utf;

  auto operator()(instruction::Char const &character) const -> std::string {
    return "char '" + pretty_format(character.unit, is_utf) + "'";
  }

  auto operator()(instruction::AnyExceptNewline const &) const -> std::string {
    return "any-except-newline";
  }

  auto operator()(instruction::AnyUnit const &) const -> std::string {
    return "any";
  }

  auto operator()(instruction::Class const &character_class) const
      -> std::string {
    std::string output = "class [";
    for (auto const &range : character_class.ranges) {
      output += pretty_format(range.lower, is_utf);
      if (range.upper != range.lower) {
        output += "-";
        output += pretty_format(range.upper, is_utf);
      }
    }
    output += "]";
    return output;
  }

  auto operator()(instruction::Split const &split) const -> std::string {
    return format_message("split ", split.primary, ", ", split.secondary);
  }

  auto operator()(instruction::Jump const &jump) const -> std::string {
    return format_message("jump ", jump.target);
  }

  auto operator()(instruction::Save const &save) const -> std::string {
    return format_message("save ", save.index);
  }

  auto operator()(instruction::MarkProgress const &mark) const
      -> std::string {
    return format_message("mark-progress r", mark.index);
  }

  auto operator()(instruction::RepeatProgress const &repeat) const
      -> std::string {
    return format_message("repeat-progress r", repeat.index, ", loop ",
                          repeat.loop, ", exit ", repeat.exit,
                          repeat.is_greedy ? "" : " (lazy)");
  }

  auto operator()(instruction::Assert const &assertion) const -> std::string {
    return assertion.kind == ast::Assertion::Kind::line_start
               ? "assert line-start"
               : "assert line-end";
  }

  auto operator()(instruction::Match const &) const -> std::string {
    return "match";
  }
};
} // namespace

auto RegExp::disassemble(std::ostream &out_stream) const -> void {
  auto const &program = this->program();

  out_stream << "pattern \"" << m_pattern << "\"\n";
  for (size_t index = 0; index < program.instructions.size(); index += 1) {
    out_stream << std::setw(5) << index << "  "
               << std::visit(Formatter{program.is_utf},
                             program.instructions[index])
               << "\n";
  }

  out_stream << "groups:\n";
  for (size_t slot = 0; slot < program.groups.slot_count(); slot += 1) {
    out_stream << std::setw(5) << slot << "  ";
    if (slot == 0) {
      out_stream << "<match>";
    } else if (auto name = program.groups.name_of(slot)) {
      out_stream << *name;
    } else {
      out_stream << "<unnamed>";
    }
    out_stream << "\n";
  }
}
