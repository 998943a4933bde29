#include "regexp/regexp.hpp"

#include "private/compiler.hpp"
#include "private/format.hpp"
#include "private/logging.hpp"
#include "private/matcher.hpp"
#include "private/parser.hpp"
#include "private/program.hpp"
#include "regexp/error.hpp"

#include <algorithm>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace regexp;

namespace {
auto build_program(std::string_view pattern, unsigned long flags)
    -> std::unique_ptr<Program const> {
  if ((flags & ~supported_flags) != 0) {
    REGEXP_LOG(err, "Unsupported flags ", (flags & ~supported_flags));
    throw ArgumentError(
        format_message("unsupported flag bits ", flags & ~supported_flags));
  }

  try {
    return compile(parse(pattern, flags), pattern, flags);
  } catch (SyntaxError const &error) {
    REGEXP_LOG(err, "Regexp compilation error @ ", error.offset(), " : ",
               error.reason());
    throw;
  }
}
} // namespace

auto MatchResult::group_text(size_t group) const
    -> std::optional<std::string_view> {
  if (not did_match) {
    return std::nullopt;
  }
  if (group >= groups.size()) {
    throw ArgumentError(format_message("group ", group, " is out of range"));
  }

  auto const &match = groups[group];
  if (not match.has_value()) {
    return std::nullopt;
  }
  return text.substr(match->start_index,
                     match->end_index - match->start_index);
}

auto GroupTable::add_group(std::optional<std::string_view> name) -> size_t {
  size_t slot = m_slot_count;
  m_slot_count += 1;
  if (name.has_value()) {
    m_names.emplace_back(std::string{*name}, slot);
  }
  return slot;
}

auto GroupTable::find(std::string_view name) const -> std::optional<size_t> {
  auto iter = std::find_if(m_names.begin(), m_names.end(),
                           [&](auto const &entry) { return entry.first == name; });
  if (iter == m_names.end()) {
    return std::nullopt;
  }
  return iter->second;
}

auto GroupTable::index_of(std::string_view name) const -> size_t {
  auto slot = find(name);
  if (not slot.has_value()) {
    throw UnknownGroupError(name);
  }
  return *slot;
}

auto GroupTable::name_of(size_t slot) const -> std::optional<std::string_view> {
  for (auto const &[name, named_slot] : m_names) {
    if (named_slot == slot) {
      return name;
    }
  }
  return std::nullopt;
}

RegExp::RegExp(std::string_view pattern, unsigned long flags)
    : m_program{build_program(pattern, flags)}, m_pattern{pattern},
      m_flags{flags} {
  REGEXP_LOG(debug, "Regexp compiled for \"", m_pattern, "\"");
}

RegExp::RegExp(RegExp &&) noexcept = default;
auto RegExp::operator=(RegExp &&) noexcept -> RegExp & = default;
RegExp::~RegExp() = default;

auto RegExp::program() const -> Program const & {
  if (m_program == nullptr) {
    throw ArgumentError("regexp has been moved from");
  }
  return *m_program;
}

auto RegExp::search(std::string_view text, size_t start) const -> MatchResult {
  return run(program(), text, start, Anchor::unanchored);
}

auto RegExp::match_at(std::string_view text, size_t offset) const
    -> MatchResult {
  return run(program(), text, offset, Anchor::start);
}

auto RegExp::full_match(std::string_view text) const -> MatchResult {
  return run(program(), text, 0, Anchor::both);
}

auto RegExp::named_text(MatchResult const &result, std::string_view name) const
    -> std::optional<std::string_view> {
  return result.group_text(program().groups.index_of(name));
}

auto RegExp::collect_named(std::string_view text, std::string_view name) const
    -> std::map<std::string, std::string> {
  return collect_named(text, std::span<std::string_view const>{&name, 1});
}

auto RegExp::collect_named(std::string_view text,
                           std::span<std::string_view const> names) const
    -> std::map<std::string, std::string> {
  // Resolve every name first so an unknown one fails before matching
  std::vector<size_t> slots;
  slots.reserve(names.size());
  for (auto name : names) {
    slots.push_back(program().groups.index_of(name));
  }

  std::map<std::string, std::string> collected;
  auto result = search(text);
  if (not result) {
    REGEXP_LOG(info, "No match for \"", m_pattern, "\"");
    return collected;
  }

  for (size_t i = 0; i < names.size(); i += 1) {
    auto captured = result.group_text(slots[i]);
    if (not captured.has_value()) {
      REGEXP_LOG(warn, "Group ", i, " (\"", names[i], "\") value not found");
      continue;
    }
    REGEXP_LOG(debug, "  Found ", names[i], "=", *captured);
    collected.emplace(std::string{names[i]}, std::string{*captured});
  }
  return collected;
}

auto RegExp::group_table() const -> GroupTable const & {
  return program().groups;
}

auto RegExp::group_count() const -> size_t {
  return program().groups.slot_count();
}
