#include "regexp/error.hpp"
#include "regexp/regexp.hpp"

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string_view>
#include <vector>

using namespace std::literals;

namespace {
constexpr int exit_match = 0;
constexpr int exit_no_match = 1;
constexpr int exit_error = 2;

auto print_usage() -> void {
  std::cerr << "Usage: regexp-match [-u] [-i] [-s] [-m] [-U] [-n] [-d] "
               "<pattern> <subject> [name...]\n"
               "  -u  UTF-8 mode\n"
               "  -i  caseless\n"
               "  -s  dot matches newline\n"
               "  -m  multiline anchors\n"
               "  -U  ungreedy quantifiers\n"
               "  -n  plain groups do not capture\n"
               "  -d  dump the compiled program\n";
}

auto summarize_result(regexp::RegExp const &compiled,
                      regexp::MatchResult const &result) -> void {
  if (not result) {
    std::cout << "No match\n";
    return;
  }

  std::cout << "Match\n";
  for (size_t index = 0; index < result.groups.size(); index += 1) {
    std::cout << "  Group[" << index << "]";
    if (auto name = compiled.group_table().name_of(index)) {
      std::cout << " (" << *name << ")";
    }

    auto const &group = result.groups[index];
    if (group.has_value()) {
      std::cout << ": '" << *result.group_text(index) << "' ("
                << group->start_index << "-" << group->end_index << ")\n";
    } else {
      std::cout << ": None\n";
    }
  }
}
} // namespace

int main(int argc, char *argv[]) {
  unsigned long flags = 0;
  bool should_dump = false;

  int arg_index = 1;
  for (; arg_index < argc; arg_index += 1) {
    std::string_view arg = argv[arg_index];
    if (arg.size() < 2 || arg[0] != '-') {
      break;
    }
    if (arg == "--"sv) {
      arg_index += 1;
      break;
    }

    for (char option : arg.substr(1)) {
      switch (option) {
      case 'u':
        flags |= regexp::RE_UTF;
        break;
      case 'i':
        flags |= regexp::RE_CASELESS;
        break;
      case 's':
        flags |= regexp::RE_DOTALL;
        break;
      case 'm':
        flags |= regexp::RE_MULTILINE;
        break;
      case 'U':
        flags |= regexp::RE_UNGREEDY;
        break;
      case 'n':
        flags |= regexp::RE_NO_AUTO_CAPTURE;
        break;
      case 'd':
        should_dump = true;
        break;
      default:
        std::cerr << "Unknown option '-" << option << "'\n";
        print_usage();
        return exit_error;
      }
    }
  }

  if (argc - arg_index < 2) {
    print_usage();
    return exit_error;
  }
  std::string_view pattern = argv[arg_index];
  std::string_view subject = argv[arg_index + 1];
  std::vector<std::string_view> names(argv + arg_index + 2, argv + argc);

  try {
    auto compiled = regexp::RegExp{pattern, flags};
    if (should_dump) {
      compiled.disassemble(std::cout);
    }

    if (not names.empty()) {
      auto collected = compiled.collect_named(subject, names);
      for (auto const &[name, value] : collected) {
        std::cout << name << "=" << value << "\n";
      }
      return collected.empty() ? exit_no_match : exit_match;
    }

    auto result = compiled.search(subject);
    summarize_result(compiled, result);
    return result ? exit_match : exit_no_match;
  } catch (regexp::RegExpError const &error) {
    std::cerr << to_string(error.kind()) << ": " << error.what() << "\n";
    return exit_error;
  }
}
