#pragma once

#include "private/ast.hpp"

#include <string_view>

namespace regexp {
constexpr unsigned max_repeat_count = 1000;
constexpr unsigned max_group_nesting = 250;

// Throws SyntaxError on malformed patterns and EncodingError on invalid UTF-8
// when RE_UTF is set.
auto parse(std::string_view pattern, unsigned long flags) -> ast::Ast;
} // namespace regexp
