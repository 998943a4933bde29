#pragma once

#include "private/ast.hpp"
#include "private/program.hpp"

#include <cstddef>
#include <memory>
#include <string_view>

namespace regexp {
constexpr size_t max_program_size = 1U << 20U;
// Bound on Program::state_size(), the matcher's per-call allocation
constexpr size_t max_state_size = 1U << 22U;

// Lowers the AST into an instruction program. `pattern` is only used for
// diagnostics.
auto compile(ast::Ast &&, std::string_view pattern, unsigned long flags)
    -> std::unique_ptr<Program>;
} // namespace regexp
