//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/compiler/Unparse.hpp
// Purpose: Renders a statement tree back to MOO source text.
// Key invariants: Parentheses are emitted only where operator precedence or
//                 associativity requires them.
// Ownership/Lifetime: Stateless; results are returned by value.
// Links: src/compiler/Decompiler.hpp, src/tools/moo-dis/main.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "compiler/Ast.hpp"

#include <string>
#include <vector>

namespace moo::compiler
{

/// @brief Render @p expr using the identifiers of @p names.
/// @pre Every Name in @p expr is bound in @p names.
std::string unparseExpr(const Names &names, const Expr &expr);

/// @brief Render @p program one source line per element, nested blocks
///        indented by two spaces.
std::vector<std::string> unparseLines(const ParsedProgram &program);

/// @brief Render @p program as newline-terminated source text.
std::string unparse(const ParsedProgram &program);

} // namespace moo::compiler
