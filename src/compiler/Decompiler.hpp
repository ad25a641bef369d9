//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/compiler/Decompiler.hpp
// Purpose: Reconstructs a statement tree from a compiled Program.
// Key invariants: Only the instruction shapes emitted by compile() are
//                 accepted; anything else is reported as MalformedProgram.
// Ownership/Lifetime: The result owns a copy of the program's name table.
// Links: src/compiler/Codegen.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "compiler/Ast.hpp"
#include "compiler/Program.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>

namespace moo::compiler
{

/// @brief Failure kinds reported in Diagnostic::code by decompile().
enum class DecompileErrorKind : uint32_t
{
    MalformedProgram = 1,
};

/// @brief Invert compile(): decompile(compile(p)) is structurally equal to p,
///        including statement line numbers.
support::Expected<ParsedProgram> decompile(const Program &program);

} // namespace moo::compiler
