//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/compiler/Codegen.hpp
// Purpose: Lowers a parsed verb body into a Program.
// Key invariants: The tracked operand-stack depth is zero at the end of the
//                 main vector and returns to its entry depth at the end of
//                 every fork vector; no saved stack top remains outstanding.
// Ownership/Lifetime: compile() returns an independent Program by value.
// Links: src/compiler/Decompiler.hpp (inverse), src/vm/VMExecute.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "compiler/Ast.hpp"
#include "compiler/Program.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>

namespace moo::compiler
{

/// @brief Failure kinds reported in Diagnostic::code by compile().
enum class CompileErrorKind : uint32_t
{
    UnknownBuiltinFunction = 1,
    UnknownLoopLabel,
    InvalidLvalue,
    LengthOutsideIndex,
    StackImbalance,
};

/// @brief Generate code for @p parsed.
/// @details Compilation stops at the first error. The Program's name table is
///          a copy of @p parsed.names.
/// @return The compiled program or a diagnostic whose code is a
///         CompileErrorKind and whose location names the offending line.
support::Expected<Program> compile(const ParsedProgram &parsed);

} // namespace moo::compiler
