//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/compiler/Program.hpp
// Purpose: Compiled verb artifact and its binary codec.
// Key invariants: A Program is immutable once produced; executing tasks share
//                 it through shared_ptr<const Program>. encode/decode
//                 round-trip byte-for-byte.
// Ownership/Lifetime: Program owns its literals, labels, names and vectors.
// Links: src/compiler/Opcode.hpp, src/compiler/Codegen.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "compiler/Labels.hpp"
#include "compiler/Names.hpp"
#include "compiler/Opcode.hpp"
#include "support/diag_expected.hpp"
#include "values/Var.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace moo::compiler
{

/// @brief Magic number at the start of every encoded program: "MOOP".
inline constexpr uint32_t kProgramMagic = 0x504F4F4D;

/// @brief Current encoding version.
inline constexpr uint16_t kProgramVersion = 1;

/// @brief Maps the first instruction of a statement to its source line.
struct LineSpan
{
    size_t pc = 0;
    size_t line = 0;

    bool operator==(const LineSpan &) const = default;
};

/// @brief Output of the code generator and input of the interpreter.
struct Program
{
    std::vector<values::Var> literals;
    std::vector<JumpLabel> jumpLabels;
    Names varNames;
    std::vector<Op> mainVector;
    std::vector<std::vector<Op>> forkVectors;
    std::vector<LineSpan> lineNumberSpans;
    std::vector<std::vector<LineSpan>> forkLineNumberSpans;

    /// @brief Label table entry for @p label.
    const JumpLabel &jumpLabel(Label label) const
    {
        return jumpLabels.at(label.id);
    }

    /// @brief Instruction vector: the main vector when @p forkVector is empty.
    const std::vector<Op> &vector(std::optional<size_t> forkVector) const
    {
        return forkVector ? forkVectors.at(*forkVector) : mainVector;
    }

    /// @brief Source line of the statement containing instruction @p pc.
    /// @return 0 when no span covers @p pc.
    size_t findLine(std::optional<size_t> forkVector, size_t pc) const;

    bool operator==(const Program &) const = default;
};

/// @brief Failure kinds reported in Diagnostic::code by decodeProgram.
enum class DecodeErrorKind : uint32_t
{
    BadMagic = 1,
    UnsupportedVersion,
    Truncated,
    BadTag,
    TrailingBytes,
};

/// @brief Serialize @p program into its binary form.
std::vector<uint8_t> encodeProgram(const Program &program);

/// @brief Parse a program previously produced by encodeProgram.
support::Expected<Program> decodeProgram(std::span<const uint8_t> bytes);

/// @brief Human-readable listing of every vector, label and literal.
std::string disassemble(const Program &program);

} // namespace moo::compiler
