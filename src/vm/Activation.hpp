//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Activation.hpp
// Purpose: One in-flight verb call: program counter, operand stack,
//          environment and handler stack.
// Key invariants: env.size() equals the program's name-table width; every
//                 HandlerLabel::valstackPos is at most valstack.size().
// Ownership/Lifetime: The Program is shared and read-only; every other piece
//                     of state is owned by value so activations can be copied
//                     into fork requests.
// Links: src/vm/VM.hpp, src/vm/Unwind.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "compiler/Program.hpp"
#include "values/Var.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace moo::vm
{

/// @brief Marker on the handler stack for an active try block.
struct HandlerLabel
{
    enum class Kind : uint8_t
    {
        Catch,      ///< Guards `count` CatchLabel arms pushed just below it.
        CatchLabel, ///< One except arm; its codes sit at valstackPos - 1.
        Finally,    ///< A finally block entered at @ref label.
    };

    Kind kind = Kind::Catch;
    uint16_t count = 0;      ///< Arm count of a Catch entry.
    compiler::Label label{}; ///< Handler code of CatchLabel and Finally entries.
    size_t valstackPos = 0;  ///< Operand-stack depth when the entry was pushed.
};

/// @brief Parsed player command that started a verb call.
struct CommandContext
{
    values::Objid dobj = values::kNothing;
    std::string dobjstr;
    std::string prepstr;
    values::Objid iobj = values::kNothing;
    std::string iobjstr;
};

/// @brief Identity and arguments of a verb invocation.
struct VerbCallContext
{
    std::string verbName;
    values::Objid thisObj = values::kNothing;
    values::Objid player = values::kNothing;
    values::Objid caller = values::kNothing;
    values::Objid definer = values::kNothing;
    values::Objid owner = values::kNothing; ///< Permissions the verb runs with.
    values::Var::List args;
    std::string argstr;
    std::optional<CommandContext> command; ///< Empty unless called from a command.
    bool debug = true;
};

/// @brief Execution state of one verb call.
struct Activation
{
    /// @brief Start @p call at the first instruction of @p program's main
    ///        vector with the globals seeded.
    Activation(std::shared_ptr<const compiler::Program> program, VerbCallContext call);

    std::shared_ptr<const compiler::Program> program;
    std::optional<size_t> forkVector; ///< Executing fork vector; main when empty.
    size_t pc = 0;
    std::vector<values::Var> valstack;
    std::vector<values::Var> env; ///< None marks an unbound variable.
    std::vector<HandlerLabel> handlers;
    values::Var temp; ///< Saved result of an indexed assignment chain.
    VerbCallContext call;

    /// @brief Instruction vector being executed.
    const std::vector<compiler::Op> &ops() const
    {
        return program->vector(forkVector);
    }

    void push(values::Var v)
    {
        valstack.push_back(std::move(v));
    }

    values::Var pop()
    {
        values::Var v = std::move(valstack.back());
        valstack.pop_back();
        return v;
    }

    /// @brief Value @p fromTop slots below the top of the operand stack.
    values::Var &peek(size_t fromTop = 0)
    {
        return valstack[valstack.size() - 1 - fromTop];
    }

    void jump(compiler::Label label)
    {
        pc = program->jumpLabel(label).position;
    }

    /// @brief Source line of the instruction at @p at.
    size_t lineAt(size_t at) const
    {
        return program->findLine(forkVector, at);
    }

    /// @brief Source line of the instruction most recently started.
    size_t currentLine() const
    {
        return lineAt(pc == 0 ? 0 : pc - 1);
    }

    values::Objid permissions() const
    {
        return call.owner;
    }
};

} // namespace moo::vm
