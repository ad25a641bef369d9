//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/VM.cpp
// Purpose: Interpreter construction, the single-step driver and the frame
//          introspection used by tracebacks and callers().
// Key invariants: step() executes exactly one instruction and accounts one
//                 tick for it.
// Ownership/Lifetime: The VM owns its activations; programs are shared.
// Links: src/vm/VMExecute.cpp, src/vm/Unwind.cpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief VM driver and frame introspection.

#include "vm/VM.hpp"

namespace moo::vm
{
using values::Var;

VM::VM(TraceConfig trace) : trace_(trace) {}

void VM::pushActivation(Activation activation)
{
    stack_.push_back(std::move(activation));
}

/// @brief Execute the instruction at the top activation's program counter.
/// @details Running past the end of a vector behaves like `Done`. The program
///          is pinned for the duration of the step because the instruction
///          may pop the activation that references it.
ExecutionResult VM::step(WorldState &world)
{
    Activation &act = stack_.back();
    const auto program = act.program;
    const auto &ops = act.ops();
    if (act.pc >= ops.size())
        return unwind(unwind::Return{Var::none()});

    const compiler::Op &op = ops[act.pc];
    trace_.onStep(op, act, stack_.size());
    ++act.pc;

    MOO_VM_DISPATCH_BEFORE(*this, op);
    ExecutionResult outcome = execute(op, act, world);
    MOO_VM_DISPATCH_AFTER(*this, op);
    return outcome;
}

std::vector<Var> VM::callers(bool includeTop) const
{
    std::vector<Var> frames;
    if (stack_.empty())
        return frames;
    const size_t skip = includeTop ? 0 : 1;
    for (size_t i = stack_.size() - skip; i-- > 0;)
    {
        const Activation &a = stack_[i];
        frames.push_back(Var::fromList({
            Var::fromObj(a.call.thisObj),
            Var::fromStr(a.call.verbName),
            Var::fromObj(a.call.owner),
            Var::fromObj(a.call.definer),
            Var::fromObj(a.call.player),
            Var::fromInt(static_cast<int64_t>(a.currentLine())),
        }));
    }
    return frames;
}

/// @brief Render the traceback for an error raised in the top activation.
/// @details One line per activation, innermost first, closed by
///          `(End of traceback)`.
std::vector<Var> VM::makeBacktrace(const std::string &message) const
{
    std::vector<Var> lines;
    for (size_t i = stack_.size(); i-- > 0;)
    {
        const Activation &a = stack_[i];
        std::string line = i + 1 == stack_.size() ? "" : "... called from ";
        line += "#" + std::to_string(a.call.definer) + ":" + a.call.verbName;
        if (a.call.definer != a.call.thisObj)
            line += " (this == #" + std::to_string(a.call.thisObj) + ")";
        line += ", line " + std::to_string(a.currentLine());
        if (i + 1 == stack_.size())
            line += ":  " + message;
        lines.push_back(Var::fromStr(std::move(line)));
    }
    lines.push_back(Var::fromStr("(End of traceback)"));
    return lines;
}

Exception VM::makeException(values::ErrorCode code, std::string message, Var value) const
{
    if (message.empty())
        message = std::string(values::errorMessage(code));
    Exception e;
    e.code = code;
    e.backtrace = makeBacktrace(message);
    e.stack = callers(true);
    e.message = std::move(message);
    e.value = std::move(value);
    return e;
}

} // namespace moo::vm
