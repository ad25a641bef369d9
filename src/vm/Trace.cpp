//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trace.cpp
// Purpose: Render interpreter steps as trace lines.
// Key invariants: Each executed instruction produces at most one line; output
//                 honours TraceConfig::mode.
// Ownership/Lifetime: Trace sinks borrow activations only for the duration of
//                     onStep().
// Links: src/vm/Trace.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/Trace.hpp"

#include "vm/Activation.hpp"

#include <iostream>

namespace moo::vm
{

/// @brief Determine whether tracing output should be emitted.
/// @return True when tracing is active, false when it is disabled.
bool TraceConfig::enabled() const
{
    return mode != Off;
}

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

std::ostream &TraceSink::stream() const
{
    return cfg.out ? *cfg.out : std::cerr;
}

/// @brief Emit the trace line for one step.
/// @details In Ops mode the line is `[moo] <verb> #<pc> <opcode> <operands>
///          depth=<n>`. In Lines mode a line is written only when the source
///          line (or the activation) differs from the previous step.
void TraceSink::onStep(const compiler::Op &op, const Activation &act, size_t depth)
{
    if (cfg.mode == TraceConfig::Off)
        return;
    auto &os = stream();
    if (cfg.mode == TraceConfig::Ops)
    {
        os << "[moo] " << act.call.verbName << " #" << act.pc << ' ' << compiler::formatOp(op)
           << " depth=" << depth << '\n';
        return;
    }
    const size_t line = act.lineAt(act.pc);
    if (lastActivation == &act && lastLine && *lastLine == line)
        return;
    lastActivation = &act;
    lastLine = line;
    os << "[moo] " << act.call.verbName << " line " << line << " depth=" << depth << '\n';
}

} // namespace moo::vm
