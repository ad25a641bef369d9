//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
/**
 * @file
 * @brief Stack-based interpreter for compiled MOO programs.
 *
 * The VM owns a stack of Activations and executes exactly one instruction of
 * the top activation per call to step(). Anything that needs the outside
 * world beyond property access (verb dispatch, builtin calls, forks,
 * suspension, completion) is reported as an ExecutionResult for the host to
 * act on.
 *
 * @section invariants Key invariants
 * - Language errors never propagate as C++ exceptions; they are raised
 *   through unwind(), which consults the handler stacks.
 * - The VM never mutates a Program.
 *
 * @section concurrency Concurrency model
 * A VM instance is single-threaded and belongs to one task.
 */
//===----------------------------------------------------------------------===//

#pragma once

#include "compiler/Opcode.hpp"
#include "values/Var.hpp"
#include "vm/Activation.hpp"
#include "vm/ExecutionResult.hpp"
#include "vm/Trace.hpp"
#include "vm/VMConfig.hpp"
#include "vm/WorldState.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace moo::vm
{

/// @brief Number of distinct instructions, for per-opcode counters.
inline constexpr size_t kOpcodeCount = std::variant_size_v<compiler::Op>;

class VM
{
  public:
    explicit VM(TraceConfig trace = {});

    /// @brief Make @p activation the new top of the call stack.
    void pushActivation(Activation activation);

    bool empty() const
    {
        return stack_.empty();
    }

    size_t depth() const
    {
        return stack_.size();
    }

    Activation &top()
    {
        return stack_.back();
    }

    const Activation &top() const
    {
        return stack_.back();
    }

    const std::vector<Activation> &activations() const
    {
        return stack_;
    }

    /// @brief Execute one instruction of the top activation.
    /// @pre !empty().
    ExecutionResult step(WorldState &world);

    /// @brief Raise @p code regardless of the running verb's debug flag.
    ExecutionResult raise(values::ErrorCode code,
                          std::string message = {},
                          values::Var value = values::Var::fromInt(0));

    /// @brief Push @p code as a value; raise it when the verb has the debug flag.
    ExecutionResult pushError(values::ErrorCode code, std::string message = {});

    /// @brief Unwind handler and activation stacks for @p why.
    ExecutionResult unwind(FinallyReason why);

    /// @brief Abort the task: pop every activation without running finally code.
    ExecutionResult abort();

    /// @brief callers()-style frames, innermost caller first, excluding the top
    ///        activation when @p includeTop is false.
    std::vector<values::Var> callers(bool includeTop = false) const;

    /// @brief Instructions executed since construction.
    uint64_t ticks() const
    {
        return ticks_;
    }

    void setOpcodeCounting(bool enabled)
    {
        countOpcodes_ = enabled;
    }

    const std::array<uint64_t, kOpcodeCount> &opcodeCounts() const
    {
        return opCounts_;
    }

  private:
    /// @brief Dispatch @p op for @p act; defined in VMExecute.cpp.
    ExecutionResult execute(const compiler::Op &op, Activation &act, WorldState &world);

    /// @brief Build an Exception with traceback for the current stack.
    Exception makeException(values::ErrorCode code, std::string message, values::Var value) const;

    std::vector<values::Var> makeBacktrace(const std::string &message) const;

    std::vector<Activation> stack_;
    TraceSink trace_;

    // Touched by the MOO_VM_DISPATCH_* hooks.
    uint64_t ticks_ = 0;
    bool countOpcodes_ = false;
    std::array<uint64_t, kOpcodeCount> opCounts_{};
};

} // namespace moo::vm
