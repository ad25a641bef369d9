//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/BuiltinFunctions.hpp
// Purpose: Runtime implementations of the builtin functions, indexed by the
//          dense ids of compiler::Builtins.
// Key invariants: Arguments are validated against the descriptor before an
//                 implementation runs; implementations never throw.
// Ownership/Lifetime: The table is a process-wide immutable singleton.
// Links: src/compiler/Builtins.hpp, src/vm/VMHost.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "values/ErrorCode.hpp"
#include "values/Var.hpp"
#include "vm/ExecutionResult.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace moo::vm
{
class VM;
class WorldState;

/// @brief Everything a builtin may consult while running.
struct BfCallState
{
    VM &vm;
    WorldState &world;
    const values::Var::List &args;
    uint64_t taskId = 0;
    int64_t ticksLeft = 0;
    double secondsLeft = 0.0;
};

namespace bf
{
/// Return a value to the caller.
struct Ret
{
    values::Var value;
};

/// Deliver a language error to the caller.
struct Error
{
    values::ErrorCode code;
    std::string message;
};

/// Hand a step result straight to the host (raise, suspend).
struct VmInstr
{
    ExecutionResult result;
};
} // namespace bf

using BfRet = std::variant<bf::Ret, bf::Error, bf::VmInstr>;

using BuiltinFn = BfRet (*)(BfCallState &state);

class BuiltinFunctions
{
  public:
    static const BuiltinFunctions &instance();

    /// @brief Validate @p state.args against builtin @p id and run it.
    /// @return E_ARGS for a bad argument count, E_TYPE for a bad argument
    ///         type, E_INVARG for an unknown or unimplemented builtin.
    BfRet call(uint16_t id, BfCallState &state) const;

  private:
    BuiltinFunctions();

    std::vector<BuiltinFn> table_; ///< nullptr for unimplemented builtins.
};

} // namespace moo::vm
