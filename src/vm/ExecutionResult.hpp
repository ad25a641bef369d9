//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/ExecutionResult.hpp
// Purpose: Values exchanged between the interpreter and its host: exceptions,
//          unwind reasons, dispatch requests and step results.
// Key invariants: FinallyReason round-trips through its two-slot operand
//                 stack encoding (payload, then reason code).
// Ownership/Lifetime: Plain values; a ForkRequest owns its activation copy.
// Links: src/vm/VM.hpp, src/vm/Unwind.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "compiler/Labels.hpp"
#include "values/ErrorCode.hpp"
#include "values/Var.hpp"
#include "vm/Activation.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace moo::vm
{

/// @brief A raised language error with its context.
struct Exception
{
    values::ErrorCode code = values::ErrorCode::E_NONE;
    std::string message;
    values::Var value;
    std::vector<values::Var> stack;     ///< callers()-style frame list.
    std::vector<values::Var> backtrace; ///< Printable traceback lines.

    /// @brief `{code, message, value, traceback}` as delivered to a handler.
    values::Var toCaughtValue() const;
};

/// @brief Reason codes pushed for a finally block.
enum class FinallyCode : int64_t
{
    Raise = 0,
    Uncaught = 1,
    Return = 2,
    Abort = 3,
    Exit = 4,
    Fallthrough = 5,
};

namespace unwind
{
struct Fallthrough
{
};

/// An error raised in the current activation.
struct Raise
{
    Exception exception;
};

/// An error propagating out of a called activation.
struct Uncaught
{
    Exception exception;
};

struct Return
{
    values::Var value;
};

struct Abort
{
};

/// Loop exit: truncate to @ref stack and continue at @ref label.
struct Exit
{
    compiler::Offset stack;
    compiler::Label label;
};
} // namespace unwind

/// @brief Why control is leaving a block.
using FinallyReason = std::variant<unwind::Fallthrough,
                                   unwind::Raise,
                                   unwind::Uncaught,
                                   unwind::Return,
                                   unwind::Abort,
                                   unwind::Exit>;

/// @brief Operand-stack payload and reason code for @p why.
std::pair<values::Var, values::Var> encodeFinallyReason(const FinallyReason &why);

/// @brief Inverse of encodeFinallyReason(); nullopt for a malformed pair.
std::optional<FinallyReason> decodeFinallyReason(const values::Var &payload,
                                                 const values::Var &code);

/// @brief Verb dispatch requested by `obj:verb(args)` or `pass(args)`.
struct VerbCallRequest
{
    values::Objid location = values::kNothing;
    std::string verb;
    values::Var::List args;
    bool pass = false; ///< Resolve on the parent of the calling definer.
};

/// @brief A fork body ready to be scheduled as a new task.
struct ForkRequest
{
    double delaySeconds = 0.0;
    Activation activation; ///< Starts at pc 0 of its fork vector.
    std::optional<compiler::Name> taskIdName;
};

/// @brief Outcome of one interpreter step.
namespace result
{
struct More
{
};

struct Complete
{
    values::Var value;
};

struct Exception
{
    vm::Exception exception;
};

struct Aborted
{
};

struct ContinueVerb
{
    VerbCallRequest request;
};

struct ContinueBuiltin
{
    uint16_t id = 0;
    values::Var::List args;
};

struct DispatchFork
{
    ForkRequest fork;
};

struct Suspend
{
    std::optional<double> delaySeconds;
};
} // namespace result

using ExecutionResult = std::variant<result::More,
                                     result::Complete,
                                     result::Exception,
                                     result::Aborted,
                                     result::ContinueVerb,
                                     result::ContinueBuiltin,
                                     result::DispatchFork,
                                     result::Suspend>;

} // namespace moo::vm
