//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/moo/vm/VMHost.hpp
// Purpose: Embedding facade that drives one task's interpreter in bounded
//          slices and reports structured responses to a scheduler.
// Key invariants: One VMHost runs one task at a time; every response except
//                 Yield, Suspend and DispatchFork ends the task; a host with no
//                 task answers Idle.
// Ownership/Lifetime: VMHost owns its interpreter; programs are shared with
//                     the activations that run them.
// Links: src/vm/VMHost.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "compiler/Program.hpp"
#include "support/diag_expected.hpp"
#include "values/Var.hpp"
#include "vm/Activation.hpp"
#include "vm/ExecutionResult.hpp"
#include "vm/Trace.hpp"
#include "vm/WorldState.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace moo::vm
{
class VMHost;

/// @brief Budgets and instrumentation for a host.
struct HostConfig
{
    uint64_t maxTicks = 60000;                   ///< Instructions per task slice.
    std::chrono::milliseconds maxTime{5000};     ///< Wall-clock time per task slice.
    size_t maxStackDepth = 50;                   ///< Activations before E_MAXREC.
    TraceConfig trace;                           ///< Interpreter tracing.

    // Periodic host polling --------------------------------------------------
    /// @brief Invoke @ref pollCallback every N instructions (0 disables).
    uint32_t interruptEveryN = 0;
    /// @brief Host callback; return false to end the slice with Yield.
    std::function<bool(VMHost &)> pollCallback;
};

enum class AbortLimitReason
{
    Ticks,
    Time,
};

namespace host
{
/// The running code forked a task; the scheduler must start it and then call
/// VMHost::forkDispatched with its id before continuing this task.
struct DispatchFork
{
    ForkRequest fork;
};

/// The task suspended; resume it with VMHost::resumeExecution.
struct Suspend
{
    std::optional<double> delaySeconds; ///< Empty: suspend until resumed.
};

struct Complete
{
    values::Var value;
};

/// An error reached the bottom of the call stack.
struct Exception
{
    vm::Exception exception;
};

struct AbortLimit
{
    AbortLimitReason reason;
};

/// The task was cancelled by VMHost::stop.
struct AbortCancelled
{
};

/// The poll callback asked for a pause; call execInterpreter again to continue.
struct Yield
{
};

/// No task is loaded, or the last one has already ended.
struct Idle
{
};
} // namespace host

using HostResponse = std::variant<host::DispatchFork,
                                  host::Suspend,
                                  host::Complete,
                                  host::Exception,
                                  host::AbortLimit,
                                  host::AbortCancelled,
                                  host::Yield,
                                  host::Idle>;

/// @brief Drives a task's interpreter under tick and time budgets.
/// @details Verb calls and builtin calls requested by the interpreter are
///          resolved here, so the scheduler only sees responses that need its
///          attention.
class VMHost
{
  public:
    explicit VMHost(HostConfig config = {});
    ~VMHost();

    VMHost(const VMHost &) = delete;
    VMHost &operator=(const VMHost &) = delete;
    VMHost(VMHost &&) noexcept;
    VMHost &operator=(VMHost &&) noexcept;

    /// @brief Begin task @p taskId running @p program's main vector.
    void startExecution(uint64_t taskId,
                        VerbCallContext call,
                        std::shared_ptr<const compiler::Program> program);

    /// @brief Begin task @p taskId running a forked block.
    /// @details Binds the fork's task-id variable, if any, to @p taskId.
    void startFork(uint64_t taskId, ForkRequest fork);

    /// @brief Continue a suspended task; @p value is the result of suspend().
    /// @return An error when no task is loaded.
    support::Expected<void> resumeExecution(values::Var value);

    /// @brief Report the id of the task created for the last DispatchFork.
    void forkDispatched(uint64_t taskId);

    /// @brief Request cancellation; the next slice returns AbortCancelled.
    void stop();

    /// @brief Run until the task needs the scheduler.
    [[nodiscard]] HostResponse execInterpreter(WorldState &world);

    [[nodiscard]] bool running() const;

    [[nodiscard]] uint64_t taskId() const;

    /// @brief Instructions executed in the current slice.
    [[nodiscard]] uint64_t ticksUsed() const;

    // Accessors for the executing verb; empty or #-1 when nothing is running.
    [[nodiscard]] const std::string &verbName() const;
    [[nodiscard]] values::Objid definer() const;
    [[nodiscard]] values::Objid thisObj() const;
    [[nodiscard]] values::Objid permissions() const;
    [[nodiscard]] const values::Var::List &args() const;

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace moo::vm
