//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/VMHost.cpp
// Purpose: Implement the VMHost facade: budgets, verb and builtin dispatch,
//          suspension and fork bookkeeping around the interpreter.
// Key invariants: Budgets are measured from the start of the current slice
//                 (start, fork start or resume). A cancelled or over-budget
//                 task is aborted without running finally blocks.
// Ownership/Lifetime: The host owns its VM; world state is borrowed for the
//                     duration of one execInterpreter call.
// Links: include/moo/vm/VMHost.hpp
//
//===----------------------------------------------------------------------===//

#include "moo/vm/VMHost.hpp"

#include "vm/BuiltinFunctions.hpp"
#include "vm/VM.hpp"

#include <chrono>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace moo::vm
{
using values::ErrorCode;
using values::Var;

struct VMHost::Impl
{
    using Clock = std::chrono::steady_clock;

    explicit Impl(HostConfig cfg) : config(std::move(cfg)), vm(config.trace) {}

    /// @brief Reset per-slice budgets.
    void beginSlice()
    {
        tickBase = vm.ticks();
        sliceStart = Clock::now();
        sincePoll = 0;
    }

    void reset(uint64_t id)
    {
        vm = VM(config.trace);
        taskId = id;
        pendingForkName.reset();
        stopRequested = false;
        beginSlice();
    }

    uint64_t ticksUsed() const
    {
        return vm.ticks() - tickBase;
    }

    std::chrono::duration<double> elapsed() const
    {
        return Clock::now() - sliceStart;
    }

    HostResponse exec(VMHost &self, WorldState &world)
    {
        for (;;)
        {
            if (vm.empty())
                return host::Idle{};
            if (stopRequested)
            {
                stopRequested = false;
                (void)vm.abort();
                return host::AbortCancelled{};
            }
            if (ticksUsed() >= config.maxTicks)
            {
                (void)vm.abort();
                return host::AbortLimit{AbortLimitReason::Ticks};
            }
            if (elapsed() >= config.maxTime)
            {
                (void)vm.abort();
                return host::AbortLimit{AbortLimitReason::Time};
            }
            if (config.interruptEveryN != 0 && config.pollCallback &&
                ++sincePoll >= config.interruptEveryN)
            {
                sincePoll = 0;
                if (!config.pollCallback(self))
                    return host::Yield{};
            }

            if (auto response = handle(vm.step(world), world))
                return std::move(*response);
        }
    }

    /// @brief Act on one interpreter result; nullopt means keep running.
    std::optional<HostResponse> handle(ExecutionResult outcome, WorldState &world)
    {
        return std::visit(
            [&](auto &&r) -> std::optional<HostResponse>
            {
                using T = std::decay_t<decltype(r)>;
                if constexpr (std::is_same_v<T, result::More>)
                    return std::nullopt;
                else if constexpr (std::is_same_v<T, result::Complete>)
                    return host::Complete{std::move(r.value)};
                else if constexpr (std::is_same_v<T, result::Exception>)
                    return host::Exception{std::move(r.exception)};
                else if constexpr (std::is_same_v<T, result::Aborted>)
                    return host::AbortCancelled{};
                else if constexpr (std::is_same_v<T, result::ContinueVerb>)
                    return handle(callVerb(std::move(r.request), world), world);
                else if constexpr (std::is_same_v<T, result::ContinueBuiltin>)
                    return callBuiltin(r.id, r.args, world);
                else if constexpr (std::is_same_v<T, result::DispatchFork>)
                {
                    pendingForkName = r.fork.taskIdName;
                    return host::DispatchFork{std::move(r.fork)};
                }
                else if constexpr (std::is_same_v<T, result::Suspend>)
                    return host::Suspend{r.delaySeconds};
                else
                    static_assert(sizeof(T) == 0, "unhandled execution result");
            },
            outcome);
    }

    /// @brief Resolve @p request and push an activation for the verb found.
    ExecutionResult callVerb(VerbCallRequest request, WorldState &world)
    {
        if (vm.depth() >= config.maxStackDepth)
            return vm.pushError(ErrorCode::E_MAXREC);

        const Activation &caller = vm.top();
        const values::Objid perms = caller.permissions();
        values::Objid searchFrom = request.location;
        if (request.pass)
        {
            auto parent = world.parentOf(perms, caller.call.definer);
            if (!parent)
                return vm.pushError(errorCodeOf(parent.error()), parent.error().message);
            if (parent.value() == values::kNothing)
                return vm.pushError(ErrorCode::E_VERBNF);
            searchFrom = parent.value();
        }

        auto resolved = world.findMethodVerb(perms, searchFrom, request.verb);
        if (!resolved)
            return vm.pushError(errorCodeOf(resolved.error()), resolved.error().message);
        ResolvedVerb &verb = resolved.value();

        VerbCallContext call;
        call.verbName = std::move(request.verb);
        call.thisObj = request.location;
        call.player = caller.call.player;
        call.caller = caller.call.thisObj;
        call.definer = verb.definer;
        call.owner = verb.owner;
        call.args = std::move(request.args);
        call.argstr = caller.call.argstr;
        call.command = caller.call.command;
        call.debug = verb.debug;
        vm.pushActivation(Activation(std::move(verb.program), std::move(call)));
        return result::More{};
    }

    std::optional<HostResponse> callBuiltin(uint16_t id, const Var::List &args, WorldState &world)
    {
        const auto used = ticksUsed();
        const auto left = config.maxTicks > used ? config.maxTicks - used : 0;
        const double secondsLeft =
            std::chrono::duration<double>(config.maxTime).count() - elapsed().count();
        BfCallState state{vm, world, args, taskId, static_cast<int64_t>(left),
                          secondsLeft > 0.0 ? secondsLeft : 0.0};

        BfRet ret = BuiltinFunctions::instance().call(id, state);
        if (auto *value = std::get_if<bf::Ret>(&ret))
        {
            vm.top().push(std::move(value->value));
            return std::nullopt;
        }
        if (auto *err = std::get_if<bf::Error>(&ret))
            return handle(vm.pushError(err->code, std::move(err->message)), world);
        return handle(std::move(std::get<bf::VmInstr>(ret).result), world);
    }

    HostConfig config;
    VM vm;
    uint64_t taskId = 0;
    uint64_t tickBase = 0;
    Clock::time_point sliceStart = Clock::now();
    uint32_t sincePoll = 0;
    std::optional<compiler::Name> pendingForkName;
    bool stopRequested = false;
};

VMHost::VMHost(HostConfig config) : impl_(std::make_unique<Impl>(std::move(config))) {}

VMHost::~VMHost() = default;

VMHost::VMHost(VMHost &&) noexcept = default;

VMHost &VMHost::operator=(VMHost &&) noexcept = default;

void VMHost::startExecution(uint64_t taskId,
                            VerbCallContext call,
                            std::shared_ptr<const compiler::Program> program)
{
    impl_->reset(taskId);
    impl_->vm.pushActivation(Activation(std::move(program), std::move(call)));
}

void VMHost::startFork(uint64_t taskId, ForkRequest fork)
{
    impl_->reset(taskId);
    if (fork.taskIdName)
        fork.activation.env[fork.taskIdName->id] = Var::fromInt(static_cast<int64_t>(taskId));
    impl_->vm.pushActivation(std::move(fork.activation));
}

support::Expected<void> VMHost::resumeExecution(Var value)
{
    if (impl_->vm.empty())
        return support::makeError({}, "no task to resume");
    impl_->vm.top().push(std::move(value));
    impl_->beginSlice();
    return {};
}

void VMHost::forkDispatched(uint64_t taskId)
{
    if (impl_->pendingForkName && impl_->vm.depth() > 0)
        impl_->vm.top().env[impl_->pendingForkName->id] =
            Var::fromInt(static_cast<int64_t>(taskId));
    impl_->pendingForkName.reset();
}

void VMHost::stop()
{
    impl_->stopRequested = true;
}

HostResponse VMHost::execInterpreter(WorldState &world)
{
    return impl_->exec(*this, world);
}

bool VMHost::running() const
{
    return !impl_->vm.empty();
}

uint64_t VMHost::taskId() const
{
    return impl_->taskId;
}

uint64_t VMHost::ticksUsed() const
{
    return impl_->ticksUsed();
}

const std::string &VMHost::verbName() const
{
    static const std::string kNone;
    return running() ? impl_->vm.top().call.verbName : kNone;
}

values::Objid VMHost::definer() const
{
    return running() ? impl_->vm.top().call.definer : values::kNothing;
}

values::Objid VMHost::thisObj() const
{
    return running() ? impl_->vm.top().call.thisObj : values::kNothing;
}

values::Objid VMHost::permissions() const
{
    return running() ? impl_->vm.top().permissions() : values::kNothing;
}

const Var::List &VMHost::args() const
{
    static const Var::List kNone;
    return running() ? impl_->vm.top().call.args : kNone;
}

} // namespace moo::vm
