//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Unwind.cpp
// Purpose: Error raising and the single unwind routine shared by exceptions,
//          returns, loop exits and aborts.
// Key invariants: Unwinding only ever pops handler entries and activations;
//                 a finally block always observes its reason as (payload,
//                 code) on top of an operand stack truncated to its entry
//                 depth. Aborts bypass finally blocks.
// Ownership/Lifetime: Operates on the VM's own activation stack.
// Links: src/vm/ExecutionResult.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Handler-stack unwinding.

#include "vm/VM.hpp"

#include <algorithm>

namespace moo::vm
{
using values::ErrorCode;
using values::Var;

namespace
{
Var exceptionPayload(const Exception &e)
{
    return Var::fromList({Var::fromErr(e.code),
                          Var::fromStr(e.message),
                          e.value,
                          Var::fromList(e.backtrace),
                          Var::fromList(e.stack)});
}

std::optional<Exception> exceptionFromPayload(const Var &payload)
{
    if (!payload.isList() || payload.asList().size() != 5)
        return std::nullopt;
    const auto &items = payload.asList();
    if (!items[0].isErr() || !items[1].isStr() || !items[3].isList() || !items[4].isList())
        return std::nullopt;
    Exception e;
    e.code = items[0].asErr();
    e.message = items[1].asStr();
    e.value = items[2];
    e.backtrace = items[3].asList();
    e.stack = items[4].asList();
    return e;
}

Var codeVar(FinallyCode code)
{
    return Var::fromInt(static_cast<int64_t>(code));
}

/// Does the codes value of a catch arm cover @p code? Int 0 stands for ANY.
bool armMatches(const Var &codes, ErrorCode code)
{
    if (codes.isInt())
        return codes.asInt() == 0;
    if (!codes.isList())
        return false;
    const Var err = Var::fromErr(code);
    for (const auto &c : codes.asList())
    {
        if (c == err)
            return true;
    }
    return false;
}

const Exception *exceptionOf(const FinallyReason &why)
{
    if (const auto *r = std::get_if<unwind::Raise>(&why))
        return &r->exception;
    if (const auto *u = std::get_if<unwind::Uncaught>(&why))
        return &u->exception;
    return nullptr;
}
} // namespace

Var Exception::toCaughtValue() const
{
    return Var::fromList(
        {Var::fromErr(code), Var::fromStr(message), value, Var::fromList(backtrace)});
}

std::pair<Var, Var> encodeFinallyReason(const FinallyReason &why)
{
    return std::visit(
        [](const auto &r) -> std::pair<Var, Var>
        {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, unwind::Fallthrough>)
                return {Var::fromInt(0), codeVar(FinallyCode::Fallthrough)};
            else if constexpr (std::is_same_v<T, unwind::Raise>)
                return {exceptionPayload(r.exception), codeVar(FinallyCode::Raise)};
            else if constexpr (std::is_same_v<T, unwind::Uncaught>)
                return {exceptionPayload(r.exception), codeVar(FinallyCode::Uncaught)};
            else if constexpr (std::is_same_v<T, unwind::Return>)
                return {r.value, codeVar(FinallyCode::Return)};
            else if constexpr (std::is_same_v<T, unwind::Abort>)
                return {Var::fromInt(0), codeVar(FinallyCode::Abort)};
            else
                return {Var::fromList({Var::fromInt(r.stack.value), Var::fromInt(r.label.id)}),
                        codeVar(FinallyCode::Exit)};
        },
        why);
}

std::optional<FinallyReason> decodeFinallyReason(const Var &payload, const Var &code)
{
    if (!code.isInt())
        return std::nullopt;
    switch (static_cast<FinallyCode>(code.asInt()))
    {
        case FinallyCode::Fallthrough:
            return unwind::Fallthrough{};
        case FinallyCode::Raise:
        case FinallyCode::Uncaught:
        {
            auto e = exceptionFromPayload(payload);
            if (!e)
                return std::nullopt;
            if (code.asInt() == static_cast<int64_t>(FinallyCode::Raise))
                return unwind::Raise{std::move(*e)};
            return unwind::Uncaught{std::move(*e)};
        }
        case FinallyCode::Return:
            return unwind::Return{payload};
        case FinallyCode::Abort:
            return unwind::Abort{};
        case FinallyCode::Exit:
        {
            if (!payload.isList() || payload.asList().size() != 2)
                return std::nullopt;
            const auto &items = payload.asList();
            if (!items[0].isInt() || !items[1].isInt())
                return std::nullopt;
            return unwind::Exit{compiler::Offset{static_cast<uint32_t>(items[0].asInt())},
                                compiler::Label{static_cast<uint32_t>(items[1].asInt())}};
        }
    }
    return std::nullopt;
}

ExecutionResult VM::raise(ErrorCode code, std::string message, Var value)
{
    return unwind(unwind::Raise{makeException(code, std::move(message), std::move(value))});
}

/// @brief Deliver a runtime error the way the running verb expects it.
/// @details The error value always lands where the failed operation's result
///          would have gone. Verbs with the debug flag then raise it; others
///          carry on with the value.
ExecutionResult VM::pushError(ErrorCode code, std::string message)
{
    Activation &act = stack_.back();
    act.push(Var::fromErr(code));
    if (act.call.debug)
        return raise(code, std::move(message));
    return result::More{};
}

ExecutionResult VM::abort()
{
    return unwind(unwind::Abort{});
}

/// @brief Pop handler entries, then activations, until @p why is absorbed.
/// @details
/// - A Finally entry always intercepts (except for aborts): the operand stack
///   is truncated to its entry depth, the encoded reason is pushed and
///   control moves to the finally code, whose closing Continue resumes the
///   unwind.
/// - A Catch entry intercepts raised errors whose code one of its arms
///   lists. The arms' code lists and handler labels are discarded with it.
/// - A loop exit stops at handlers entered below its target depth.
/// - When an activation has no interested handler it is popped; returns
///   deliver their value to the caller, errors continue in the caller.
ExecutionResult VM::unwind(FinallyReason why)
{
    const bool aborting = std::holds_alternative<unwind::Abort>(why);
    while (!stack_.empty())
    {
        Activation &act = stack_.back();

        if (const auto *exit = std::get_if<unwind::Exit>(&why))
        {
            while (!act.handlers.empty() && act.handlers.back().valstackPos >= exit->stack.value)
            {
                const HandlerLabel h = act.handlers.back();
                act.handlers.pop_back();
                if (h.kind == HandlerLabel::Kind::Finally)
                {
                    act.valstack.resize(h.valstackPos);
                    auto [payload, code] = encodeFinallyReason(why);
                    act.push(std::move(payload));
                    act.push(std::move(code));
                    act.jump(h.label);
                    return result::More{};
                }
            }
            act.valstack.resize(exit->stack.value);
            act.jump(exit->label);
            return result::More{};
        }

        while (!aborting && !act.handlers.empty())
        {
            const HandlerLabel h = act.handlers.back();
            act.handlers.pop_back();

            if (h.kind == HandlerLabel::Kind::Finally)
            {
                act.valstack.resize(h.valstackPos);
                auto [payload, code] = encodeFinallyReason(why);
                act.push(std::move(payload));
                act.push(std::move(code));
                act.jump(h.label);
                return result::More{};
            }
            if (h.kind != HandlerLabel::Kind::Catch)
                continue;

            // The arms were pushed before the Catch entry, first arm deepest.
            std::vector<HandlerLabel> arms;
            for (uint16_t i = 0; i < h.count && !act.handlers.empty(); ++i)
            {
                arms.push_back(act.handlers.back());
                act.handlers.pop_back();
            }
            std::reverse(arms.begin(), arms.end());

            const Exception *e = exceptionOf(why);
            if (!e)
                continue;
            for (const auto &arm : arms)
            {
                if (arm.valstackPos == 0 || arm.valstackPos > act.valstack.size())
                    continue;
                if (!armMatches(act.valstack[arm.valstackPos - 1], e->code))
                    continue;
                Var caught = e->toCaughtValue();
                act.valstack.resize(arms.front().valstackPos - 1);
                act.push(std::move(caught));
                act.jump(arm.label);
                return result::More{};
            }
        }

        stack_.pop_back();

        if (aborting)
            continue;
        if (auto *ret = std::get_if<unwind::Return>(&why))
        {
            if (stack_.empty())
                return result::Complete{std::move(ret->value)};
            stack_.back().push(std::move(ret->value));
            return result::More{};
        }
        if (std::holds_alternative<unwind::Fallthrough>(why))
        {
            if (stack_.empty())
                return result::Complete{Var::none()};
            stack_.back().push(Var::none());
            return result::More{};
        }
        if (const auto *raised = std::get_if<unwind::Raise>(&why))
            why = unwind::Uncaught{raised->exception};
    }

    if (aborting)
        return result::Aborted{};
    if (const Exception *e = exceptionOf(why))
        return result::Exception{*e};
    return result::Complete{Var::none()};
}

} // namespace moo::vm
