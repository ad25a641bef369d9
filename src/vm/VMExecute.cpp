//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/VMExecute.cpp
// Purpose: Instruction semantics of the interpreter.
// Key invariants: Each instruction's net operand-stack effect matches the
//                 depth accounting of the code generator; failing operations
//                 leave an error value in place of their result.
// Ownership/Lifetime: Executes against the activation passed in; after any
//                     call into unwind() that activation may be gone.
// Links: src/compiler/Codegen.cpp, src/vm/Unwind.cpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Exhaustive dispatch over compiler::Op.
/// @details One branch per instruction. Property access goes through the
///          WorldState directly; verb calls, builtin calls and forks are
///          surfaced to the host as ExecutionResult requests.

#include "vm/VM.hpp"

#include <cmath>
#include <limits>
#include <type_traits>

namespace moo::vm
{
using compiler::Op;
using values::ErrorCode;
using values::Var;
using values::VarResult;
namespace op = compiler::op;

namespace
{
template <typename T, typename... Us>
inline constexpr bool kIsOneOf = (std::is_same_v<T, Us> || ...);

VarResult compareOp(const Var &a, const Var &b, bool (*test)(int))
{
    auto c = values::compare(a, b);
    if (!c)
        return c.error();
    return Var::fromInt(test(c.value()) ? 1 : 0);
}
} // namespace

ExecutionResult VM::execute(const Op &instr, Activation &act, WorldState &world)
{
    const compiler::Program &program = *act.program;

    auto pushResult = [this, &act](VarResult r) -> ExecutionResult
    {
        if (!r)
            return pushError(values::errorOf(r.error()));
        act.push(std::move(r.value()));
        return result::More{};
    };

    return std::visit(
        [&](const auto &o) -> ExecutionResult
        {
            using T = std::decay_t<decltype(o)>;

            // Literals and variables --------------------------------------------
            if constexpr (std::is_same_v<T, op::Imm>)
            {
                act.push(program.literals.at(o.literal));
            }
            else if constexpr (std::is_same_v<T, op::ImmInt>)
            {
                act.push(Var::fromInt(o.value));
            }
            else if constexpr (std::is_same_v<T, op::Push>)
            {
                const Var &v = act.env.at(o.name.id);
                if (v.isNone())
                    return pushError(ErrorCode::E_VARNF);
                act.push(v);
            }
            else if constexpr (std::is_same_v<T, op::Put>)
            {
                act.env.at(o.name.id) = act.peek();
            }
            else if constexpr (std::is_same_v<T, op::Pop>)
            {
                act.pop();
            }

            // Control flow ------------------------------------------------------
            else if constexpr (kIsOneOf<T, op::If, op::Eif, op::IfQues, op::While>)
            {
                if (!act.pop().isTrue())
                    act.jump(o.label);
            }
            else if constexpr (std::is_same_v<T, op::WhileId>)
            {
                Var cond = act.pop();
                const bool truth = cond.isTrue();
                act.env.at(o.id.id) = std::move(cond);
                if (!truth)
                    act.jump(o.label);
            }
            else if constexpr (std::is_same_v<T, op::Jump>)
            {
                act.jump(o.label);
            }
            else if constexpr (std::is_same_v<T, op::And>)
            {
                if (!act.peek().isTrue())
                    act.jump(o.label);
                else
                    act.pop();
            }
            else if constexpr (std::is_same_v<T, op::Or>)
            {
                if (act.peek().isTrue())
                    act.jump(o.label);
                else
                    act.pop();
            }
            else if constexpr (std::is_same_v<T, op::ForList>)
            {
                // Stack: [list, counter] with a 0-based counter.
                const Var &counter = act.peek(0);
                const Var &list = act.peek(1);
                if (!counter.isInt() || !list.isList())
                {
                    act.pop();
                    act.pop();
                    act.jump(o.end);
                    return pushError(ErrorCode::E_TYPE);
                }
                const auto n = counter.asInt();
                if (n < 0 || static_cast<size_t>(n) >= list.asList().size())
                {
                    act.pop();
                    act.pop();
                    act.jump(o.end);
                    return result::More{};
                }
                act.env.at(o.id.id) = list.asList()[static_cast<size_t>(n)];
                act.peek(0) = Var::fromInt(n + 1);
            }
            else if constexpr (std::is_same_v<T, op::ForRange>)
            {
                // Stack: [from, to]; `from` advances in place.
                const Var &to = act.peek(0);
                const Var &from = act.peek(1);
                const bool ints = from.isInt() && to.isInt();
                const bool objs = from.isObj() && to.isObj();
                if (!ints && !objs)
                {
                    act.pop();
                    act.pop();
                    act.jump(o.end);
                    return pushError(ErrorCode::E_TYPE);
                }
                const int64_t lo = ints ? from.asInt() : from.asObj();
                const int64_t hi = ints ? to.asInt() : to.asObj();
                if (lo > hi)
                {
                    act.pop();
                    act.pop();
                    act.jump(o.end);
                    return result::More{};
                }
                act.env.at(o.id.id) = from;
                auto make = [ints](int64_t v) { return ints ? Var::fromInt(v) : Var::fromObj(v); };
                // At the top of the int64 range, end the loop by lowering `to` instead.
                if (lo == std::numeric_limits<int64_t>::max())
                    act.peek(0) = make(hi - 1);
                else
                    act.peek(1) = make(lo + 1);
            }

            // Operators ---------------------------------------------------------
            else if constexpr (kIsOneOf<T, op::Eq, op::Ne>)
            {
                Var rhs = act.pop();
                Var lhs = act.pop();
                const bool eq = lhs.equalsIgnoreCase(rhs);
                act.push(Var::fromInt((std::is_same_v<T, op::Eq> ? eq : !eq) ? 1 : 0));
            }
            else if constexpr (kIsOneOf<T, op::Lt, op::Le, op::Gt, op::Ge>)
            {
                Var rhs = act.pop();
                Var lhs = act.pop();
                bool (*test)(int) = nullptr;
                if constexpr (std::is_same_v<T, op::Lt>)
                    test = [](int c) { return c < 0; };
                else if constexpr (std::is_same_v<T, op::Le>)
                    test = [](int c) { return c <= 0; };
                else if constexpr (std::is_same_v<T, op::Gt>)
                    test = [](int c) { return c > 0; };
                else
                    test = [](int c) { return c >= 0; };
                return pushResult(compareOp(lhs, rhs, test));
            }
            else if constexpr (std::is_same_v<T, op::In>)
            {
                Var rhs = act.pop();
                Var lhs = act.pop();
                return pushResult(values::in(lhs, rhs));
            }
            else if constexpr (kIsOneOf<T, op::Add, op::Sub, op::Mul, op::Div, op::Mod, op::Exp>)
            {
                Var rhs = act.pop();
                Var lhs = act.pop();
                if constexpr (std::is_same_v<T, op::Add>)
                    return pushResult(values::add(lhs, rhs));
                else if constexpr (std::is_same_v<T, op::Sub>)
                    return pushResult(values::sub(lhs, rhs));
                else if constexpr (std::is_same_v<T, op::Mul>)
                    return pushResult(values::mul(lhs, rhs));
                else if constexpr (std::is_same_v<T, op::Div>)
                    return pushResult(values::div(lhs, rhs));
                else if constexpr (std::is_same_v<T, op::Mod>)
                    return pushResult(values::mod(lhs, rhs));
                else
                    return pushResult(values::pow(lhs, rhs));
            }
            else if constexpr (std::is_same_v<T, op::UnaryMinus>)
            {
                return pushResult(values::negate(act.pop()));
            }
            else if constexpr (std::is_same_v<T, op::Not>)
            {
                act.push(Var::fromInt(act.pop().isTrue() ? 0 : 1));
            }

            // Indexing ----------------------------------------------------------
            else if constexpr (std::is_same_v<T, op::Ref>)
            {
                Var idx = act.pop();
                Var base = act.pop();
                return pushResult(values::index(base, idx));
            }
            else if constexpr (std::is_same_v<T, op::PushRef>)
            {
                return pushResult(values::index(act.peek(1), act.peek(0)));
            }
            else if constexpr (std::is_same_v<T, op::RangeRef>)
            {
                Var to = act.pop();
                Var from = act.pop();
                Var base = act.pop();
                return pushResult(values::range(base, from, to));
            }
            else if constexpr (std::is_same_v<T, op::IndexSet>)
            {
                Var value = act.pop();
                Var idx = act.pop();
                Var base = act.pop();
                return pushResult(values::indexSet(base, idx, value));
            }
            else if constexpr (std::is_same_v<T, op::RangeSet>)
            {
                Var value = act.pop();
                Var to = act.pop();
                Var from = act.pop();
                Var base = act.pop();
                return pushResult(values::rangeSet(base, from, to, value));
            }
            else if constexpr (std::is_same_v<T, op::PutTemp>)
            {
                act.temp = act.peek();
            }
            else if constexpr (std::is_same_v<T, op::PushTemp>)
            {
                act.push(std::move(act.temp));
                act.temp = Var::none();
            }
            else if constexpr (std::is_same_v<T, op::Length>)
            {
                if (o.offset.value >= act.valstack.size())
                    return pushError(ErrorCode::E_RANGE);
                return pushResult(values::length(act.valstack[o.offset.value]));
            }

            // Properties --------------------------------------------------------
            else if constexpr (kIsOneOf<T, op::GetProp, op::PushGetProp>)
            {
                Var prop = std::is_same_v<T, op::GetProp> ? act.pop() : act.peek(0);
                Var obj = std::is_same_v<T, op::GetProp> ? act.pop() : act.peek(1);
                if (!prop.isStr() || !obj.isObj())
                    return pushError(ErrorCode::E_TYPE);
                auto value = world.retrieveProperty(act.permissions(), obj.asObj(), prop.asStr());
                if (!value)
                    return pushError(errorCodeOf(value.error()), value.error().message);
                act.push(std::move(value.value()));
            }
            else if constexpr (std::is_same_v<T, op::PutProp>)
            {
                Var value = act.pop();
                Var prop = act.pop();
                Var obj = act.pop();
                if (!prop.isStr() || !obj.isObj())
                    return pushError(ErrorCode::E_TYPE);
                auto updated =
                    world.updateProperty(act.permissions(), obj.asObj(), prop.asStr(), value);
                if (!updated)
                    return pushError(errorCodeOf(updated.error()), updated.error().message);
                act.push(std::move(value));
            }

            // Calls -------------------------------------------------------------
            else if constexpr (std::is_same_v<T, op::CallVerb>)
            {
                Var args = act.pop();
                Var verb = act.pop();
                Var obj = act.pop();
                if (!args.isList() || !verb.isStr() || !obj.isObj())
                    return pushError(ErrorCode::E_TYPE);
                return result::ContinueVerb{
                    VerbCallRequest{obj.asObj(), verb.asStr(), args.asList(), false}};
            }
            else if constexpr (std::is_same_v<T, op::Pass>)
            {
                Var args = act.pop();
                if (!args.isList())
                    return pushError(ErrorCode::E_TYPE);
                return result::ContinueVerb{VerbCallRequest{
                    act.call.thisObj, act.call.verbName, args.asList(), true}};
            }
            else if constexpr (std::is_same_v<T, op::FuncCall>)
            {
                Var args = act.pop();
                if (!args.isList())
                    return pushError(ErrorCode::E_TYPE);
                return result::ContinueBuiltin{o.id, args.asList()};
            }

            // List construction -------------------------------------------------
            else if constexpr (std::is_same_v<T, op::MkEmptyList>)
            {
                act.push(Var::emptyList());
            }
            else if constexpr (std::is_same_v<T, op::MakeSingletonList>)
            {
                act.push(Var::fromList({act.pop()}));
            }
            else if constexpr (std::is_same_v<T, op::ListAddTail>)
            {
                Var item = act.pop();
                Var list = act.pop();
                if (!list.isList())
                    return pushError(ErrorCode::E_TYPE);
                Var::List items = list.asList();
                items.push_back(std::move(item));
                act.push(Var::fromList(std::move(items)));
            }
            else if constexpr (std::is_same_v<T, op::ListAppend>)
            {
                Var tail = act.pop();
                Var list = act.pop();
                if (!list.isList() || !tail.isList())
                    return pushError(ErrorCode::E_TYPE);
                Var::List items = list.asList();
                items.insert(items.end(), tail.asList().begin(), tail.asList().end());
                act.push(Var::fromList(std::move(items)));
            }
            else if constexpr (std::is_same_v<T, op::CheckListForSplice>)
            {
                if (!act.peek().isList())
                {
                    act.pop();
                    return pushError(ErrorCode::E_TYPE);
                }
            }

            // Scatter -----------------------------------------------------------
            else if constexpr (std::is_same_v<T, op::Scatter>)
            {
                const Var &list = act.peek();
                if (!list.isList())
                {
                    act.pop();
                    act.jump(o.done);
                    return pushError(ErrorCode::E_TYPE);
                }
                const auto &items = list.asList();
                const size_t len = items.size();
                const bool haveRest = o.rest <= o.nargs;
                if (len < o.nreq || (!haveRest && len > o.nargs))
                {
                    act.pop();
                    act.jump(o.done);
                    return pushError(ErrorCode::E_ARGS);
                }
                size_t optAvail = len - o.nreq;
                const size_t nrest = haveRest && len >= o.nargs ? len - o.nargs + 1 : 0;

                size_t where = 0;
                std::optional<compiler::Label> target;
                for (const auto &sl : o.labels)
                {
                    auto &slot = act.env.at(sl.id.id);
                    switch (sl.kind)
                    {
                        case compiler::ScatterKind::Required:
                            slot = items[where++];
                            break;
                        case compiler::ScatterKind::Optional:
                            if (optAvail > 0)
                            {
                                slot = items[where++];
                                --optAvail;
                            }
                            else if (sl.label && !target)
                            {
                                target = sl.label;
                            }
                            break;
                        case compiler::ScatterKind::Rest:
                            slot = Var::fromList(Var::List(items.begin() + where,
                                                           items.begin() + where + nrest));
                            where += nrest;
                            break;
                    }
                }
                act.jump(target ? *target : o.done);
            }

            // Fork --------------------------------------------------------------
            else if constexpr (std::is_same_v<T, op::Fork>)
            {
                Var time = act.pop();
                double delay = 0.0;
                if (time.isInt())
                    delay = static_cast<double>(time.asInt());
                else if (time.isFloat())
                    delay = time.asFloat();
                else
                    return pushError(ErrorCode::E_TYPE);
                if (delay < 0.0 || !std::isfinite(delay))
                    return pushError(ErrorCode::E_INVARG);

                Activation child = act;
                child.forkVector = o.vector.value;
                child.pc = 0;
                child.handlers.clear();
                return result::DispatchFork{ForkRequest{delay, std::move(child), o.id}};
            }

            // Exception handling ------------------------------------------------
            else if constexpr (std::is_same_v<T, op::PushLabel>)
            {
                act.handlers.push_back(
                    {HandlerLabel::Kind::CatchLabel, 0, o.label, act.valstack.size()});
            }
            else if constexpr (std::is_same_v<T, op::Catch>)
            {
                act.handlers.push_back(
                    {HandlerLabel::Kind::Catch, 1, o.label, act.valstack.size()});
                act.push(Var::catchMarker(o.label.id));
            }
            else if constexpr (std::is_same_v<T, op::TryExcept>)
            {
                act.handlers.push_back(
                    {HandlerLabel::Kind::Catch, o.count, compiler::Label{}, act.valstack.size()});
                act.push(Var::catchMarker(0));
            }
            else if constexpr (std::is_same_v<T, op::TryFinally>)
            {
                act.handlers.push_back(
                    {HandlerLabel::Kind::Finally, 0, o.label, act.valstack.size()});
                act.push(Var::finallyMarker(o.label.id));
            }
            else if constexpr (std::is_same_v<T, op::EndCatch>)
            {
                // Stack: [codes, marker, value].
                Var value = act.pop();
                act.pop();
                for (int i = 0; i < 2 && !act.handlers.empty(); ++i)
                    act.handlers.pop_back();
                act.pop();
                act.push(std::move(value));
                act.jump(o.label);
            }
            else if constexpr (std::is_same_v<T, op::EndExcept>)
            {
                // Stack: [codes x n, marker].
                act.pop();
                size_t arms = 0;
                if (!act.handlers.empty())
                {
                    arms = act.handlers.back().count;
                    act.handlers.pop_back();
                }
                for (size_t i = 0; i < arms && !act.handlers.empty(); ++i)
                    act.handlers.pop_back();
                act.valstack.resize(act.valstack.size() - std::min(arms, act.valstack.size()));
                act.jump(o.label);
            }
            else if constexpr (std::is_same_v<T, op::EndFinally>)
            {
                act.pop();
                if (!act.handlers.empty())
                    act.handlers.pop_back();
                auto [payload, code] = encodeFinallyReason(unwind::Fallthrough{});
                act.push(std::move(payload));
                act.push(std::move(code));
            }
            else if constexpr (std::is_same_v<T, op::Continue>)
            {
                Var code = act.pop();
                Var payload = act.pop();
                auto why = decodeFinallyReason(payload, code);
                if (!why)
                    return raise(ErrorCode::E_INVARG, "corrupt finally reason");
                if (std::holds_alternative<unwind::Fallthrough>(*why))
                    return result::More{};
                return unwind(std::move(*why));
            }

            // Exits -------------------------------------------------------------
            else if constexpr (kIsOneOf<T, op::Exit, op::ExitId>)
            {
                return unwind(unwind::Exit{o.stack, o.label});
            }
            else if constexpr (std::is_same_v<T, op::Return>)
            {
                return unwind(unwind::Return{act.pop()});
            }
            else if constexpr (std::is_same_v<T, op::Return0>)
            {
                return unwind(unwind::Return{Var::fromInt(0)});
            }
            else if constexpr (std::is_same_v<T, op::Done>)
            {
                return unwind(unwind::Return{Var::none()});
            }
            else
            {
                static_assert(!sizeof(T *), "unhandled instruction");
            }
            return result::More{};
        },
        instr);
}

} // namespace moo::vm
