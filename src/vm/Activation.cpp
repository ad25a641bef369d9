//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Activation.cpp
// Purpose: Activation construction and environment seeding.
// Key invariants: Global slots hold the call context and type constants;
//                 command slots are #-1 and "" without a command; every
//                 other slot starts unbound.
// Ownership/Lifetime: See Activation.hpp.
// Links: src/compiler/Names.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/Activation.hpp"

#include <algorithm>

namespace moo::vm
{
using compiler::GlobalName;
using values::Var;
using values::VarType;

namespace
{
Var typeConstant(VarType type)
{
    return Var::fromInt(static_cast<int64_t>(type));
}
} // namespace

Activation::Activation(std::shared_ptr<const compiler::Program> prog, VerbCallContext context)
    : program(std::move(prog)), call(std::move(context))
{
    env.assign(std::max<size_t>(program->varNames.width(), compiler::kGlobalNameCount),
               Var::none());

    auto set = [this](GlobalName g, Var v) { env[compiler::globalName(g).id] = std::move(v); };
    set(GlobalName::Player, Var::fromObj(call.player));
    set(GlobalName::This, Var::fromObj(call.thisObj));
    set(GlobalName::Caller, Var::fromObj(call.caller));
    set(GlobalName::Verb, Var::fromStr(call.verbName));
    set(GlobalName::Args, Var::fromList(call.args));
    set(GlobalName::Argstr, Var::fromStr(call.argstr));
    const CommandContext command = call.command.value_or(CommandContext{});
    set(GlobalName::Dobj, Var::fromObj(command.dobj));
    set(GlobalName::Dobjstr, Var::fromStr(command.dobjstr));
    set(GlobalName::Prepstr, Var::fromStr(command.prepstr));
    set(GlobalName::Iobj, Var::fromObj(command.iobj));
    set(GlobalName::Iobjstr, Var::fromStr(command.iobjstr));
    set(GlobalName::Num, typeConstant(VarType::Int));
    set(GlobalName::Obj, typeConstant(VarType::Obj));
    set(GlobalName::Str, typeConstant(VarType::Str));
    set(GlobalName::List, typeConstant(VarType::List));
    set(GlobalName::Err, typeConstant(VarType::Err));
    set(GlobalName::Int, typeConstant(VarType::Int));
    set(GlobalName::Float, typeConstant(VarType::Float));
}

} // namespace moo::vm
