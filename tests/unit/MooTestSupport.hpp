//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/MooTestSupport.hpp
// Purpose: Shared helpers for unit tests: AST construction, an in-memory
//          world, and a compile-and-run driver.
// Key invariants: Statements built through ProgramBuilder get increasing
//                 line numbers in construction order.
// Ownership/Lifetime: Helpers return values; the world owns its programs.
// Links: src/compiler/Ast.hpp, include/moo/vm/VMHost.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "compiler/Ast.hpp"
#include "compiler/Codegen.hpp"
#include "moo/vm/VMHost.hpp"
#include "vm/WorldState.hpp"

#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace moo::test
{
using compiler::Arg;
using compiler::ArgKind;
using compiler::BinaryOp;
using compiler::CatchCodes;
using compiler::Expr;
using compiler::Name;
using compiler::Stmt;
using values::ErrorCode;
using values::Var;

// Expressions ----------------------------------------------------------------

inline Expr val(Var v)
{
    return Expr{Expr::Value{std::move(v)}};
}

inline Expr num(int64_t v)
{
    return val(Var::fromInt(v));
}

inline Expr str(std::string s)
{
    return val(Var::fromStr(std::move(s)));
}

inline Expr obj(values::Objid id)
{
    return val(Var::fromObj(id));
}

inline Expr err(ErrorCode code)
{
    return val(Var::fromErr(code));
}

inline Expr id(Name n)
{
    return Expr{Expr::Id{n}};
}

inline Expr bin(BinaryOp op, Expr lhs, Expr rhs)
{
    return Expr{Expr::Binary{op, std::move(lhs), std::move(rhs)}};
}

inline Expr assign(Expr left, Expr right)
{
    return Expr{Expr::Assign{std::move(left), std::move(right)}};
}

inline Expr index(Expr base, Expr idx)
{
    return Expr{Expr::Index{std::move(base), std::move(idx)}};
}

inline Expr range(Expr base, Expr from, Expr to)
{
    return Expr{Expr::Range{std::move(base), std::move(from), std::move(to)}};
}

inline Expr length()
{
    return Expr{Expr::Length{}};
}

inline Arg arg(Expr e)
{
    return Arg{ArgKind::Normal, std::move(e)};
}

inline Arg splice(Expr e)
{
    return Arg{ArgKind::Splice, std::move(e)};
}

inline std::vector<Arg> args()
{
    return {};
}

template <typename... Es> std::vector<Arg> args(Expr first, Es... rest)
{
    std::vector<Arg> out;
    out.push_back(arg(std::move(first)));
    (out.push_back(arg(std::move(rest))), ...);
    return out;
}

inline Expr list(std::vector<Arg> items)
{
    return Expr{Expr::List{std::move(items)}};
}

inline Expr call(std::string fn, std::vector<Arg> a = {})
{
    return Expr{Expr::Call{std::move(fn), std::move(a)}};
}

inline Expr prop(Expr location, std::string name)
{
    return Expr{Expr::Prop{std::move(location), str(std::move(name))}};
}

inline Expr verb(Expr location, std::string name, std::vector<Arg> a = {})
{
    return Expr{Expr::Verb{std::move(location), str(std::move(name)), std::move(a)}};
}

inline Expr pass(std::vector<Arg> a = {})
{
    return Expr{Expr::Pass{std::move(a)}};
}

inline CatchCodes anyCode()
{
    return CatchCodes{true, {}};
}

inline CatchCodes codes(std::vector<ErrorCode> list)
{
    CatchCodes c;
    for (auto code : list)
        c.codes.push_back(arg(err(code)));
    return c;
}

inline Expr catchExpr(Expr trye, CatchCodes c, std::optional<Expr> except = std::nullopt)
{
    Expr::Catch node{std::move(trye), std::move(c), std::nullopt};
    if (except)
        node.except = compiler::Box<Expr>(std::move(*except));
    return Expr{std::move(node)};
}

// Statements ------------------------------------------------------------------

/// @brief Collects names and statements for one verb body.
class ProgramBuilder
{
  public:
    Name name(std::string_view ident)
    {
        return names_.findOrAdd(ident);
    }

    Expr var(std::string_view ident)
    {
        return id(name(ident));
    }

    /// @brief Wrap @p node in a statement on the next line.
    Stmt stmt(Stmt::Node node)
    {
        return Stmt{std::move(node), nextLine_++};
    }

    Stmt expr(Expr e)
    {
        return stmt(Stmt::ExprStmt{std::move(e)});
    }

    Stmt ret(Expr e)
    {
        return stmt(Stmt::Return{std::move(e)});
    }

    Stmt ret0()
    {
        return stmt(Stmt::Return{});
    }

    /// @brief Append @p s to the top-level statement list.
    ProgramBuilder &add(Stmt s)
    {
        stmts_.push_back(std::move(s));
        return *this;
    }

    compiler::ParsedProgram parsed() const
    {
        return compiler::ParsedProgram{names_, stmts_};
    }

    /// @brief Compile, failing the current test on a compile error.
    std::shared_ptr<const compiler::Program> compile() const
    {
        auto program = compiler::compile(parsed());
        EXPECT_TRUE(program) << (program ? "" : program.error().message);
        if (!program)
            return nullptr;
        return std::make_shared<const compiler::Program>(std::move(program.value()));
    }

  private:
    compiler::Names names_;
    std::vector<Stmt> stmts_;
    size_t nextLine_ = 1;
};

template <typename... Ss> std::vector<Stmt> body(Ss... s)
{
    std::vector<Stmt> out;
    (out.push_back(std::move(s)), ...);
    return out;
}

// World -----------------------------------------------------------------------

/// @brief Objects with a parent, properties and verbs, all readable by anyone.
class InMemoryWorldState : public vm::WorldState
{
  public:
    struct Object
    {
        values::Objid parent = values::kNothing;
        std::map<std::string, Var> properties;
        std::map<std::string, std::shared_ptr<const compiler::Program>> verbs;
        values::Objid owner = 2;
    };

    Object &object(values::Objid id)
    {
        return objects_[id];
    }

    support::Expected<Var> retrieveProperty(values::Objid, values::Objid obj,
                                            const std::string &name) override
    {
        auto it = objects_.find(obj);
        if (it == objects_.end())
            return vm::worldStateError(vm::WorldStateError::ObjectNotFound, "no such object");
        auto prop = it->second.properties.find(name);
        if (prop == it->second.properties.end())
            return vm::worldStateError(vm::WorldStateError::PropertyNotFound, "no such property");
        return prop->second;
    }

    support::Expected<void> updateProperty(values::Objid,
                                           values::Objid obj,
                                           const std::string &name,
                                           const Var &value) override
    {
        auto it = objects_.find(obj);
        if (it == objects_.end())
            return vm::worldStateError(vm::WorldStateError::ObjectNotFound, "no such object");
        auto prop = it->second.properties.find(name);
        if (prop == it->second.properties.end())
            return vm::worldStateError(vm::WorldStateError::PropertyNotFound, "no such property");
        prop->second = value;
        return {};
    }

    support::Expected<vm::ResolvedVerb> findMethodVerb(values::Objid,
                                                       values::Objid obj,
                                                       const std::string &name) override
    {
        for (values::Objid at = obj; at != values::kNothing;)
        {
            auto it = objects_.find(at);
            if (it == objects_.end())
                return vm::worldStateError(vm::WorldStateError::ObjectNotFound, "no such object");
            auto v = it->second.verbs.find(name);
            if (v != it->second.verbs.end())
                return vm::ResolvedVerb{at, it->second.owner, {name}, v->second, true};
            at = it->second.parent;
        }
        return vm::worldStateError(vm::WorldStateError::VerbNotFound, "verb not found: " + name);
    }

    support::Expected<values::Objid> parentOf(values::Objid, values::Objid obj) override
    {
        auto it = objects_.find(obj);
        if (it == objects_.end())
            return vm::worldStateError(vm::WorldStateError::ObjectNotFound, "no such object");
        return it->second.parent;
    }

  private:
    std::map<values::Objid, Object> objects_;
};

// Running ---------------------------------------------------------------------

inline vm::VerbCallContext testCall(std::string verbName = "test")
{
    vm::VerbCallContext call;
    call.verbName = std::move(verbName);
    call.thisObj = 1;
    call.player = 3;
    call.caller = 3;
    call.definer = 1;
    call.owner = 2;
    return call;
}

/// @brief Run @p program as task 1 until it needs the scheduler.
inline vm::HostResponse runProgram(std::shared_ptr<const compiler::Program> program,
                                   vm::WorldState &world,
                                   vm::HostConfig config = {})
{
    vm::VMHost host(std::move(config));
    host.startExecution(1, testCall(), std::move(program));
    return host.execInterpreter(world);
}

/// @brief Value the task completed with; fails the test for any other response.
inline Var completedValue(const vm::HostResponse &response)
{
    const auto *done = std::get_if<vm::host::Complete>(&response);
    EXPECT_NE(done, nullptr) << "task did not complete; response index " << response.index();
    return done ? done->value : Var::none();
}

/// @brief Compile and run @p b, returning its completion value.
inline Var runToValue(const ProgramBuilder &b)
{
    InMemoryWorldState world;
    auto program = b.compile();
    if (!program)
        return Var::none();
    return completedValue(runProgram(program, world));
}

} // namespace moo::test
