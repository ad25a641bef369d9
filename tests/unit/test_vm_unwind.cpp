//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_vm_unwind.cpp
// Purpose: Error handlers, finally blocks and loop exits.
// Key invariants: Handlers are consulted innermost first; finally blocks run
//                 on every way out of their try body.
// Ownership/Lifetime: Each test owns its world and host.
// Links: src/vm/Unwind.cpp
//
//===----------------------------------------------------------------------===//

#include "MooTestSupport.hpp"

using namespace moo;
using namespace moo::test;

namespace
{
Stmt::TryExcept tryExcept(std::vector<Stmt> body, Stmt::ExceptArm arm)
{
    Stmt::TryExcept te;
    te.body = std::move(body);
    te.excepts.push_back(std::move(arm));
    return te;
}

Stmt when(ProgramBuilder &b, Expr condition, std::vector<Stmt> then)
{
    Stmt::Cond cond;
    cond.arms.push_back({std::move(condition), std::move(then)});
    return b.stmt(std::move(cond));
}

Expr increment(ProgramBuilder &b, std::string_view var, Expr by)
{
    return assign(b.var(var), bin(BinaryOp::Add, b.var(var), std::move(by)));
}
} // namespace

TEST(VMUnwindTest, ExceptArmCatchesMatchingError)
{
    ProgramBuilder b;
    auto raiser = b.expr(b.var("undefined"));
    auto handler = b.ret(num(666));
    Stmt::ExceptArm arm{std::nullopt, codes({ErrorCode::E_VARNF}), body(std::move(handler))};
    b.add(b.stmt(tryExcept(body(std::move(raiser)), std::move(arm))));
    b.add(b.ret(num(333)));
    EXPECT_EQ(runToValue(b), Var::fromInt(666));
}

TEST(VMUnwindTest, CaughtValueDescribesTheError)
{
    ProgramBuilder b;
    auto raiser = b.expr(call("raise", args(err(ErrorCode::E_PERM), str("nope"), num(3))));
    auto handler = b.ret(list(args(index(b.var("e"), num(1)), index(b.var("e"), num(2)),
                                   index(b.var("e"), num(3)))));
    Stmt::ExceptArm arm{b.name("e"), anyCode(), body(std::move(handler))};
    b.add(b.stmt(tryExcept(body(std::move(raiser)), std::move(arm))));
    Var::List expected{Var::fromErr(ErrorCode::E_PERM), Var::fromStr("nope"), Var::fromInt(3)};
    EXPECT_EQ(runToValue(b), Var::fromList(expected));
}

TEST(VMUnwindTest, UnmatchedArmFallsToOuterHandler)
{
    ProgramBuilder b;
    auto raiser = b.expr(bin(BinaryOp::Div, num(1), num(0)));
    auto innerHandler = b.ret(str("inner"));
    auto inner = b.stmt(tryExcept(
        body(std::move(raiser)),
        {std::nullopt, codes({ErrorCode::E_PERM}), body(std::move(innerHandler))}));
    auto outerHandler = b.ret(str("outer"));
    b.add(b.stmt(tryExcept(body(std::move(inner)),
                           {std::nullopt, anyCode(), body(std::move(outerHandler))})));
    EXPECT_EQ(runToValue(b), Var::fromStr("outer"));
}

TEST(VMUnwindTest, FinallyRunsOnFallthrough)
{
    ProgramBuilder b;
    b.add(b.expr(assign(b.var("x"), num(0))));
    auto tried = b.expr(assign(b.var("x"), num(1)));
    auto cleanup = b.expr(increment(b, "x", num(10)));
    b.add(b.stmt(Stmt::TryFinally{body(std::move(tried)), body(std::move(cleanup))}));
    b.add(b.ret(b.var("x")));
    EXPECT_EQ(runToValue(b), Var::fromInt(11));
}

TEST(VMUnwindTest, FinallyRunsOnReturn)
{
    ProgramBuilder b;
    auto tried = b.ret(num(1));
    auto cleanup = b.expr(assign(prop(b.var("this"), "log"), str("ran")));
    b.add(b.stmt(Stmt::TryFinally{body(std::move(tried)), body(std::move(cleanup))}));
    b.add(b.ret(num(2)));

    InMemoryWorldState world;
    world.object(1).properties["log"] = Var::fromStr("");
    EXPECT_EQ(completedValue(runProgram(b.compile(), world)), Var::fromInt(1));
    EXPECT_EQ(world.object(1).properties["log"], Var::fromStr("ran"));
}

TEST(VMUnwindTest, FinallyRunsWhileErrorPropagates)
{
    ProgramBuilder b;
    auto tried = b.expr(b.var("undefined"));
    auto cleanup = b.expr(assign(prop(b.var("this"), "log"), str("ran")));
    b.add(b.stmt(Stmt::TryFinally{body(std::move(tried)), body(std::move(cleanup))}));

    InMemoryWorldState world;
    world.object(1).properties["log"] = Var::fromStr("");
    const auto response = runProgram(b.compile(), world);
    const auto *e = std::get_if<vm::host::Exception>(&response);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->exception.code, ErrorCode::E_VARNF);
    EXPECT_EQ(world.object(1).properties["log"], Var::fromStr("ran"));
}

TEST(VMUnwindTest, BreakRunsEnclosingFinally)
{
    ProgramBuilder b;
    b.add(b.expr(assign(b.var("x"), num(0))));
    auto brk = b.stmt(Stmt::Break{});
    auto cleanup = b.expr(assign(b.var("x"), num(7)));
    auto guarded = b.stmt(Stmt::TryFinally{body(std::move(brk)), body(std::move(cleanup))});
    b.add(b.stmt(Stmt::While{std::nullopt, num(1), body(std::move(guarded))}));
    b.add(b.ret(b.var("x")));
    EXPECT_EQ(runToValue(b), Var::fromInt(7));
}

TEST(VMUnwindTest, LabelledBreakLeavesOuterLoop)
{
    ProgramBuilder b;
    const Name outer = b.name("outer");
    const Name i = b.name("i");
    b.add(b.expr(assign(b.var("s"), num(0))));
    auto stop = when(b, bin(BinaryOp::Eq, b.var("i"), num(3)), body(b.stmt(Stmt::Break{outer})));
    auto add = b.expr(increment(b, "s", b.var("i")));
    auto inner = b.stmt(Stmt::ForRange{i, num(1), num(10), body(std::move(stop), std::move(add))});
    b.add(b.stmt(Stmt::While{outer, num(1), body(std::move(inner))}));
    b.add(b.ret(b.var("s")));
    EXPECT_EQ(runToValue(b), Var::fromInt(3));
}

TEST(VMUnwindTest, ContinueSkipsRestOfBody)
{
    ProgramBuilder b;
    const Name i = b.name("i");
    b.add(b.expr(assign(b.var("s"), num(0))));
    auto skip = when(b, bin(BinaryOp::Eq, b.var("i"), num(2)), body(b.stmt(Stmt::Continue{i})));
    auto add = b.expr(increment(b, "s", b.var("i")));
    b.add(b.stmt(Stmt::ForRange{i, num(1), num(5), body(std::move(skip), std::move(add))}));
    b.add(b.ret(b.var("s")));
    EXPECT_EQ(runToValue(b), Var::fromInt(13));
}

TEST(VMUnwindTest, CatchExpressionUsesDefault)
{
    ProgramBuilder b;
    b.add(b.ret(list(args(catchExpr(b.var("undefined"), codes({ErrorCode::E_VARNF}), num(5)),
                          catchExpr(b.var("undefined"), anyCode())))));
    Var::List expected{Var::fromInt(5), Var::fromErr(ErrorCode::E_VARNF)};
    EXPECT_EQ(runToValue(b), Var::fromList(expected));
}

TEST(VMUnwindTest, CatchExpressionIgnoresOtherCodes)
{
    ProgramBuilder b;
    b.add(b.ret(catchExpr(bin(BinaryOp::Div, num(1), num(0)), codes({ErrorCode::E_VARNF}),
                          num(5))));
    InMemoryWorldState world;
    const auto response = runProgram(b.compile(), world);
    const auto *e = std::get_if<vm::host::Exception>(&response);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->exception.code, ErrorCode::E_DIV);
}

TEST(VMUnwindTest, ErrorInCalledVerbPropagatesToCaller)
{
    ProgramBuilder inner;
    inner.add(inner.ret(inner.var("undefined")));

    ProgramBuilder b;
    b.add(b.ret(verb(b.var("this"), "inner")));

    InMemoryWorldState world;
    world.object(1).verbs["inner"] = inner.compile();
    const auto response = runProgram(b.compile(), world);
    const auto *e = std::get_if<vm::host::Exception>(&response);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->exception.code, ErrorCode::E_VARNF);
    ASSERT_EQ(e->exception.backtrace.size(), 3u);
    EXPECT_EQ(e->exception.backtrace[0], Var::fromStr("#1:inner, line 1:  Variable not found"));
    EXPECT_EQ(e->exception.backtrace[1], Var::fromStr("... called from #1:test, line 1"));
    EXPECT_EQ(e->exception.stack.size(), 2u);
}

TEST(VMUnwindTest, CallerHandlerCatchesVerbError)
{
    ProgramBuilder inner;
    inner.add(inner.ret(inner.var("undefined")));

    ProgramBuilder b;
    auto tried = b.ret(verb(b.var("this"), "inner"));
    auto handler = b.ret(index(b.var("e"), num(1)));
    Stmt::ExceptArm arm{b.name("e"), anyCode(), body(std::move(handler))};
    b.add(b.stmt(tryExcept(body(std::move(tried)), std::move(arm))));

    InMemoryWorldState world;
    world.object(1).verbs["inner"] = inner.compile();
    EXPECT_EQ(completedValue(runProgram(b.compile(), world)), Var::fromErr(ErrorCode::E_VARNF));
}

TEST(VMUnwindTest, FinallyReturnOverridesPendingError)
{
    ProgramBuilder b;
    auto tried = b.expr(b.var("a"));
    auto cleanup = b.ret(num(666));
    b.add(b.stmt(Stmt::TryFinally{body(std::move(tried)), body(std::move(cleanup))}));
    b.add(b.ret(num(333)));
    EXPECT_EQ(runToValue(b), Var::fromInt(666));
}

TEST(VMUnwindTest, AbortSkipsFinallyBlocks)
{
    ProgramBuilder b;
    auto spin = b.stmt(Stmt::While{std::nullopt, num(1), {}});
    auto cleanup = b.expr(assign(prop(b.var("this"), "log"), str("ran")));
    b.add(b.stmt(Stmt::TryFinally{body(std::move(spin)), body(std::move(cleanup))}));

    InMemoryWorldState world;
    world.object(1).properties["log"] = Var::fromStr("");
    vm::HostConfig config;
    config.maxTicks = 50;
    const auto response = runProgram(b.compile(), world, config);
    EXPECT_TRUE(std::holds_alternative<vm::host::AbortLimit>(response));
    EXPECT_EQ(world.object(1).properties["log"], Var::fromStr(""));
}
