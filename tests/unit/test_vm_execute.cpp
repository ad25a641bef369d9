//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_vm_execute.cpp
// Purpose: End-to-end execution of compiled programs through the host.
// Key invariants: Results match MOO semantics for expressions, control flow,
//                 property access and uncaught errors.
// Ownership/Lifetime: Each test owns its world and host.
// Links: src/vm/VMExecute.cpp, src/vm/Unwind.cpp
//
//===----------------------------------------------------------------------===//

#include "MooTestSupport.hpp"

#include <limits>

using namespace moo;
using namespace moo::test;

namespace
{
Var listOf(std::initializer_list<int64_t> items)
{
    Var::List out;
    for (auto i : items)
        out.push_back(Var::fromInt(i));
    return Var::fromList(std::move(out));
}

const vm::Exception &exceptionOf(const vm::HostResponse &response)
{
    const auto *e = std::get_if<vm::host::Exception>(&response);
    EXPECT_NE(e, nullptr);
    static const vm::Exception none;
    return e ? e->exception : none;
}
} // namespace

TEST(VMExecuteTest, ArithmeticAndVariables)
{
    ProgramBuilder b;
    b.add(b.expr(assign(b.var("a"), bin(BinaryOp::Add, num(1), num(2)))));
    b.add(b.ret(b.var("a")));
    EXPECT_EQ(runToValue(b), Var::fromInt(3));
}

TEST(VMExecuteTest, ForListSumsElements)
{
    ProgramBuilder b;
    const Name x = b.name("x");
    b.add(b.expr(assign(b.var("s"), num(0))));
    b.add(b.stmt(Stmt::ForList{x,
                               list(args(num(1), num(2), num(3))),
                               body(b.expr(assign(b.var("s"), bin(BinaryOp::Add, b.var("s"),
                                                                  b.var("x")))))}));
    b.add(b.ret(b.var("s")));
    EXPECT_EQ(runToValue(b), Var::fromInt(6));
}

TEST(VMExecuteTest, ForRangeIsInclusive)
{
    ProgramBuilder b;
    const Name i = b.name("i");
    b.add(b.expr(assign(b.var("s"), num(0))));
    b.add(b.stmt(Stmt::ForRange{
        i, num(1), num(4), body(b.expr(assign(b.var("s"), bin(BinaryOp::Add, b.var("s"),
                                                              b.var("i")))))}));
    b.add(b.ret(b.var("s")));
    EXPECT_EQ(runToValue(b), Var::fromInt(10));
}

TEST(VMExecuteTest, ForRangeEndsAtLargestInteger)
{
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    ProgramBuilder b;
    const Name i = b.name("i");
    b.add(b.expr(assign(b.var("n"), num(0))));
    b.add(b.stmt(Stmt::ForRange{
        i, num(kMax - 1), num(kMax),
        body(b.expr(assign(b.var("n"), bin(BinaryOp::Add, b.var("n"), num(1)))))}));
    b.add(b.ret(list(args(b.var("n"), b.var("i")))));
    EXPECT_EQ(runToValue(b), Var::fromList({Var::fromInt(2), Var::fromInt(kMax)}));
}

TEST(VMExecuteTest, WhileLoopRunsUntilFalse)
{
    ProgramBuilder b;
    b.add(b.expr(assign(b.var("i"), num(0))));
    b.add(b.stmt(Stmt::While{std::nullopt,
                             bin(BinaryOp::Lt, b.var("i"), num(5)),
                             body(b.expr(assign(b.var("i"), bin(BinaryOp::Add, b.var("i"),
                                                                num(1)))))}));
    b.add(b.ret(b.var("i")));
    EXPECT_EQ(runToValue(b), Var::fromInt(5));
}

TEST(VMExecuteTest, ConditionalPicksMatchingArm)
{
    ProgramBuilder b;
    b.add(b.expr(assign(b.var("x"), num(7))));
    Stmt::Cond cond;
    cond.arms.push_back({bin(BinaryOp::Lt, b.var("x"), num(5)), body(b.ret(str("small")))});
    cond.arms.push_back({bin(BinaryOp::Lt, b.var("x"), num(10)), body(b.ret(str("medium")))});
    cond.otherwise = body(b.ret(str("large")));
    b.add(b.stmt(std::move(cond)));
    EXPECT_EQ(runToValue(b), Var::fromStr("medium"));
}

TEST(VMExecuteTest, IndexingIsOneBased)
{
    ProgramBuilder b;
    b.add(b.ret(index(list(args(num(1), num(2), num(3))), num(1))));
    EXPECT_EQ(runToValue(b), Var::fromInt(1));
}

TEST(VMExecuteTest, LengthInsideIndexAndRange)
{
    ProgramBuilder b;
    b.add(b.expr(assign(b.var("l"), list(args(num(4), num(5), num(6))))));
    b.add(b.ret(list(args(index(b.var("l"), length()), range(str("abc"), num(2), length())))));
    Var::List expected{Var::fromInt(6), Var::fromStr("bc")};
    EXPECT_EQ(runToValue(b), Var::fromList(expected));
}

TEST(VMExecuteTest, RangeAssignmentReplacesSubstring)
{
    ProgramBuilder b;
    b.add(b.expr(assign(b.var("s"), str("12345"))));
    b.add(b.expr(assign(range(b.var("s"), num(2), num(3)), str(""))));
    b.add(b.ret(b.var("s")));
    EXPECT_EQ(runToValue(b), Var::fromStr("145"));
}

TEST(VMExecuteTest, NestedIndexAssignment)
{
    ProgramBuilder b;
    b.add(b.expr(assign(b.var("l"), list(args(list(args(num(1), num(2))), num(3))))));
    b.add(b.expr(assign(index(index(b.var("l"), num(1)), num(2)), num(9))));
    b.add(b.ret(b.var("l")));
    Var::List expected{listOf({1, 9}), Var::fromInt(3)};
    EXPECT_EQ(runToValue(b), Var::fromList(expected));
}

TEST(VMExecuteTest, ShortCircuitSkipsRightOperand)
{
    ProgramBuilder b;
    b.add(b.ret(list(args(Expr{Expr::And{num(0), b.var("unset")}},
                          Expr{Expr::Or{num(1), b.var("unset")}},
                          Expr{Expr::Cond{num(0), num(1), num(2)}}))));
    EXPECT_EQ(runToValue(b), listOf({0, 1, 2}));
}

TEST(VMExecuteTest, ReturnWithoutValueYieldsZero)
{
    ProgramBuilder b;
    b.add(b.ret0());
    EXPECT_EQ(runToValue(b), Var::fromInt(0));
}

TEST(VMExecuteTest, FallingOffTheEndYieldsNone)
{
    ProgramBuilder b;
    b.add(b.expr(num(1)));
    EXPECT_TRUE(runToValue(b).isNone());
}

TEST(VMExecuteTest, BuiltinVariablesAreBound)
{
    ProgramBuilder b;
    b.add(b.ret(list(args(b.var("this"), b.var("player"), b.var("verb"), b.var("STR"),
                          b.var("dobj"), b.var("dobjstr")))));
    Var::List expected{Var::fromObj(1),
                       Var::fromObj(3),
                       Var::fromStr("test"),
                       Var::fromInt(static_cast<int64_t>(values::VarType::Str)),
                       Var::fromObj(values::kNothing),
                       Var::fromStr("")};
    EXPECT_EQ(runToValue(b), Var::fromList(expected));
}

TEST(VMExecuteTest, CommandVariablesComeFromTheParsedCommand)
{
    ProgramBuilder b;
    b.add(b.ret(list(args(b.var("argstr"), b.var("dobj"), b.var("dobjstr"), b.var("prepstr"),
                          b.var("iobj"), b.var("iobjstr")))));

    auto call = testCall("put");
    call.argstr = "ball in box";
    call.command = vm::CommandContext{7, "ball", "in", 8, "box"};
    InMemoryWorldState world;
    vm::VMHost host;
    host.startExecution(1, std::move(call), b.compile());

    Var::List expected{Var::fromStr("ball in box"),
                       Var::fromObj(7),
                       Var::fromStr("ball"),
                       Var::fromStr("in"),
                       Var::fromObj(8),
                       Var::fromStr("box")};
    EXPECT_EQ(completedValue(host.execInterpreter(world)), Var::fromList(expected));
}

TEST(VMExecuteTest, PropertiesReadAndWriteThroughWorld)
{
    ProgramBuilder b;
    b.add(b.expr(assign(prop(b.var("this"), "count"),
                        bin(BinaryOp::Add, prop(b.var("this"), "count"), num(1)))));
    b.add(b.ret(prop(b.var("this"), "count")));

    InMemoryWorldState world;
    world.object(1).properties["count"] = Var::fromInt(41);
    EXPECT_EQ(completedValue(runProgram(b.compile(), world)), Var::fromInt(42));
    EXPECT_EQ(world.object(1).properties["count"], Var::fromInt(42));
}

TEST(VMExecuteTest, MissingPropertyRaisesPropnf)
{
    ProgramBuilder b;
    b.add(b.ret(prop(b.var("this"), "missing")));
    InMemoryWorldState world;
    world.object(1);
    const auto response = runProgram(b.compile(), world);
    EXPECT_EQ(exceptionOf(response).code, ErrorCode::E_PROPNF);
}

TEST(VMExecuteTest, UncaughtErrorCarriesBacktrace)
{
    ProgramBuilder b;
    b.add(b.expr(assign(b.var("a"), num(1))));
    b.add(b.ret(b.var("x")));
    InMemoryWorldState world;
    const auto response = runProgram(b.compile(), world);
    const auto &e = exceptionOf(response);
    EXPECT_EQ(e.code, ErrorCode::E_VARNF);
    EXPECT_EQ(e.message, "Variable not found");
    ASSERT_EQ(e.backtrace.size(), 2u);
    EXPECT_EQ(e.backtrace[0], Var::fromStr("#1:test, line 2:  Variable not found"));
    EXPECT_EQ(e.backtrace[1], Var::fromStr("(End of traceback)"));
    ASSERT_EQ(e.stack.size(), 1u);
}

TEST(VMExecuteTest, DivisionByZeroRaises)
{
    ProgramBuilder b;
    b.add(b.ret(bin(BinaryOp::Div, num(1), num(0))));
    InMemoryWorldState world;
    EXPECT_EQ(exceptionOf(runProgram(b.compile(), world)).code, ErrorCode::E_DIV);
}

TEST(VMExecuteTest, NonDebugVerbContinuesWithErrorValue)
{
    ProgramBuilder b;
    b.add(b.expr(assign(b.var("x"), b.var("y"))));
    b.add(b.ret(list(args(b.var("x"), bin(BinaryOp::Div, num(1), num(0))))));

    InMemoryWorldState world;
    vm::VMHost host;
    auto call = testCall();
    call.debug = false;
    host.startExecution(1, std::move(call), b.compile());
    Var::List expected{Var::fromErr(ErrorCode::E_VARNF), Var::fromErr(ErrorCode::E_DIV)};
    EXPECT_EQ(completedValue(host.execInterpreter(world)), Var::fromList(expected));
}

TEST(VMExecuteTest, OutOfBoundsIndexRaisesRange)
{
    ProgramBuilder b;
    b.add(b.ret(index(list(args(num(1), num(2), num(3))), num(5))));
    InMemoryWorldState world;
    EXPECT_EQ(exceptionOf(runProgram(b.compile(), world)).code, ErrorCode::E_RANGE);
}
