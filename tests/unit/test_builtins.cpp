//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_builtins.cpp
// Purpose: Builtin function argument validation and results.
// Key invariants: Arity and type checks run before any builtin body;
//                 registered but unimplemented builtins raise E_INVIND.
// Ownership/Lifetime: Test-local programs.
// Links: src/vm/BuiltinFunctions.cpp, src/compiler/Builtins.hpp
//
//===----------------------------------------------------------------------===//

#include "MooTestSupport.hpp"

using namespace moo;
using namespace moo::test;

namespace
{
/// Run `return `fn(args) ! ANY';` so raised errors come back as values.
Var evalCall(std::string fn, std::vector<Arg> a = {})
{
    ProgramBuilder b;
    b.add(b.ret(catchExpr(call(std::move(fn), std::move(a)), anyCode())));
    return runToValue(b);
}

Var ints(std::initializer_list<int64_t> items)
{
    Var::List out;
    for (auto i : items)
        out.push_back(Var::fromInt(i));
    return Var::fromList(std::move(out));
}

Expr intList(std::initializer_list<int64_t> items)
{
    std::vector<Arg> out;
    for (auto i : items)
        out.push_back(arg(num(i)));
    return list(std::move(out));
}

Var errVal(ErrorCode code)
{
    return Var::fromErr(code);
}
} // namespace

TEST(BuiltinsTest, ArityAndTypeAreChecked)
{
    EXPECT_EQ(evalCall("typeof"), errVal(ErrorCode::E_ARGS));
    EXPECT_EQ(evalCall("typeof", args(num(1), num(2))), errVal(ErrorCode::E_ARGS));
    EXPECT_EQ(evalCall("listappend", args(num(1), num(2))), errVal(ErrorCode::E_TYPE));
    EXPECT_EQ(evalCall("min", args(str("a"))), errVal(ErrorCode::E_TYPE));
    EXPECT_EQ(evalCall("caller_perms", args(num(1))), errVal(ErrorCode::E_ARGS));
}

TEST(BuiltinsTest, UnimplementedBuiltinRaisesInvind)
{
    EXPECT_EQ(evalCall("notify", args(obj(1), str("hello"))), errVal(ErrorCode::E_INVIND));
    EXPECT_EQ(evalCall("time"), errVal(ErrorCode::E_INVIND));

    ProgramBuilder b;
    auto tried = b.expr(call("time"));
    auto handler = b.ret(list(args(index(b.var("e"), num(2)), index(b.var("e"), num(3)))));
    Stmt::TryExcept te;
    te.body = body(std::move(tried));
    te.excepts.push_back({b.name("e"), anyCode(), body(std::move(handler))});
    b.add(b.stmt(std::move(te)));
    Var::List expected{Var::fromStr("Builtin time is not implemented"), Var::fromStr("time")};
    EXPECT_EQ(runToValue(b), Var::fromList(expected));
}

TEST(BuiltinsTest, TypeofAndLength)
{
    using values::VarType;
    auto code = [](VarType t) { return Var::fromInt(static_cast<int64_t>(t)); };
    EXPECT_EQ(evalCall("typeof", args(num(1))), code(VarType::Int));
    EXPECT_EQ(evalCall("typeof", args(str("x"))), code(VarType::Str));
    EXPECT_EQ(evalCall("typeof", args(obj(4))), code(VarType::Obj));
    EXPECT_EQ(evalCall("typeof", args(list({}))), code(VarType::List));
    EXPECT_EQ(evalCall("typeof", args(err(ErrorCode::E_PERM))), code(VarType::Err));
    EXPECT_EQ(evalCall("typeof", args(val(Var::fromFloat(1.5)))), code(VarType::Float));

    EXPECT_EQ(evalCall("length", args(str("abc"))), Var::fromInt(3));
    EXPECT_EQ(evalCall("length", args(intList({1, 2}))), Var::fromInt(2));
    EXPECT_EQ(evalCall("length", args(num(1))), errVal(ErrorCode::E_TYPE));
}

TEST(BuiltinsTest, StringConversions)
{
    EXPECT_EQ(evalCall("tostr", args(num(1), str("a"), obj(2), intList({1}),
                                     err(ErrorCode::E_PERM))),
              Var::fromStr("1a#2{list}Permission denied"));
    EXPECT_EQ(evalCall("tostr"), Var::fromStr(""));
    EXPECT_EQ(evalCall("toliteral", args(list(args(num(1), str("a"))))),
              Var::fromStr("{1, \"a\"}"));
}

TEST(BuiltinsTest, NumericConversions)
{
    EXPECT_EQ(evalCall("toint", args(str("42abc"))), Var::fromInt(42));
    EXPECT_EQ(evalCall("toint", args(str("abc"))), Var::fromInt(0));
    EXPECT_EQ(evalCall("toint", args(val(Var::fromFloat(-3.9)))), Var::fromInt(-3));
    EXPECT_EQ(evalCall("toint", args(obj(5))), Var::fromInt(5));
    EXPECT_EQ(evalCall("toint", args(list({}))), errVal(ErrorCode::E_TYPE));

    EXPECT_EQ(evalCall("tofloat", args(str("2.5"))), Var::fromFloat(2.5));
    EXPECT_EQ(evalCall("tofloat", args(num(2))), Var::fromFloat(2.0));
    EXPECT_EQ(evalCall("tofloat", args(str("zz"))), errVal(ErrorCode::E_INVARG));

    EXPECT_EQ(evalCall("toobj", args(str("#12"))), Var::fromObj(12));
    EXPECT_EQ(evalCall("toobj", args(str("7"))), Var::fromObj(7));
    EXPECT_EQ(evalCall("toobj", args(num(-1))), Var::fromObj(-1));
    EXPECT_EQ(evalCall("toobj", args(str("box"))), errVal(ErrorCode::E_INVARG));
}

TEST(BuiltinsTest, EqualityIsExact)
{
    EXPECT_EQ(evalCall("equal", args(str("a"), str("A"))), Var::fromInt(0));
    EXPECT_EQ(evalCall("equal", args(intList({1, 2}), intList({1, 2}))), Var::fromInt(1));
    EXPECT_EQ(evalCall("is_member", args(num(2), intList({1, 2, 3}))), Var::fromInt(2));
    EXPECT_EQ(evalCall("is_member", args(str("A"), list(args(str("a"))))), Var::fromInt(0));
}

TEST(BuiltinsTest, ListEditing)
{
    EXPECT_EQ(evalCall("listappend", args(intList({1, 2}), num(3))), ints({1, 2, 3}));
    EXPECT_EQ(evalCall("listappend", args(intList({1, 2}), num(9), num(1))), ints({1, 9, 2}));
    EXPECT_EQ(evalCall("listinsert", args(intList({1, 2}), num(0))), ints({0, 1, 2}));
    EXPECT_EQ(evalCall("listinsert", args(intList({1, 2}), num(9), num(2))), ints({1, 9, 2}));
    EXPECT_EQ(evalCall("listinsert", args(intList({1, 2}), num(9), num(99))), ints({1, 2, 9}));
    EXPECT_EQ(evalCall("listdelete", args(intList({1, 2, 3}), num(2))), ints({1, 3}));
    EXPECT_EQ(evalCall("listdelete", args(intList({1}), num(5))), errVal(ErrorCode::E_RANGE));
    EXPECT_EQ(evalCall("listset", args(intList({1, 2}), num(9), num(2))), ints({1, 9}));
    EXPECT_EQ(evalCall("listset", args(list({}), num(1), num(1))), errVal(ErrorCode::E_RANGE));
}

TEST(BuiltinsTest, SetOperationsIgnoreCase)
{
    EXPECT_EQ(evalCall("setadd", args(list(args(str("a"))), str("A"))),
              Var::fromList({Var::fromStr("a")}));
    EXPECT_EQ(evalCall("setadd", args(intList({1}), num(2))), ints({1, 2}));
    EXPECT_EQ(evalCall("setremove", args(intList({1, 2, 1}), num(1))), ints({2, 1}));
    EXPECT_EQ(evalCall("setremove", args(list(args(str("Box"))), str("box"))), Var::emptyList());
}

TEST(BuiltinsTest, NumericHelpers)
{
    EXPECT_EQ(evalCall("abs", args(num(-5))), Var::fromInt(5));
    EXPECT_EQ(evalCall("abs", args(val(Var::fromFloat(-2.5)))), Var::fromFloat(2.5));
    EXPECT_EQ(evalCall("min", args(num(3), num(1), num(2))), Var::fromInt(1));
    EXPECT_EQ(evalCall("max", args(num(3), num(1), num(2))), Var::fromInt(3));
    EXPECT_EQ(evalCall("max", args(num(1), val(Var::fromFloat(2.0)))), errVal(ErrorCode::E_TYPE));
}

TEST(BuiltinsTest, RaiseRequiresAnError)
{
    EXPECT_EQ(evalCall("raise", args(num(1))), errVal(ErrorCode::E_INVARG));
    EXPECT_EQ(evalCall("raise", args(err(ErrorCode::E_QUOTA))), errVal(ErrorCode::E_QUOTA));
}

TEST(BuiltinsTest, TaskIntrospection)
{
    EXPECT_EQ(evalCall("callers"), Var::emptyList());
    EXPECT_EQ(evalCall("caller_perms"), Var::fromObj(values::kNothing));
    EXPECT_EQ(evalCall("task_id"), Var::fromInt(1));

    const Var ticks = evalCall("ticks_left");
    ASSERT_TRUE(ticks.isInt());
    EXPECT_GT(ticks.asInt(), 0);
    const Var seconds = evalCall("seconds_left");
    ASSERT_TRUE(seconds.isInt());
    EXPECT_GT(seconds.asInt(), 0);
}

TEST(BuiltinsTest, CallersListsCallingFrames)
{
    ProgramBuilder inner;
    inner.add(inner.ret(list(args(call("callers"), call("caller_perms")))));

    ProgramBuilder b;
    b.add(b.ret(verb(b.var("this"), "inner")));

    InMemoryWorldState world;
    world.object(1).verbs["inner"] = inner.compile();
    world.object(1).owner = 8;

    Var::List frame{Var::fromObj(1), Var::fromStr("test"), Var::fromObj(2),
                    Var::fromObj(1), Var::fromObj(3), Var::fromInt(1)};
    Var::List expected{Var::fromList({Var::fromList(frame)}), Var::fromObj(2)};
    EXPECT_EQ(completedValue(runProgram(b.compile(), world)), Var::fromList(expected));
}
