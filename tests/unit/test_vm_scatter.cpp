//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_vm_scatter.cpp
// Purpose: Scatter assignment binding of required, optional and rest targets.
// Key invariants: Optionals fill left to right; unfilled optionals evaluate
//                 their defaults; a count mismatch raises E_ARGS.
// Ownership/Lifetime: Test-local programs.
// Links: src/vm/VMExecute.cpp
//
//===----------------------------------------------------------------------===//

#include "MooTestSupport.hpp"

using namespace moo;
using namespace moo::test;
using compiler::ScatterItem;
using compiler::ScatterKind;

namespace
{
Var ints(std::initializer_list<int64_t> items)
{
    Var::List out;
    for (auto i : items)
        out.push_back(Var::fromInt(i));
    return Var::fromList(std::move(out));
}

ScatterItem required(ProgramBuilder &b, std::string_view ident)
{
    return {ScatterKind::Required, b.name(ident), std::nullopt};
}

ScatterItem optional(ProgramBuilder &b, std::string_view ident,
                     std::optional<Expr> def = std::nullopt)
{
    ScatterItem item{ScatterKind::Optional, b.name(ident), std::nullopt};
    if (def)
        item.expr = compiler::Box<Expr>(std::move(*def));
    return item;
}

ScatterItem rest(ProgramBuilder &b, std::string_view ident)
{
    return {ScatterKind::Rest, b.name(ident), std::nullopt};
}

Expr scatter(std::vector<ScatterItem> items, Expr rhs)
{
    return Expr{Expr::Scatter{std::move(items), std::move(rhs)}};
}

ErrorCode raisedCode(const ProgramBuilder &b)
{
    InMemoryWorldState world;
    const auto response = runProgram(b.compile(), world);
    const auto *e = std::get_if<vm::host::Exception>(&response);
    EXPECT_NE(e, nullptr);
    return e ? e->exception.code : ErrorCode::E_NONE;
}
} // namespace

TEST(VMScatterTest, UnfilledOptionalsTakeDefaults)
{
    ProgramBuilder b;
    std::vector<ScatterItem> items;
    items.push_back(required(b, "a"));
    items.push_back(optional(b, "b", num(2)));
    items.push_back(optional(b, "c", num(3)));
    items.push_back(optional(b, "d", num(4)));
    b.add(b.expr(scatter(std::move(items), list(args(num(1), num(9))))));
    b.add(b.ret(list(args(b.var("a"), b.var("b"), b.var("c"), b.var("d")))));
    EXPECT_EQ(runToValue(b), ints({1, 9, 3, 4}));
}

TEST(VMScatterTest, RestCollectsRemainingItems)
{
    ProgramBuilder b;
    std::vector<ScatterItem> items;
    items.push_back(required(b, "a"));
    items.push_back(optional(b, "b", num(2)));
    items.push_back(rest(b, "c"));
    b.add(b.expr(scatter(std::move(items), list(args(num(1), num(5), num(3), num(4))))));
    Var::List expected{Var::fromInt(1), Var::fromInt(5), ints({3, 4})};
    b.add(b.ret(list(args(b.var("a"), b.var("b"), b.var("c")))));
    EXPECT_EQ(runToValue(b), Var::fromList(expected));
}

TEST(VMScatterTest, EmptyRestWhenNothingIsLeft)
{
    ProgramBuilder b;
    std::vector<ScatterItem> items;
    items.push_back(required(b, "a"));
    items.push_back(rest(b, "c"));
    b.add(b.expr(scatter(std::move(items), list(args(num(1))))));
    b.add(b.ret(b.var("c")));
    EXPECT_EQ(runToValue(b), Var::emptyList());
}

TEST(VMScatterTest, OptionalWithoutDefaultKeepsPreviousValue)
{
    ProgramBuilder b;
    b.add(b.expr(assign(b.var("b"), num(8))));
    std::vector<ScatterItem> items;
    items.push_back(required(b, "a"));
    items.push_back(optional(b, "b"));
    b.add(b.expr(scatter(std::move(items), list(args(num(1))))));
    b.add(b.ret(b.var("b")));
    EXPECT_EQ(runToValue(b), Var::fromInt(8));
}

TEST(VMScatterTest, ExpressionValueIsTheList)
{
    ProgramBuilder b;
    std::vector<ScatterItem> items;
    items.push_back(required(b, "a"));
    items.push_back(required(b, "b"));
    b.add(b.ret(scatter(std::move(items), list(args(num(1), num(2))))));
    EXPECT_EQ(runToValue(b), ints({1, 2}));
}

TEST(VMScatterTest, TooFewItemsRaisesArgs)
{
    ProgramBuilder b;
    std::vector<ScatterItem> items;
    items.push_back(required(b, "a"));
    items.push_back(required(b, "b"));
    b.add(b.expr(scatter(std::move(items), list(args(num(1))))));
    EXPECT_EQ(raisedCode(b), ErrorCode::E_ARGS);
}

TEST(VMScatterTest, TooManyItemsRaisesArgs)
{
    ProgramBuilder b;
    std::vector<ScatterItem> items;
    items.push_back(required(b, "a"));
    items.push_back(optional(b, "b"));
    b.add(b.expr(scatter(std::move(items), list(args(num(1), num(2), num(3))))));
    EXPECT_EQ(raisedCode(b), ErrorCode::E_ARGS);
}

TEST(VMScatterTest, NonListRaisesType)
{
    ProgramBuilder b;
    std::vector<ScatterItem> items;
    items.push_back(required(b, "a"));
    b.add(b.expr(scatter(std::move(items), num(1))));
    EXPECT_EQ(raisedCode(b), ErrorCode::E_TYPE);
}

TEST(VMScatterTest, TrailingOptionalDefaultsWhenListIsShort)
{
    ProgramBuilder b;
    std::vector<ScatterItem> items;
    items.push_back(required(b, "a"));
    items.push_back(required(b, "b"));
    items.push_back(required(b, "c"));
    items.push_back(optional(b, "d", num(4)));
    b.add(b.expr(scatter(std::move(items), list(args(num(1), num(2), num(3))))));
    b.add(b.ret(b.var("d")));
    EXPECT_EQ(runToValue(b), Var::fromInt(4));
}

TEST(VMScatterTest, RestAfterRequiredTargets)
{
    ProgramBuilder b;
    std::vector<ScatterItem> items;
    items.push_back(required(b, "a"));
    items.push_back(required(b, "b"));
    items.push_back(rest(b, "c"));
    b.add(b.expr(scatter(std::move(items), list(args(num(1), num(2), num(3), num(4))))));
    b.add(b.ret(b.var("c")));
    EXPECT_EQ(runToValue(b), ints({3, 4}));
}
