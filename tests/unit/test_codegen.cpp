//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_codegen.cpp
// Purpose: Instruction selection, literal pooling, fork vectors, line spans
//          and compile errors.
// Key invariants: Every compiled vector ends with Done.
// Ownership/Lifetime: Test-local programs.
// Links: src/compiler/Codegen.hpp
//
//===----------------------------------------------------------------------===//

#include "MooTestSupport.hpp"

#include "compiler/Builtins.hpp"

#include <algorithm>

using namespace moo;
using namespace moo::test;
namespace op = compiler::op;

namespace
{
template <typename T> size_t countOps(const std::vector<compiler::Op> &ops)
{
    size_t n = 0;
    for (const auto &o : ops)
        n += std::holds_alternative<T>(o) ? 1 : 0;
    return n;
}

uint32_t errorKind(const compiler::ParsedProgram &parsed)
{
    auto program = compiler::compile(parsed);
    EXPECT_FALSE(program);
    return program ? 0 : program.error().code;
}
} // namespace

TEST(CodegenTest, SimpleAssignmentAndReturn)
{
    ProgramBuilder b;
    b.add(b.expr(assign(b.var("a"), bin(BinaryOp::Add, num(1), num(2)))));
    b.add(b.ret(b.var("a")));
    auto program = b.compile();
    ASSERT_TRUE(program);

    const auto &ops = program->mainVector;
    const Name a = *program->varNames.find("a");
    std::vector<compiler::Op> expected = {op::Imm{0}, op::Imm{1}, op::Add{},    op::Put{a},
                                          op::Pop{},  op::Push{a}, op::Return{}, op::Done{}};
    EXPECT_EQ(ops, expected);
    ASSERT_EQ(program->literals.size(), 2u);
    EXPECT_EQ(program->literals[0], Var::fromInt(1));
}

TEST(CodegenTest, LiteralPoolDedupesExactValuesOnly)
{
    ProgramBuilder b;
    b.add(b.expr(list(args(str("Foo"), str("foo"), str("Foo"), num(1), num(1)))));
    auto program = b.compile();
    ASSERT_TRUE(program);
    ASSERT_EQ(program->literals.size(), 3u);
    EXPECT_EQ(program->literals[0], Var::fromStr("Foo"));
    EXPECT_EQ(program->literals[1], Var::fromStr("foo"));
    EXPECT_EQ(program->literals[2], Var::fromInt(1));
}

TEST(CodegenTest, LineSpansFollowStatements)
{
    ProgramBuilder b;
    b.add(b.expr(num(1)));
    b.add(b.expr(num(2)));
    auto program = b.compile();
    ASSERT_TRUE(program);
    ASSERT_EQ(program->lineNumberSpans.size(), 2u);
    EXPECT_EQ(program->lineNumberSpans[0], (compiler::LineSpan{0, 1}));
    EXPECT_EQ(program->lineNumberSpans[1], (compiler::LineSpan{2, 2}));
}

TEST(CodegenTest, ForkBodyGoesToItsOwnVector)
{
    ProgramBuilder b;
    const Name t = b.name("t");
    b.add(b.stmt(Stmt::Fork{t, num(5), body(b.expr(assign(b.var("x"), num(1))))}));
    b.add(b.ret0());
    auto program = b.compile();
    ASSERT_TRUE(program);
    ASSERT_EQ(program->forkVectors.size(), 1u);
    EXPECT_EQ(countOps<op::Fork>(program->mainVector), 1u);
    EXPECT_EQ(countOps<op::Put>(program->mainVector), 0u);
    EXPECT_EQ(countOps<op::Put>(program->forkVectors[0]), 1u);
    EXPECT_TRUE(std::holds_alternative<op::Done>(program->forkVectors[0].back()));
    ASSERT_EQ(program->forkLineNumberSpans.size(), 1u);
    EXPECT_EQ(program->forkLineNumberSpans[0].front().line, 1u);
}

TEST(CodegenTest, BuiltinCallUsesRegistryId)
{
    ProgramBuilder b;
    b.add(b.ret(call("length", args(str("abc")))));
    auto program = b.compile();
    ASSERT_TRUE(program);
    const auto id = compiler::Builtins::instance().find("length");
    ASSERT_TRUE(id.has_value());
    const auto &ops = program->mainVector;
    auto it = std::find_if(ops.begin(), ops.end(), [](const compiler::Op &o) {
        return std::holds_alternative<op::FuncCall>(o);
    });
    ASSERT_NE(it, ops.end());
    EXPECT_EQ(std::get<op::FuncCall>(*it).id, *id);
}

TEST(CodegenTest, NamedWhileStoresConditionAndLabelledBreakUsesExitId)
{
    ProgramBuilder b;
    const Name loop = b.name("loop");
    b.add(b.stmt(Stmt::While{loop, num(1), body(b.stmt(Stmt::Break{loop}))}));
    auto program = b.compile();
    ASSERT_TRUE(program);
    EXPECT_EQ(countOps<op::WhileId>(program->mainVector), 1u);
    EXPECT_EQ(countOps<op::ExitId>(program->mainVector), 1u);
    EXPECT_EQ(countOps<op::Exit>(program->mainVector), 0u);
}

TEST(CodegenTest, UnknownBuiltinIsACompileError)
{
    ProgramBuilder b;
    b.add(b.expr(call("no_such_function")));
    EXPECT_EQ(errorKind(b.parsed()),
              static_cast<uint32_t>(compiler::CompileErrorKind::UnknownBuiltinFunction));
}

TEST(CodegenTest, UnknownLoopLabelIsACompileError)
{
    ProgramBuilder b;
    const Name outer = b.name("outer");
    b.add(b.stmt(Stmt::While{std::nullopt, num(1), body(b.stmt(Stmt::Break{outer}))}));
    EXPECT_EQ(errorKind(b.parsed()),
              static_cast<uint32_t>(compiler::CompileErrorKind::UnknownLoopLabel));
}

TEST(CodegenTest, BreakOutsideLoopIsACompileError)
{
    ProgramBuilder b;
    b.add(b.stmt(Stmt::Break{}));
    EXPECT_EQ(errorKind(b.parsed()),
              static_cast<uint32_t>(compiler::CompileErrorKind::UnknownLoopLabel));
}

TEST(CodegenTest, LengthOutsideIndexIsACompileError)
{
    ProgramBuilder b;
    b.add(b.ret(length()));
    EXPECT_EQ(errorKind(b.parsed()),
              static_cast<uint32_t>(compiler::CompileErrorKind::LengthOutsideIndex));
}

TEST(CodegenTest, AssigningToALiteralIsACompileError)
{
    ProgramBuilder b;
    b.add(b.expr(assign(num(1), num(2))));
    EXPECT_EQ(errorKind(b.parsed()),
              static_cast<uint32_t>(compiler::CompileErrorKind::InvalidLvalue));
}

TEST(CodegenTest, LengthRefersToIndexedValueSlot)
{
    ProgramBuilder b;
    b.add(b.expr(num(7)));
    b.add(b.ret(index(b.var("args"), length())));
    auto program = b.compile();
    ASSERT_TRUE(program);
    const auto &ops = program->mainVector;
    auto it = std::find_if(ops.begin(), ops.end(), [](const compiler::Op &o) {
        return std::holds_alternative<op::Length>(o);
    });
    ASSERT_NE(it, ops.end());
    EXPECT_EQ(std::get<op::Length>(*it).offset.value, 0u);
}
