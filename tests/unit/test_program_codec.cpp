//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_program_codec.cpp
// Purpose: Binary Program encoding and its failure modes.
// Key invariants: decode(encode(p)) == p; malformed input is a diagnostic.
// Ownership/Lifetime: Byte buffers are test-local.
// Links: src/compiler/Program.hpp
//
//===----------------------------------------------------------------------===//

#include "MooTestSupport.hpp"

using namespace moo;
using namespace moo::test;
using compiler::DecodeErrorKind;

namespace
{
/// A program touching every operand kind: literals of each type, named loop
/// labels, scatter labels, a fork vector and handler instructions.
std::shared_ptr<const compiler::Program> richProgram()
{
    ProgramBuilder b;
    const Name x = b.name("x");
    const Name t = b.name("t");
    b.add(b.expr(assign(b.var("l"),
                        list(args(num(1), val(Var::fromFloat(2.5)), str("s"), obj(4),
                                  err(ErrorCode::E_PERM))))));
    b.add(b.stmt(Stmt::ForList{x, b.var("l"), body(b.stmt(Stmt::Continue{x}))}));
    Expr::Scatter sc{{compiler::ScatterItem{compiler::ScatterKind::Required, b.name("a"),
                                            std::nullopt},
                      compiler::ScatterItem{compiler::ScatterKind::Optional, b.name("o"),
                                            compiler::Box<Expr>(num(9))},
                      compiler::ScatterItem{compiler::ScatterKind::Rest, b.name("r"),
                                            std::nullopt}},
                     b.var("l")};
    b.add(b.expr(Expr{std::move(sc)}));
    b.add(b.stmt(Stmt::Fork{t, num(0), body(b.ret0())}));
    b.add(b.stmt(Stmt::TryFinally{body(b.expr(catchExpr(b.var("x"), anyCode(), num(0)))),
                                  body(b.expr(num(1)))}));
    return b.compile();
}

uint32_t decodeError(const std::vector<uint8_t> &bytes)
{
    auto decoded = compiler::decodeProgram(bytes);
    EXPECT_FALSE(decoded);
    return decoded ? 0 : decoded.error().code;
}
} // namespace

TEST(ProgramCodecTest, RoundTripsEveryField)
{
    auto program = richProgram();
    ASSERT_TRUE(program);
    auto bytes = compiler::encodeProgram(*program);
    auto decoded = compiler::decodeProgram(bytes);
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded.value(), *program);
}

TEST(ProgramCodecTest, RejectsBadMagic)
{
    auto bytes = compiler::encodeProgram(*richProgram());
    bytes[0] ^= 0xFF;
    EXPECT_EQ(decodeError(bytes), static_cast<uint32_t>(DecodeErrorKind::BadMagic));
}

TEST(ProgramCodecTest, RejectsUnsupportedVersion)
{
    auto bytes = compiler::encodeProgram(*richProgram());
    bytes[4] = 0x7F;
    EXPECT_EQ(decodeError(bytes), static_cast<uint32_t>(DecodeErrorKind::UnsupportedVersion));
}

TEST(ProgramCodecTest, RejectsTruncatedInput)
{
    auto bytes = compiler::encodeProgram(*richProgram());
    bytes.resize(bytes.size() / 2);
    EXPECT_NE(decodeError(bytes), 0u);

    std::vector<uint8_t> tiny = {0x4D, 0x4F};
    EXPECT_EQ(decodeError(tiny), static_cast<uint32_t>(DecodeErrorKind::Truncated));
}

TEST(ProgramCodecTest, RejectsTrailingBytes)
{
    auto bytes = compiler::encodeProgram(*richProgram());
    bytes.push_back(0);
    EXPECT_EQ(decodeError(bytes), static_cast<uint32_t>(DecodeErrorKind::TrailingBytes));
}

TEST(ProgramCodecTest, DisassemblyListsVectorsAndLabels)
{
    auto program = richProgram();
    ASSERT_TRUE(program);
    const std::string listing = compiler::disassemble(*program);
    EXPECT_NE(listing.find("main:"), std::string::npos);
    EXPECT_NE(listing.find("fork 0:"), std::string::npos);
    EXPECT_NE(listing.find("Scatter"), std::string::npos);
    EXPECT_NE(listing.find("(x)"), std::string::npos);
    EXPECT_NE(listing.find("E_PERM"), std::string::npos);
}
