//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_moo_dis.cpp
// Purpose: The moo-dis driver: listing plus reconstructed source.
// Key invariants: Exit status is 0 only when decoding and decompiling succeed.
// Ownership/Lifetime: Temporary files are removed by each test.
// Links: src/tools/moo-dis/driver.hpp
//
//===----------------------------------------------------------------------===//

#include "MooTestSupport.hpp"

#include "compiler/Program.hpp"
#include "tools/moo-dis/driver.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace moo;
using namespace moo::test;

namespace
{
ProgramBuilder sample()
{
    ProgramBuilder b;
    b.add(b.expr(assign(b.var("greeting"), str("hello"))));
    b.add(b.ret(b.var("greeting")));
    return b;
}

int runWith(const std::vector<std::string> &words, std::ostream &out, std::ostream &err)
{
    std::vector<std::string> storage = words;
    std::vector<char *> argv;
    for (auto &w : storage)
        argv.push_back(w.data());
    return tools::dis::runCLI(static_cast<int>(argv.size()), argv.data(), out, err);
}

std::filesystem::path writeTemp(const std::string &name, const std::vector<uint8_t> &bytes)
{
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream f(path, std::ios::binary);
    f.write(reinterpret_cast<const char *>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
    return path;
}
} // namespace

TEST(MooDisTest, PrintsListingAndSource)
{
    auto program = sample().compile();
    ASSERT_NE(program, nullptr);
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_TRUE(tools::dis::printProgram(*program, out, err));
    const std::string text = out.str();
    EXPECT_NE(text.find("main:"), std::string::npos);
    EXPECT_NE(text.find("; source\n"), std::string::npos);
    EXPECT_NE(text.find("greeting = \"hello\";\nreturn greeting;\n"), std::string::npos);
    EXPECT_TRUE(err.str().empty());
}

TEST(MooDisTest, ReportsMalformedProgram)
{
    compiler::Program program;
    program.mainVector = {compiler::op::Pop{}, compiler::op::Done{}};
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_FALSE(tools::dis::printProgram(program, out, err));
    EXPECT_FALSE(err.str().empty());
}

TEST(MooDisTest, RejectsWrongArgumentCount)
{
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(runWith({"moo-dis"}, out, err), 1);
    EXPECT_NE(err.str().find("Usage: moo-dis"), std::string::npos);
}

TEST(MooDisTest, ReportsMissingFile)
{
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(runWith({"moo-dis", "/nonexistent/moo-dis-input.bin"}, out, err), 1);
    EXPECT_NE(err.str().find("cannot open"), std::string::npos);
}

TEST(MooDisTest, DecodesFileFromDisk)
{
    auto program = sample().compile();
    ASSERT_NE(program, nullptr);
    const auto path = writeTemp("moo_dis_roundtrip.bin", compiler::encodeProgram(*program));

    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(runWith({"moo-dis", path.string()}, out, err), 0);
    EXPECT_NE(out.str().find("return greeting;"), std::string::npos);
    std::filesystem::remove(path);
}

TEST(MooDisTest, RejectsCorruptFile)
{
    const auto path = writeTemp("moo_dis_corrupt.bin", {0x00, 0x01, 0x02, 0x03, 0x04});
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(runWith({"moo-dis", path.string()}, out, err), 1);
    EXPECT_FALSE(err.str().empty());
    std::filesystem::remove(path);
}
