//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/moo-dis/driver.cpp
// Purpose: Load an encoded Program, print its instruction listing and the
//          source recovered by the decompiler.
// Key invariants: A decode failure prints nothing on @p out.
// Ownership/Lifetime: Reads the whole file into memory.
// Links: src/tools/moo-dis/driver.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/moo-dis/driver.hpp"

#include "compiler/Decompiler.hpp"
#include "compiler/Unparse.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace moo::tools::dis
{

bool printProgram(const compiler::Program &program, std::ostream &out, std::ostream &err)
{
    out << compiler::disassemble(program);

    auto parsed = compiler::decompile(program);
    if (!parsed)
    {
        support::DiagnosticEngine de;
        de.report(parsed.error());
        de.printAll(err);
        return false;
    }
    out << "\n; source\n" << compiler::unparse(parsed.value()) << '\n';
    return true;
}

int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    if (argc != 2)
    {
        err << "Usage: moo-dis <program.bin>\n";
        return 1;
    }

    std::ifstream in(argv[1], std::ios::binary);
    if (!in)
    {
        support::printDiag(support::makeError({}, std::string("cannot open ") + argv[1]), err);
        return 1;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());

    auto program = compiler::decodeProgram(bytes);
    if (!program)
    {
        support::printDiag(program.error(), err);
        return 1;
    }
    return printProgram(program.value(), out, err) ? 0 : 1;
}

} // namespace moo::tools::dis
