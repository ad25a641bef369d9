//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/moo-dis/driver.hpp
// Purpose: Command-line driver for moo-dis, split from main() for testing.
// Key invariants: Diagnostics go to @p err; listings go to @p out.
// Ownership/Lifetime: Streams are borrowed for the duration of the call.
// Links: src/compiler/Program.hpp, src/compiler/Decompiler.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "compiler/Program.hpp"

#include <ostream>

namespace moo::tools::dis
{

/// @brief Print @p program's disassembly followed by its decompiled source.
/// @return True when decompilation succeeded.
bool printProgram(const compiler::Program &program, std::ostream &out, std::ostream &err);

/// @brief Run `moo-dis <file>`.
/// @return Process exit status.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err);

} // namespace moo::tools::dis
