//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/moo-dis/main.cpp
// Purpose: Entry point for the moo-dis program listing tool.
// Links: src/tools/moo-dis/driver.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/moo-dis/driver.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    return moo::tools::dis::runCLI(argc, argv, std::cout, std::cerr);
}
