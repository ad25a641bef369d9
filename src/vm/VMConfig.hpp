//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/VMConfig.hpp
// Purpose: Compile-time configuration hooks for the interpreter loop.
// Key invariants: Every hook is a statement-like macro safe inside if/else.
// Ownership/Lifetime: Shared header; no owning object or runtime state.
// Links: src/vm/VMExecute.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

// -----------------------------------------------------------------------------
// Dispatch hook macros
//
// Invoked immediately before and after each instruction executed by
// VM::step(). Embedders may override them with -D; the defaults account one
// tick per instruction.
// -----------------------------------------------------------------------------
#ifndef MOO_VM_DISPATCH_BEFORE
#define MOO_VM_DISPATCH_BEFORE(VMREF, OP)                                                          \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif

#ifndef MOO_VM_DISPATCH_AFTER
#define MOO_VM_DISPATCH_AFTER(VMREF, OP)                                                           \
    do                                                                                             \
    {                                                                                              \
        ++(VMREF).ticks_;                                                                          \
    } while (0)
#endif

// -----------------------------------------------------------------------------
// Opcode execution counters (compile-time + runtime toggle)
// -----------------------------------------------------------------------------
#ifndef MOO_VM_OPCOUNTS
#define MOO_VM_OPCOUNTS 1
#endif

#if MOO_VM_OPCOUNTS
#undef MOO_VM_DISPATCH_BEFORE
#define MOO_VM_DISPATCH_BEFORE(VMREF, OP)                                                          \
    do                                                                                             \
    {                                                                                              \
        if ((VMREF).countOpcodes_)                                                                 \
            ++((VMREF).opCounts_[(OP).index()]);                                                   \
    } while (0)
#endif
