//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/compiler/Labels.hpp
// Purpose: Strongly typed integer handles used by programs and opcodes.
// Key invariants: Name, Label and Offset are distinct domains and never
//                 convert into one another implicitly.
// Ownership/Lifetime: Plain value types.
// Links: src/compiler/Program.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace moo::compiler
{

/// @brief Slot in a verb's environment array.
struct Name
{
    uint32_t id = 0;

    auto operator<=>(const Name &) const = default;
};

/// @brief Index into a program's jump-label table.
struct Label
{
    uint32_t id = 0;

    auto operator<=>(const Label &) const = default;
};

/// @brief Operand-stack depth or fork-vector index.
struct Offset
{
    uint32_t value = 0;

    auto operator<=>(const Offset &) const = default;
};

/// @brief Jump destination recorded in the label table.
/// @details Created with a placeholder position and committed once the
///          destination instruction index is known. Loop labels carry the
///          loop variable or loop name so named exits can be resolved.
struct JumpLabel
{
    Label id;
    std::optional<Name> name;
    size_t position = 0;

    bool operator==(const JumpLabel &) const = default;
};

} // namespace moo::compiler
