//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/source_location.hpp
// Purpose: Declares the position type attached to diagnostics and statements.
// Key invariants: line == 0 indicates an unknown location.
// Ownership/Lifetime: Plain value type.
// Links: src/support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace moo::support
{

/// @brief Represents a position within a verb's source text.
/// @invariant line == 0 indicates an unknown location.
/// @ownership Value type with no owned resources.
struct SourceLoc
{
    /// @brief One-based line number within the verb body; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number within the line; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location carries a line number.
    [[nodiscard]] bool isValid() const;

    /// @brief Determine whether a 1-based column number is available.
    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

} // namespace moo::support
