//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/compiler/Builtins.hpp
// Purpose: Registry of builtin function names and their argument contracts.
// Key invariants: Ids are dense and stable; they are stored in FuncCall
//                 instructions, so entries are only ever appended.
// Ownership/Lifetime: Process-wide immutable table.
// Links: src/vm/BuiltinFunctions.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace moo::compiler
{

/// @brief Expected type of one builtin argument.
enum class ArgType : uint8_t
{
    Any,
    Num, ///< Int or Float.
    Int,
    Float,
    Str,
    Obj,
    Err,
    List,
};

/// @brief Contract of a builtin function.
struct BuiltinDescriptor
{
    std::string_view name;
    int minArgs = 0;
    int maxArgs = 0; ///< -1 when unbounded.
    std::vector<ArgType> types; ///< Per-position types; extra arguments are unchecked.
    bool implemented = true;
};

/// @brief Name <-> id mapping consulted by the compiler and decompiler, and
///        id -> contract mapping consulted by the interpreter.
class Builtins
{
  public:
    static const Builtins &instance();

    /// @brief Id of builtin @p name (case-insensitive).
    std::optional<uint16_t> find(std::string_view name) const;

    const BuiltinDescriptor &descriptor(uint16_t id) const
    {
        return table_.at(id);
    }

    size_t size() const
    {
        return table_.size();
    }

  private:
    Builtins();

    std::vector<BuiltinDescriptor> table_;
};

} // namespace moo::compiler
