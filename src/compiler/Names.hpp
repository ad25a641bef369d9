//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/compiler/Names.hpp
// Purpose: Per-program table mapping identifiers to environment slots.
// Key invariants: Lookup is case-insensitive; the first spelling seen is the
//                 one preserved. Ids are dense and start at 0. The global
//                 variables occupy the first slots in a fixed order.
// Ownership/Lifetime: Owns copies of every identifier.
// Links: src/compiler/Labels.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "compiler/Labels.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace moo::compiler
{

/// @brief Slots of the per-activation globals, in seeding order.
enum class GlobalName : uint32_t
{
    Player = 0,
    This,
    Caller,
    Verb,
    Args,
    Argstr,
    Dobj,
    Dobjstr,
    Prepstr,
    Iobj,
    Iobjstr,
    Num,
    Obj,
    Str,
    List,
    Err,
    Int,
    Float,
};

/// @brief Number of pre-seeded global names.
inline constexpr uint32_t kGlobalNameCount = static_cast<uint32_t>(GlobalName::Float) + 1;

/// @brief Environment slot of a global.
inline constexpr Name globalName(GlobalName g)
{
    return Name{static_cast<uint32_t>(g)};
}

/// @brief Interns identifiers to dense environment slots.
/// @invariant names()[n.id] is the spelling of Name n.
class Names
{
  public:
    /// @brief Create a table seeded with the global names.
    Names();

    /// @brief Rebuild a table from a stored list of spellings.
    /// @details Used by the program decoder; the caller guarantees the
    ///          globals are present in their seeded positions.
    explicit Names(std::vector<std::string> spellings);

    /// @brief Return the slot for @p ident, adding it when new.
    Name findOrAdd(std::string_view ident);

    /// @brief Return the slot for @p ident when present.
    std::optional<Name> find(std::string_view ident) const;

    /// @brief Spelling of @p name as first added.
    const std::string &name(Name name) const;

    /// @brief Number of slots an environment needs.
    size_t width() const
    {
        return names_.size();
    }

    const std::vector<std::string> &names() const
    {
        return names_;
    }

    bool operator==(const Names &other) const
    {
        return names_ == other.names_;
    }

  private:
    static std::string fold(std::string_view ident);

    std::vector<std::string> names_;
    std::unordered_map<std::string, Name> index_;
};

} // namespace moo::compiler
