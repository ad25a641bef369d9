//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/WorldState.hpp
// Purpose: Boundary between the interpreter and the persistent object world.
// Key invariants: Every failure is a Diagnostic whose code is a
//                 WorldStateError; the interpreter maps it to a language
//                 error value and never sees storage-specific detail.
// Ownership/Lifetime: The host owns the WorldState and lends it to
//                     VMHost::execInterpreter() for the duration of a slice.
// Links: src/vm/VMExecute.cpp, include/moo/vm/VMHost.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "compiler/Program.hpp"
#include "support/diag_expected.hpp"
#include "values/ErrorCode.hpp"
#include "values/Var.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace moo::vm
{

/// @brief Structured world-state failures.
enum class WorldStateError : uint32_t
{
    ObjectNotFound = 1,
    PropertyNotFound,
    VerbNotFound,
    PermissionDenied,
    InvalidArgument,
};

/// @brief Language error code raised for @p error.
values::ErrorCode toErrorCode(WorldStateError error);

/// @brief Build the diagnostic a WorldState returns for @p error.
support::Diag worldStateError(WorldStateError error, std::string message);

/// @brief Language error code for a diagnostic returned by a WorldState.
/// @details Diagnostics carrying an unknown code map to E_INVARG.
values::ErrorCode errorCodeOf(const support::Diag &diag);

/// @brief A verb located by WorldState::findMethodVerb.
struct ResolvedVerb
{
    values::Objid definer = values::kNothing; ///< Object the verb is defined on.
    values::Objid owner = values::kNothing;   ///< Programmer whose permissions it runs with.
    std::vector<std::string> names;           ///< Verb name aliases.
    std::shared_ptr<const compiler::Program> program;
    bool debug = true; ///< Errors raise instead of being pushed as values.
};

/// @brief Property and verb access as seen by running code.
class WorldState
{
  public:
    virtual ~WorldState() = default;

    /// @brief Read property @p name of @p obj with permissions @p perms.
    virtual support::Expected<values::Var> retrieveProperty(values::Objid perms,
                                                            values::Objid obj,
                                                            const std::string &name) = 0;

    /// @brief Write property @p name of @p obj.
    virtual support::Expected<void> updateProperty(values::Objid perms,
                                                   values::Objid obj,
                                                   const std::string &name,
                                                   const values::Var &value) = 0;

    /// @brief Find verb @p name on @p obj or its ancestors.
    virtual support::Expected<ResolvedVerb> findMethodVerb(values::Objid perms,
                                                           values::Objid obj,
                                                           const std::string &name) = 0;

    /// @brief Parent of @p obj; kNothing for a root object.
    virtual support::Expected<values::Objid> parentOf(values::Objid perms, values::Objid obj) = 0;
};

} // namespace moo::vm
