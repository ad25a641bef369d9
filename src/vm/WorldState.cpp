//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/WorldState.cpp
// Purpose: Mapping between world-state failures and language error codes.
// Key invariants: The mapping is total over WorldStateError.
// Ownership/Lifetime: Stateless helpers.
// Links: src/vm/WorldState.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/WorldState.hpp"

namespace moo::vm
{
using values::ErrorCode;

ErrorCode toErrorCode(WorldStateError error)
{
    switch (error)
    {
        case WorldStateError::ObjectNotFound:
            return ErrorCode::E_INVIND;
        case WorldStateError::PropertyNotFound:
            return ErrorCode::E_PROPNF;
        case WorldStateError::VerbNotFound:
            return ErrorCode::E_VERBNF;
        case WorldStateError::PermissionDenied:
            return ErrorCode::E_PERM;
        case WorldStateError::InvalidArgument:
            return ErrorCode::E_INVARG;
    }
    return ErrorCode::E_INVARG;
}

support::Diag worldStateError(WorldStateError error, std::string message)
{
    return support::makeCodedError(static_cast<uint32_t>(error), std::move(message));
}

ErrorCode errorCodeOf(const support::Diag &diag)
{
    if (diag.code < static_cast<uint32_t>(WorldStateError::ObjectNotFound) ||
        diag.code > static_cast<uint32_t>(WorldStateError::InvalidArgument))
        return ErrorCode::E_INVARG;
    return toErrorCode(static_cast<WorldStateError>(diag.code));
}

} // namespace moo::vm
