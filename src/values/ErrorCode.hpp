//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/values/ErrorCode.hpp
// Purpose: Closed set of language-level error codes with names and messages.
// Key invariants: Numeric values are stable; they are persisted by the codec
//                 and compared by catch-code lists.
// Ownership/Lifetime: Names and messages are static strings.
// Links: src/values/Var.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace moo::values
{

/// @brief Language error codes in their canonical order.
enum class ErrorCode : uint8_t
{
    E_NONE = 0,
    E_TYPE,
    E_DIV,
    E_PERM,
    E_PROPNF,
    E_VERBNF,
    E_VARNF,
    E_INVIND,
    E_RECMOVE,
    E_MAXREC,
    E_RANGE,
    E_ARGS,
    E_NACC,
    E_INVARG,
    E_QUOTA,
    E_FLOAT,
};

/// @brief Number of defined error codes.
inline constexpr uint8_t kErrorCodeCount = static_cast<uint8_t>(ErrorCode::E_FLOAT) + 1;

/// @brief Canonical spelling, e.g. "E_TYPE".
std::string_view errorName(ErrorCode code);

/// @brief Human-readable message, e.g. "Type mismatch".
std::string_view errorMessage(ErrorCode code);

/// @brief Convert a raw numeric value back into an ErrorCode.
/// @return Empty when @p raw is outside the defined range.
std::optional<ErrorCode> errorFromRaw(uint32_t raw);

/// @brief Look up an error code by its canonical name (case-insensitive).
std::optional<ErrorCode> errorFromName(std::string_view name);

} // namespace moo::values
