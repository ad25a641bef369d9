//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/values/Var.hpp
// Purpose: Runtime value type shared by the literal pool, the operand stack,
//          activation environments and builtin functions.
// Key invariants: Lists are immutable once built and shared between copies;
//                 every mutation produces a fresh list. Marker values (Catch,
//                 Finally) and None only ever live inside the interpreter.
// Ownership/Lifetime: Var owns strings by value and lists by shared_ptr.
// Links: src/values/ErrorCode.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "values/ErrorCode.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace moo::values
{

/// @brief Object reference number; negative numbers are the sentinels below.
using Objid = int64_t;

/// @brief Sentinel object numbers.
inline constexpr Objid kNothing = -1;
inline constexpr Objid kAmbiguous = -2;
inline constexpr Objid kFailedMatch = -3;

/// @brief Value discriminator. Numeric values double as the `typeof` codes.
enum class VarType : uint8_t
{
    Int = 0,
    Obj = 1,
    Str = 2,
    Err = 3,
    List = 4,
    Clear = 5,
    None = 6,
    Catch = 7,
    Finally = 8,
    Float = 9,
};

/// @brief Tagged runtime value.
/// @details Integers, object numbers, error codes and marker labels share the
///          integer payload; @ref type() decides how it is read. A
///          default-constructed Var is None, the "unset" value found in fresh
///          environment slots.
class Var
{
  public:
    using List = std::vector<Var>;

    Var() = default;

    static Var fromInt(int64_t v);
    static Var fromFloat(double v);
    static Var fromStr(std::string v);
    static Var fromObj(Objid v);
    static Var fromErr(ErrorCode v);
    static Var fromList(List v);
    static Var emptyList();
    static Var clear();
    static Var none();

    /// @brief Operand-stack marker pushed on entry to a catch or except block.
    static Var catchMarker(uint32_t label);

    /// @brief Operand-stack marker pushed on entry to a finally block.
    static Var finallyMarker(uint32_t label);

    VarType type() const
    {
        return type_;
    }

    bool isInt() const
    {
        return type_ == VarType::Int;
    }

    bool isFloat() const
    {
        return type_ == VarType::Float;
    }

    bool isStr() const
    {
        return type_ == VarType::Str;
    }

    bool isObj() const
    {
        return type_ == VarType::Obj;
    }

    bool isErr() const
    {
        return type_ == VarType::Err;
    }

    bool isList() const
    {
        return type_ == VarType::List;
    }

    bool isNone() const
    {
        return type_ == VarType::None;
    }

    /// @brief Integer payload; valid for Int.
    int64_t asInt() const;

    /// @brief Float payload; valid for Float.
    double asFloat() const;

    /// @brief String payload; valid for Str.
    const std::string &asStr() const;

    /// @brief Object number; valid for Obj.
    Objid asObj() const;

    /// @brief Error code; valid for Err.
    ErrorCode asErr() const;

    /// @brief List elements; valid for List.
    const List &asList() const;

    /// @brief Label carried by a Catch or Finally marker.
    uint32_t markerLabel() const;

    /// @brief Truthiness: non-zero numbers, non-empty strings and lists.
    bool isTrue() const;

    /// @brief Source-literal rendering, e.g. `{1, "two", #3, E_PERM, 4.0}`.
    std::string toLiteral() const;

    /// @brief `tostr()` rendering: strings verbatim, errors as messages.
    std::string toString() const;

    /// @brief Value returned by `typeof()`.
    int64_t typeCode() const
    {
        return static_cast<int64_t>(type_);
    }

    /// @brief Language equality: strings compare case-insensitively and
    ///        values of different types are never equal.
    bool equalsIgnoreCase(const Var &other) const;

    /// @brief Exact structural equality (case-sensitive strings).
    friend bool operator==(const Var &a, const Var &b);

  private:
    using Storage = std::variant<int64_t, double, std::string, std::shared_ptr<const List>>;

    Var(VarType type, Storage storage) : type_(type), storage_(std::move(storage)) {}

    VarType type_ = VarType::None;
    Storage storage_ = int64_t{0};
};

/// @brief Result of a value operation: a Var or a Diag whose code is an ErrorCode.
using VarResult = support::Expected<Var>;

/// @brief Build the diagnostic that carries @p code out of a value operation.
support::Diag varError(ErrorCode code);

/// @brief Recover the ErrorCode stored in a diagnostic produced by @ref varError.
ErrorCode errorOf(const support::Diag &diag);

/// @name Arithmetic
/// @details Integers wrap on overflow. Mixed int/float operands promote to
///          float. Non-finite float results yield E_FLOAT.
/// @{
VarResult add(const Var &a, const Var &b);
VarResult sub(const Var &a, const Var &b);
VarResult mul(const Var &a, const Var &b);
VarResult div(const Var &a, const Var &b);
VarResult mod(const Var &a, const Var &b);
VarResult pow(const Var &a, const Var &b);
VarResult negate(const Var &a);
/// @}

/// @brief Three-way ordering for <, <=, >, >=.
/// @return Negative, zero or positive; E_TYPE unless both operands are ints,
///         floats, strings, objects or errors of the same type.
support::Expected<int> compare(const Var &a, const Var &b);

/// @brief Membership: 1-based position of @p needle in list @p haystack, or
///        the position of a case-insensitive substring; 0 when absent.
VarResult in(const Var &needle, const Var &haystack);

/// @brief Length of a string or list.
VarResult length(const Var &v);

/// @brief `base[idx]` with a 1-based index.
VarResult index(const Var &base, const Var &idx);

/// @brief `base[idx] = value`, yielding the updated base.
VarResult indexSet(const Var &base, const Var &idx, const Var &value);

/// @brief `base[from..to]`; empty when to < from.
VarResult range(const Var &base, const Var &from, const Var &to);

/// @brief `base[from..to] = value`, yielding the updated base.
/// @details Replaces, inserts (to < from) or deletes (empty value) elements.
VarResult rangeSet(const Var &base, const Var &from, const Var &to, const Var &value);

} // namespace moo::values
