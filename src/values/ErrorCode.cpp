//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Name and message tables for ErrorCode. The tables are indexed by the
// enumerator value, so their order must follow the enum declaration.
//
//===----------------------------------------------------------------------===//

#include "values/ErrorCode.hpp"

#include <array>
#include <cctype>

namespace moo::values
{
namespace
{
struct ErrorInfo
{
    std::string_view name;
    std::string_view message;
};

constexpr std::array<ErrorInfo, kErrorCodeCount> kErrorTable = {{
    {"E_NONE", "No error"},
    {"E_TYPE", "Type mismatch"},
    {"E_DIV", "Division by zero"},
    {"E_PERM", "Permission denied"},
    {"E_PROPNF", "Property not found"},
    {"E_VERBNF", "Verb not found"},
    {"E_VARNF", "Variable not found"},
    {"E_INVIND", "Invalid indirection"},
    {"E_RECMOVE", "Recursive move"},
    {"E_MAXREC", "Too many verb calls"},
    {"E_RANGE", "Range error"},
    {"E_ARGS", "Incorrect number of arguments"},
    {"E_NACC", "Move refused by destination"},
    {"E_INVARG", "Invalid argument"},
    {"E_QUOTA", "Resource limit exceeded"},
    {"E_FLOAT", "Floating-point arithmetic error"},
}};

bool equalsIgnoreCase(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}
} // namespace

std::string_view errorName(ErrorCode code)
{
    return kErrorTable[static_cast<size_t>(code)].name;
}

std::string_view errorMessage(ErrorCode code)
{
    return kErrorTable[static_cast<size_t>(code)].message;
}

std::optional<ErrorCode> errorFromRaw(uint32_t raw)
{
    if (raw >= kErrorCodeCount)
        return std::nullopt;
    return static_cast<ErrorCode>(raw);
}

std::optional<ErrorCode> errorFromName(std::string_view name)
{
    for (size_t i = 0; i < kErrorTable.size(); ++i)
    {
        if (equalsIgnoreCase(kErrorTable[i].name, name))
            return static_cast<ErrorCode>(i);
    }
    return std::nullopt;
}

} // namespace moo::values
