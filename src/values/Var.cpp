//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements construction, rendering and the arithmetic, comparison and
// sequence operations on Var. Every operation reports language errors as a
// Diag carrying the ErrorCode so the interpreter can raise it without host
// exceptions.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Runtime value operations used by the interpreter and builtins.
/// @details Sequence indices are 1-based at this interface and translated to
///          0-based positions before touching the underlying containers. All
///          bounds violations surface as E_RANGE rather than host faults.

#include "values/Var.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>

namespace moo::values
{
namespace
{
int64_t wrapAdd(int64_t a, int64_t b)
{
    return static_cast<int64_t>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
}

int64_t wrapSub(int64_t a, int64_t b)
{
    return static_cast<int64_t>(static_cast<uint64_t>(a) - static_cast<uint64_t>(b));
}

int64_t wrapMul(int64_t a, int64_t b)
{
    return static_cast<int64_t>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
}

char foldCase(char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

int compareIgnoreCase(const std::string &a, const std::string &b)
{
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i)
    {
        const char ca = foldCase(a[i]);
        const char cb = foldCase(b[i]);
        if (ca != cb)
            return ca < cb ? -1 : 1;
    }
    if (a.size() == b.size())
        return 0;
    return a.size() < b.size() ? -1 : 1;
}

size_t findIgnoreCase(const std::string &hay, const std::string &needle)
{
    if (needle.empty())
        return 0;
    auto it = std::search(hay.begin(),
                          hay.end(),
                          needle.begin(),
                          needle.end(),
                          [](char a, char b) { return foldCase(a) == foldCase(b); });
    if (it == hay.end())
        return std::string::npos;
    return static_cast<size_t>(it - hay.begin());
}

std::string formatFloat(double v)
{
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    std::string out(buf, res.ptr);
    if (out.find_first_of(".eEn") == std::string::npos)
        out += ".0";
    return out;
}

std::string quote(const std::string &s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s)
    {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

VarResult checkFloat(double v)
{
    if (!std::isfinite(v))
        return varError(ErrorCode::E_FLOAT);
    return Var::fromFloat(v);
}

bool isNumeric(const Var &v)
{
    return v.isInt() || v.isFloat();
}

double toDouble(const Var &v)
{
    return v.isInt() ? static_cast<double>(v.asInt()) : v.asFloat();
}

/// Apply @p intOp when both operands are ints, @p floatOp when at least one is
/// a float, E_TYPE otherwise.
template <typename IntOp, typename FloatOp>
VarResult numericBinary(const Var &a, const Var &b, IntOp intOp, FloatOp floatOp)
{
    if (a.isInt() && b.isInt())
        return intOp(a.asInt(), b.asInt());
    if (isNumeric(a) && isNumeric(b))
        return floatOp(toDouble(a), toDouble(b));
    return varError(ErrorCode::E_TYPE);
}

int64_t intPow(int64_t base, int64_t exp)
{
    int64_t result = 1;
    while (exp > 0)
    {
        if (exp & 1)
            result = wrapMul(result, base);
        base = wrapMul(base, base);
        exp >>= 1;
    }
    return result;
}

bool isSequence(const Var &v)
{
    return v.isStr() || v.isList();
}

int64_t sequenceLength(const Var &v)
{
    return v.isStr() ? static_cast<int64_t>(v.asStr().size())
                     : static_cast<int64_t>(v.asList().size());
}
} // namespace

Var Var::fromInt(int64_t v)
{
    return Var(VarType::Int, v);
}

Var Var::fromFloat(double v)
{
    return Var(VarType::Float, v);
}

Var Var::fromStr(std::string v)
{
    return Var(VarType::Str, std::move(v));
}

Var Var::fromObj(Objid v)
{
    return Var(VarType::Obj, v);
}

Var Var::fromErr(ErrorCode v)
{
    return Var(VarType::Err, static_cast<int64_t>(v));
}

Var Var::fromList(List v)
{
    return Var(VarType::List, std::make_shared<const List>(std::move(v)));
}

Var Var::emptyList()
{
    return fromList({});
}

Var Var::clear()
{
    return Var(VarType::Clear, int64_t{0});
}

Var Var::none()
{
    return Var();
}

Var Var::catchMarker(uint32_t label)
{
    return Var(VarType::Catch, static_cast<int64_t>(label));
}

Var Var::finallyMarker(uint32_t label)
{
    return Var(VarType::Finally, static_cast<int64_t>(label));
}

int64_t Var::asInt() const
{
    return std::get<int64_t>(storage_);
}

double Var::asFloat() const
{
    return std::get<double>(storage_);
}

const std::string &Var::asStr() const
{
    return std::get<std::string>(storage_);
}

Objid Var::asObj() const
{
    return std::get<int64_t>(storage_);
}

ErrorCode Var::asErr() const
{
    return static_cast<ErrorCode>(std::get<int64_t>(storage_));
}

const Var::List &Var::asList() const
{
    return *std::get<std::shared_ptr<const List>>(storage_);
}

uint32_t Var::markerLabel() const
{
    return static_cast<uint32_t>(std::get<int64_t>(storage_));
}

bool Var::isTrue() const
{
    switch (type_)
    {
        case VarType::Int:
            return asInt() != 0;
        case VarType::Float:
            return asFloat() != 0.0;
        case VarType::Str:
            return !asStr().empty();
        case VarType::List:
            return !asList().empty();
        default:
            return false;
    }
}

std::string Var::toLiteral() const
{
    switch (type_)
    {
        case VarType::Int:
            return std::to_string(asInt());
        case VarType::Float:
            return formatFloat(asFloat());
        case VarType::Str:
            return quote(asStr());
        case VarType::Obj:
            return "#" + std::to_string(asObj());
        case VarType::Err:
            return std::string(errorName(asErr()));
        case VarType::List:
        {
            std::string out = "{";
            bool first = true;
            for (const auto &item : asList())
            {
                if (!first)
                    out += ", ";
                first = false;
                out += item.toLiteral();
            }
            out += "}";
            return out;
        }
        case VarType::Clear:
            return "<clear>";
        case VarType::None:
            return "<none>";
        case VarType::Catch:
            return "<catch " + std::to_string(markerLabel()) + ">";
        case VarType::Finally:
            return "<finally " + std::to_string(markerLabel()) + ">";
    }
    return {};
}

std::string Var::toString() const
{
    switch (type_)
    {
        case VarType::Str:
            return asStr();
        case VarType::Err:
            return std::string(errorMessage(asErr()));
        case VarType::List:
            return "{list}";
        default:
            return toLiteral();
    }
}

bool Var::equalsIgnoreCase(const Var &other) const
{
    if (type_ != other.type_)
        return false;
    if (type_ == VarType::Str)
        return compareIgnoreCase(asStr(), other.asStr()) == 0;
    if (type_ == VarType::List)
    {
        const auto &a = asList();
        const auto &b = other.asList();
        if (a.size() != b.size())
            return false;
        for (size_t i = 0; i < a.size(); ++i)
        {
            if (!a[i].equalsIgnoreCase(b[i]))
                return false;
        }
        return true;
    }
    return *this == other;
}

bool operator==(const Var &a, const Var &b)
{
    if (a.type_ != b.type_)
        return false;
    switch (a.type_)
    {
        case VarType::Float:
            return a.asFloat() == b.asFloat();
        case VarType::Str:
            return a.asStr() == b.asStr();
        case VarType::List:
            return a.asList() == b.asList();
        default:
            return std::get<int64_t>(a.storage_) == std::get<int64_t>(b.storage_);
    }
}

support::Diag varError(ErrorCode code)
{
    return support::makeCodedError(static_cast<uint32_t>(code), std::string(errorMessage(code)));
}

ErrorCode errorOf(const support::Diag &diag)
{
    if (auto code = errorFromRaw(diag.code))
        return *code;
    return ErrorCode::E_INVARG;
}

VarResult add(const Var &a, const Var &b)
{
    if (a.isStr() && b.isStr())
        return Var::fromStr(a.asStr() + b.asStr());
    return numericBinary(
        a,
        b,
        [](int64_t x, int64_t y) -> VarResult { return Var::fromInt(wrapAdd(x, y)); },
        [](double x, double y) { return checkFloat(x + y); });
}

VarResult sub(const Var &a, const Var &b)
{
    return numericBinary(
        a,
        b,
        [](int64_t x, int64_t y) -> VarResult { return Var::fromInt(wrapSub(x, y)); },
        [](double x, double y) { return checkFloat(x - y); });
}

VarResult mul(const Var &a, const Var &b)
{
    return numericBinary(
        a,
        b,
        [](int64_t x, int64_t y) -> VarResult { return Var::fromInt(wrapMul(x, y)); },
        [](double x, double y) { return checkFloat(x * y); });
}

VarResult div(const Var &a, const Var &b)
{
    return numericBinary(
        a,
        b,
        [](int64_t x, int64_t y) -> VarResult
        {
            if (y == 0)
                return varError(ErrorCode::E_DIV);
            if (y == -1)
                return Var::fromInt(wrapSub(0, x));
            return Var::fromInt(x / y);
        },
        [](double x, double y) -> VarResult
        {
            if (y == 0.0)
                return varError(ErrorCode::E_DIV);
            return checkFloat(x / y);
        });
}

VarResult mod(const Var &a, const Var &b)
{
    return numericBinary(
        a,
        b,
        [](int64_t x, int64_t y) -> VarResult
        {
            if (y == 0)
                return varError(ErrorCode::E_DIV);
            if (y == -1)
                return Var::fromInt(0);
            return Var::fromInt(x % y);
        },
        [](double x, double y) -> VarResult
        {
            if (y == 0.0)
                return varError(ErrorCode::E_DIV);
            return checkFloat(std::fmod(x, y));
        });
}

VarResult pow(const Var &a, const Var &b)
{
    return numericBinary(
        a,
        b,
        [](int64_t base, int64_t exp) -> VarResult
        {
            if (exp >= 0)
                return Var::fromInt(intPow(base, exp));
            if (base == 0)
                return varError(ErrorCode::E_DIV);
            if (base == 1)
                return Var::fromInt(1);
            if (base == -1)
                return Var::fromInt((exp % 2 == 0) ? 1 : -1);
            return Var::fromInt(0);
        },
        [](double x, double y) { return checkFloat(std::pow(x, y)); });
}

VarResult negate(const Var &a)
{
    if (a.isInt())
        return Var::fromInt(wrapSub(0, a.asInt()));
    if (a.isFloat())
        return Var::fromFloat(-a.asFloat());
    return varError(ErrorCode::E_TYPE);
}

support::Expected<int> compare(const Var &a, const Var &b)
{
    if (a.type() != b.type())
        return varError(ErrorCode::E_TYPE);
    auto threeWay = [](auto x, auto y) { return x < y ? -1 : (y < x ? 1 : 0); };
    switch (a.type())
    {
        case VarType::Int:
            return threeWay(a.asInt(), b.asInt());
        case VarType::Float:
            return threeWay(a.asFloat(), b.asFloat());
        case VarType::Obj:
            return threeWay(a.asObj(), b.asObj());
        case VarType::Err:
            return threeWay(static_cast<int>(a.asErr()), static_cast<int>(b.asErr()));
        case VarType::Str:
            return compareIgnoreCase(a.asStr(), b.asStr());
        default:
            return varError(ErrorCode::E_TYPE);
    }
}

VarResult in(const Var &needle, const Var &haystack)
{
    if (haystack.isList())
    {
        const auto &items = haystack.asList();
        for (size_t i = 0; i < items.size(); ++i)
        {
            if (items[i].equalsIgnoreCase(needle))
                return Var::fromInt(static_cast<int64_t>(i + 1));
        }
        return Var::fromInt(0);
    }
    if (haystack.isStr() && needle.isStr())
    {
        size_t pos = findIgnoreCase(haystack.asStr(), needle.asStr());
        if (pos == std::string::npos)
            return Var::fromInt(0);
        return Var::fromInt(static_cast<int64_t>(pos + 1));
    }
    return varError(ErrorCode::E_TYPE);
}

VarResult length(const Var &v)
{
    if (!isSequence(v))
        return varError(ErrorCode::E_TYPE);
    return Var::fromInt(sequenceLength(v));
}

VarResult index(const Var &base, const Var &idx)
{
    if (!isSequence(base) || !idx.isInt())
        return varError(ErrorCode::E_TYPE);
    const int64_t i = idx.asInt();
    if (i < 1 || i > sequenceLength(base))
        return varError(ErrorCode::E_RANGE);
    const auto pos = static_cast<size_t>(i - 1);
    if (base.isStr())
        return Var::fromStr(std::string(1, base.asStr()[pos]));
    return base.asList()[pos];
}

VarResult indexSet(const Var &base, const Var &idx, const Var &value)
{
    if (!isSequence(base) || !idx.isInt())
        return varError(ErrorCode::E_TYPE);
    const int64_t i = idx.asInt();
    if (i < 1 || i > sequenceLength(base))
        return varError(ErrorCode::E_RANGE);
    const auto pos = static_cast<size_t>(i - 1);
    if (base.isStr())
    {
        if (!value.isStr() || value.asStr().size() != 1)
            return varError(ErrorCode::E_INVARG);
        std::string s = base.asStr();
        s[pos] = value.asStr()[0];
        return Var::fromStr(std::move(s));
    }
    Var::List items = base.asList();
    items[pos] = value;
    return Var::fromList(std::move(items));
}

VarResult range(const Var &base, const Var &from, const Var &to)
{
    if (!isSequence(base) || !from.isInt() || !to.isInt())
        return varError(ErrorCode::E_TYPE);
    const int64_t a = from.asInt();
    const int64_t b = to.asInt();
    if (b < a)
        return base.isStr() ? Var::fromStr("") : Var::emptyList();
    if (a < 1 || b > sequenceLength(base))
        return varError(ErrorCode::E_RANGE);
    const auto start = static_cast<size_t>(a - 1);
    const auto count = static_cast<size_t>(b - a + 1);
    if (base.isStr())
        return Var::fromStr(base.asStr().substr(start, count));
    const auto &items = base.asList();
    return Var::fromList(Var::List(items.begin() + static_cast<std::ptrdiff_t>(start),
                                   items.begin() + static_cast<std::ptrdiff_t>(start + count)));
}

VarResult rangeSet(const Var &base, const Var &from, const Var &to, const Var &value)
{
    if (!isSequence(base) || !from.isInt() || !to.isInt())
        return varError(ErrorCode::E_TYPE);
    if (base.type() != value.type())
        return varError(ErrorCode::E_TYPE);
    const int64_t len = sequenceLength(base);
    int64_t a = std::max<int64_t>(from.asInt(), 1);
    int64_t b = to.asInt();
    if (a > len + 1 || b > len)
        return varError(ErrorCode::E_RANGE);
    if (b < a - 1)
        b = a - 1;
    // Keep [1, a-1], splice in value, keep [b+1, len].
    const auto head = static_cast<size_t>(a - 1);
    const auto tail = static_cast<size_t>(b);
    if (base.isStr())
    {
        const std::string &s = base.asStr();
        return Var::fromStr(s.substr(0, head) + value.asStr() + s.substr(tail));
    }
    const auto &items = base.asList();
    Var::List out(items.begin(), items.begin() + static_cast<std::ptrdiff_t>(head));
    out.insert(out.end(), value.asList().begin(), value.asList().end());
    out.insert(out.end(), items.begin() + static_cast<std::ptrdiff_t>(tail), items.end());
    return Var::fromList(std::move(out));
}

} // namespace moo::values
