//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/BuiltinFunctions.cpp
// Purpose: Builtin function implementations and argument validation.
// Key invariants: table_[id] corresponds to compiler::Builtins descriptor id;
//                 list positions presented to programs are 1-based.
// Ownership/Lifetime: Implementations borrow the call state for one call.
// Links: src/compiler/Builtins.cpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Value, list, numeric and task builtins.

#include "vm/BuiltinFunctions.hpp"

#include "compiler/Builtins.hpp"
#include "vm/VM.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <utility>

namespace moo::vm
{
using compiler::ArgType;
using values::ErrorCode;
using values::Var;

namespace
{
BfRet ret(Var v)
{
    return bf::Ret{std::move(v)};
}

BfRet error(ErrorCode code, std::string message = {})
{
    return bf::Error{code, std::move(message)};
}

bool matchesType(ArgType type, const Var &v)
{
    switch (type)
    {
        case ArgType::Any:
            return true;
        case ArgType::Num:
            return v.isInt() || v.isFloat();
        case ArgType::Int:
            return v.isInt();
        case ArgType::Float:
            return v.isFloat();
        case ArgType::Str:
            return v.isStr();
        case ArgType::Obj:
            return v.isObj();
        case ArgType::Err:
            return v.isErr();
        case ArgType::List:
            return v.isList();
    }
    return false;
}

/// Parse an optionally signed decimal integer; trailing text is ignored.
std::optional<int64_t> parseInt(const std::string &s)
{
    const char *begin = s.c_str();
    char *end = nullptr;
    errno = 0;
    const long long v = std::strtoll(begin, &end, 10);
    if (end == begin || errno == ERANGE)
        return std::nullopt;
    return static_cast<int64_t>(v);
}

// Values ----------------------------------------------------------------------

BfRet bfTypeof(BfCallState &st)
{
    return ret(Var::fromInt(st.args[0].typeCode()));
}

BfRet bfLength(BfCallState &st)
{
    auto len = values::length(st.args[0]);
    if (!len)
        return error(values::errorOf(len.error()));
    return ret(std::move(len.value()));
}

BfRet bfTostr(BfCallState &st)
{
    std::string out;
    for (const auto &a : st.args)
        out += a.toString();
    return ret(Var::fromStr(std::move(out)));
}

BfRet bfToliteral(BfCallState &st)
{
    return ret(Var::fromStr(st.args[0].toLiteral()));
}

BfRet bfToint(BfCallState &st)
{
    const Var &v = st.args[0];
    if (v.isInt())
        return ret(v);
    if (v.isFloat())
    {
        if (!std::isfinite(v.asFloat()))
            return error(ErrorCode::E_FLOAT);
        return ret(Var::fromInt(static_cast<int64_t>(std::trunc(v.asFloat()))));
    }
    if (v.isObj())
        return ret(Var::fromInt(v.asObj()));
    if (v.isErr())
        return ret(Var::fromInt(static_cast<int64_t>(v.asErr())));
    if (v.isStr())
        return ret(Var::fromInt(parseInt(v.asStr()).value_or(0)));
    return error(ErrorCode::E_TYPE);
}

BfRet bfTofloat(BfCallState &st)
{
    const Var &v = st.args[0];
    if (v.isFloat())
        return ret(v);
    if (v.isInt())
        return ret(Var::fromFloat(static_cast<double>(v.asInt())));
    if (v.isErr())
        return ret(Var::fromFloat(static_cast<double>(v.asErr())));
    if (v.isStr())
    {
        const char *begin = v.asStr().c_str();
        char *end = nullptr;
        const double d = std::strtod(begin, &end);
        if (end == begin || !std::isfinite(d))
            return error(ErrorCode::E_INVARG);
        return ret(Var::fromFloat(d));
    }
    return error(ErrorCode::E_TYPE);
}

BfRet bfToobj(BfCallState &st)
{
    const Var &v = st.args[0];
    if (v.isObj())
        return ret(v);
    if (v.isInt())
        return ret(Var::fromObj(v.asInt()));
    if (v.isErr())
        return ret(Var::fromObj(static_cast<int64_t>(v.asErr())));
    if (v.isStr())
    {
        std::string text = v.asStr();
        if (!text.empty() && text.front() == '#')
            text.erase(0, 1);
        auto id = parseInt(text);
        if (!id)
            return error(ErrorCode::E_INVARG);
        return ret(Var::fromObj(*id));
    }
    return error(ErrorCode::E_TYPE);
}

BfRet bfEqual(BfCallState &st)
{
    return ret(Var::fromInt(st.args[0] == st.args[1] ? 1 : 0));
}

BfRet bfIsMember(BfCallState &st)
{
    const auto &items = st.args[1].asList();
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (items[i] == st.args[0])
            return ret(Var::fromInt(static_cast<int64_t>(i + 1)));
    }
    return ret(Var::fromInt(0));
}

// Lists -----------------------------------------------------------------------

/// Insert before 0-based @p at, clamped to the list bounds.
Var insertAt(const Var::List &items, int64_t at, const Var &value)
{
    const auto len = static_cast<int64_t>(items.size());
    at = std::clamp<int64_t>(at, 0, len);
    Var::List out = items;
    out.insert(out.begin() + at, value);
    return Var::fromList(std::move(out));
}

BfRet bfListappend(BfCallState &st)
{
    const auto &items = st.args[0].asList();
    const int64_t after =
        st.args.size() > 2 ? st.args[2].asInt() : static_cast<int64_t>(items.size());
    return ret(insertAt(items, after, st.args[1]));
}

BfRet bfListinsert(BfCallState &st)
{
    const auto &items = st.args[0].asList();
    const int64_t before = st.args.size() > 2 ? st.args[2].asInt() : 1;
    return ret(insertAt(items, before - 1, st.args[1]));
}

BfRet bfListdelete(BfCallState &st)
{
    const auto &items = st.args[0].asList();
    const int64_t at = st.args[1].asInt();
    if (at < 1 || at > static_cast<int64_t>(items.size()))
        return error(ErrorCode::E_RANGE);
    Var::List out = items;
    out.erase(out.begin() + (at - 1));
    return ret(Var::fromList(std::move(out)));
}

BfRet bfListset(BfCallState &st)
{
    const auto &items = st.args[0].asList();
    const int64_t at = st.args[2].asInt();
    if (at < 1 || at > static_cast<int64_t>(items.size()))
        return error(ErrorCode::E_RANGE);
    Var::List out = items;
    out[static_cast<size_t>(at - 1)] = st.args[1];
    return ret(Var::fromList(std::move(out)));
}

BfRet bfSetadd(BfCallState &st)
{
    const auto &items = st.args[0].asList();
    for (const auto &item : items)
    {
        if (item.equalsIgnoreCase(st.args[1]))
            return ret(st.args[0]);
    }
    Var::List out = items;
    out.push_back(st.args[1]);
    return ret(Var::fromList(std::move(out)));
}

BfRet bfSetremove(BfCallState &st)
{
    Var::List out = st.args[0].asList();
    for (auto it = out.begin(); it != out.end(); ++it)
    {
        if (it->equalsIgnoreCase(st.args[1]))
        {
            out.erase(it);
            break;
        }
    }
    return ret(Var::fromList(std::move(out)));
}

// Numbers ---------------------------------------------------------------------

BfRet bfAbs(BfCallState &st)
{
    const Var &v = st.args[0];
    if (v.isInt())
        return ret(Var::fromInt(v.asInt() < 0 ? -v.asInt() : v.asInt()));
    return ret(Var::fromFloat(std::fabs(v.asFloat())));
}

template <bool WantMax> BfRet extremum(BfCallState &st)
{
    const Var *best = &st.args[0];
    for (const auto &v : st.args)
    {
        if (v.type() != best->type())
            return error(ErrorCode::E_TYPE);
        auto c = values::compare(v, *best);
        if (!c)
            return error(values::errorOf(c.error()));
        if (WantMax ? c.value() > 0 : c.value() < 0)
            best = &v;
    }
    return ret(*best);
}

// Tasks -----------------------------------------------------------------------

BfRet bfRaise(BfCallState &st)
{
    if (!st.args[0].isErr())
        return error(ErrorCode::E_INVARG);
    std::string message = st.args.size() > 1 ? st.args[1].asStr() : std::string();
    Var value = st.args.size() > 2 ? st.args[2] : Var::fromInt(0);
    return bf::VmInstr{st.vm.raise(st.args[0].asErr(), std::move(message), std::move(value))};
}

BfRet bfSuspend(BfCallState &st)
{
    std::optional<double> delay;
    if (!st.args.empty())
    {
        delay = st.args[0].isInt() ? static_cast<double>(st.args[0].asInt()) : st.args[0].asFloat();
        if (*delay < 0.0 || !std::isfinite(*delay))
            return error(ErrorCode::E_INVARG);
    }
    return bf::VmInstr{result::Suspend{delay}};
}

BfRet bfCallers(BfCallState &st)
{
    return ret(Var::fromList(st.vm.callers()));
}

BfRet bfCallerPerms(BfCallState &st)
{
    const auto &frames = st.vm.activations();
    if (frames.size() < 2)
        return ret(Var::fromObj(values::kNothing));
    return ret(Var::fromObj(frames[frames.size() - 2].permissions()));
}

BfRet bfTaskId(BfCallState &st)
{
    return ret(Var::fromInt(static_cast<int64_t>(st.taskId)));
}

BfRet bfTicksLeft(BfCallState &st)
{
    return ret(Var::fromInt(st.ticksLeft));
}

BfRet bfSecondsLeft(BfCallState &st)
{
    return ret(Var::fromInt(static_cast<int64_t>(std::ceil(st.secondsLeft))));
}

struct Entry
{
    std::string_view name;
    BuiltinFn fn;
};

constexpr Entry kImplementations[] = {
    {"typeof", &bfTypeof},
    {"length", &bfLength},
    {"tostr", &bfTostr},
    {"toliteral", &bfToliteral},
    {"toint", &bfToint},
    {"tofloat", &bfTofloat},
    {"toobj", &bfToobj},
    {"equal", &bfEqual},
    {"is_member", &bfIsMember},
    {"listappend", &bfListappend},
    {"listinsert", &bfListinsert},
    {"listdelete", &bfListdelete},
    {"listset", &bfListset},
    {"setadd", &bfSetadd},
    {"setremove", &bfSetremove},
    {"abs", &bfAbs},
    {"min", &extremum<false>},
    {"max", &extremum<true>},
    {"raise", &bfRaise},
    {"suspend", &bfSuspend},
    {"callers", &bfCallers},
    {"caller_perms", &bfCallerPerms},
    {"task_id", &bfTaskId},
    {"ticks_left", &bfTicksLeft},
    {"seconds_left", &bfSecondsLeft},
};
} // namespace

BuiltinFunctions::BuiltinFunctions()
{
    const auto &registry = compiler::Builtins::instance();
    table_.assign(registry.size(), nullptr);
    for (const auto &entry : kImplementations)
    {
        if (auto id = registry.find(entry.name); id && registry.descriptor(*id).implemented)
            table_[*id] = entry.fn;
    }
}

const BuiltinFunctions &BuiltinFunctions::instance()
{
    static const BuiltinFunctions functions;
    return functions;
}

BfRet BuiltinFunctions::call(uint16_t id, BfCallState &state) const
{
    if (id >= table_.size())
        return error(ErrorCode::E_INVARG, "unknown builtin");

    const auto &desc = compiler::Builtins::instance().descriptor(id);
    if (!table_[id])
    {
        const std::string name(desc.name);
        return bf::VmInstr{state.vm.raise(ErrorCode::E_INVIND,
                                          "Builtin " + name + " is not implemented",
                                          Var::fromStr(name))};
    }
    const auto argc = static_cast<int>(state.args.size());
    if (argc < desc.minArgs || (desc.maxArgs >= 0 && argc > desc.maxArgs))
        return error(ErrorCode::E_ARGS);
    for (size_t i = 0; i < desc.types.size() && i < state.args.size(); ++i)
    {
        if (!matchesType(desc.types[i], state.args[i]))
            return error(ErrorCode::E_TYPE);
    }
    return table_[id](state);
}

} // namespace moo::vm
