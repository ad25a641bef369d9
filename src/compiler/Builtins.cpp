//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Builtin descriptor table. Entries flagged unimplemented still compile so
// that verbs referencing them load; calling one raises E_INVARG at runtime.
//
//===----------------------------------------------------------------------===//

#include "compiler/Builtins.hpp"

#include <cctype>

namespace moo::compiler
{
namespace
{
constexpr int kUnbounded = -1;

bool sameName(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}
} // namespace

Builtins::Builtins()
{
    using enum ArgType;
    table_ = {
        {"typeof", 1, 1, {Any}},
        {"length", 1, 1, {Any}},
        {"tostr", 0, kUnbounded, {}},
        {"toliteral", 1, 1, {Any}},
        {"toint", 1, 1, {Any}},
        {"tofloat", 1, 1, {Any}},
        {"toobj", 1, 1, {Any}},
        {"equal", 2, 2, {Any, Any}},
        {"is_member", 2, 2, {Any, List}},
        {"listappend", 2, 3, {List, Any, Int}},
        {"listinsert", 2, 3, {List, Any, Int}},
        {"listdelete", 2, 2, {List, Int}},
        {"listset", 3, 3, {List, Any, Int}},
        {"setadd", 2, 2, {List, Any}},
        {"setremove", 2, 2, {List, Any}},
        {"abs", 1, 1, {Num}},
        {"min", 1, kUnbounded, {Num}},
        {"max", 1, kUnbounded, {Num}},
        {"raise", 1, 3, {Any, Str, Any}},
        {"suspend", 0, 1, {Num}},
        {"callers", 0, 1, {Any}},
        {"caller_perms", 0, 0, {}},
        {"task_id", 0, 0, {}},
        {"ticks_left", 0, 0, {}},
        {"seconds_left", 0, 0, {}},
        {"notify", 2, 3, {Obj, Str, Any}, false},
        {"valid", 1, 1, {Obj}, false},
        {"parent", 1, 1, {Obj}, false},
        {"time", 0, 0, {}, false},
        {"random", 0, 1, {Int}, false},
        {"index", 2, 3, {Str, Str, Any}, false},
        {"strsub", 3, 4, {Str, Str, Str, Any}, false},
        {"server_log", 1, 2, {Str, Any}, false},
    };
}

const Builtins &Builtins::instance()
{
    static const Builtins builtins;
    return builtins;
}

std::optional<uint16_t> Builtins::find(std::string_view name) const
{
    for (size_t i = 0; i < table_.size(); ++i)
    {
        if (sameName(table_[i].name, name))
            return static_cast<uint16_t>(i);
    }
    return std::nullopt;
}

} // namespace moo::compiler
