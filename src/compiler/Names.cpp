//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the identifier table. Storage keeps the first spelling of each
// identifier while the index is keyed by the lowercased form so `Foo` and
// `foo` share one slot.
//
//===----------------------------------------------------------------------===//

#include "compiler/Names.hpp"

#include <array>
#include <cctype>

namespace moo::compiler
{
namespace
{
constexpr std::array<std::string_view, kGlobalNameCount> kGlobals = {
    "player", "this", "caller", "verb", "args", "argstr", "dobj", "dobjstr", "prepstr",
    "iobj",   "iobjstr", "NUM", "OBJ", "STR", "LIST", "ERR", "INT", "FLOAT",
};
} // namespace

Names::Names()
{
    for (auto g : kGlobals)
        findOrAdd(g);
}

Names::Names(std::vector<std::string> spellings) : names_(std::move(spellings))
{
    for (size_t i = 0; i < names_.size(); ++i)
        index_.emplace(fold(names_[i]), Name{static_cast<uint32_t>(i)});
}

std::string Names::fold(std::string_view ident)
{
    std::string out(ident);
    for (auto &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

Name Names::findOrAdd(std::string_view ident)
{
    auto key = fold(ident);
    auto it = index_.find(key);
    if (it != index_.end())
        return it->second;
    Name n{static_cast<uint32_t>(names_.size())};
    names_.emplace_back(ident);
    index_.emplace(std::move(key), n);
    return n;
}

std::optional<Name> Names::find(std::string_view ident) const
{
    auto it = index_.find(fold(ident));
    if (it == index_.end())
        return std::nullopt;
    return it->second;
}

const std::string &Names::name(Name name) const
{
    return names_.at(name.id);
}

} // namespace moo::compiler
