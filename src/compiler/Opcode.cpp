//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Mnemonic table and operand rendering for the instruction set. The table is
// indexed by the variant index of Op.
//
//===----------------------------------------------------------------------===//

#include "compiler/Opcode.hpp"

#include <array>
#include <sstream>

namespace moo::compiler
{
namespace
{
constexpr std::array<std::string_view, 64> kOpNames = {
    "Imm",        "ImmInt",      "Push",       "Put",         "Pop",
    "If",         "Eif",         "IfQues",     "While",       "WhileId",
    "Jump",       "ForList",     "ForRange",   "And",         "Or",
    "Eq",         "Ne",          "Lt",         "Le",          "Gt",
    "Ge",         "In",          "Add",        "Sub",         "Mul",
    "Div",        "Mod",         "Exp",        "UnaryMinus",  "Not",
    "Ref",        "PushRef",     "RangeRef",   "IndexSet",    "RangeSet",
    "PutTemp",    "PushTemp",    "Length",     "GetProp",     "PushGetProp",
    "PutProp",    "CallVerb",    "Pass",       "FuncCall",    "MkEmptyList",
    "MakeSingletonList", "ListAddTail", "ListAppend", "CheckListForSplice", "Scatter",
    "Fork",       "PushLabel",   "Catch",      "TryExcept",   "TryFinally",
    "EndCatch",   "EndExcept",   "EndFinally", "Continue",    "Exit",
    "ExitId",     "Return",      "Return0",    "Done",
};

static_assert(kOpNames.size() == std::variant_size_v<Op>, "opcode name table out of sync");

void writeOperand(std::ostream &os, Label l)
{
    os << 'L' << l.id;
}

void writeOperand(std::ostream &os, Name n)
{
    os << 'n' << n.id;
}

void writeOperand(std::ostream &os, Offset o)
{
    os << '@' << o.value;
}

void writeOperand(std::ostream &os, int32_t v)
{
    os << v;
}

void writeOperand(std::ostream &os, uint32_t v)
{
    os << v;
}

void writeOperand(std::ostream &os, uint16_t v)
{
    os << v;
}

template <typename T> void writeOperand(std::ostream &os, const std::optional<T> &v)
{
    if (v)
        writeOperand(os, *v);
    else
        os << '-';
}

void writeOperand(std::ostream &os, const std::vector<ScatterLabel> &labels)
{
    os << '[';
    bool first = true;
    for (const auto &sl : labels)
    {
        if (!first)
            os << ", ";
        first = false;
        switch (sl.kind)
        {
            case ScatterKind::Required:
                os << "req ";
                break;
            case ScatterKind::Optional:
                os << "opt ";
                break;
            case ScatterKind::Rest:
                os << "rest ";
                break;
        }
        writeOperand(os, sl.id);
        if (sl.label)
        {
            os << ' ';
            writeOperand(os, *sl.label);
        }
    }
    os << ']';
}
} // namespace

std::string_view opcodeName(const Op &op)
{
    return kOpNames[op.index()];
}

std::string formatOp(const Op &op)
{
    std::ostringstream os;
    os << opcodeName(op);
    std::visit(
        [&os](const auto &o)
        {
            using T = std::decay_t<decltype(o)>;
            if constexpr (kOpHasFields<const T>)
            {
                std::apply([&os](const auto &...f) { ((os << ' ', writeOperand(os, f)), ...); },
                           o.fields());
            }
        },
        op);
    return os.str();
}

} // namespace moo::compiler
