//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/compiler/Opcode.hpp
// Purpose: Closed instruction set executed by the interpreter.
// Key invariants: The net operand-stack effect of every instruction is fixed;
//                 the code generator accounts for it at each emission. The
//                 order of alternatives in Op is the wire tag used by the
//                 program codec and must only ever be appended to.
// Ownership/Lifetime: Instructions are plain values.
// Links: src/compiler/Program.hpp, src/vm/VMExecute.cpp
//
//===----------------------------------------------------------------------===//
//
// Operand-carrying instructions expose their operands through fields(), a
// tuple of references generated by MOO_OP_FIELDS. The program codec and the
// disassembler walk that tuple, so adding an instruction never requires
// touching either of them.

#pragma once

#include "compiler/Ast.hpp"
#include "compiler/Labels.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

/// @brief Declare the operand tuple and member-wise equality of an instruction.
#define MOO_OP_FIELDS(Type, ...)                                                                   \
    auto fields()                                                                                  \
    {                                                                                              \
        return std::tie(__VA_ARGS__);                                                              \
    }                                                                                              \
    auto fields() const                                                                            \
    {                                                                                              \
        return std::tie(__VA_ARGS__);                                                              \
    }                                                                                              \
    bool operator==(const Type &) const = default;

/// @brief Declare an instruction without operands.
#define MOO_OP_NULLARY(Type)                                                                       \
    struct Type                                                                                    \
    {                                                                                              \
        bool operator==(const Type &) const = default;                                             \
    };

namespace moo::compiler
{

/// @brief Target of a scatter assignment as seen by the interpreter.
struct ScatterLabel
{
    ScatterKind kind = ScatterKind::Required;
    Name id;
    std::optional<Label> label; ///< Default-expression entry for optionals.

    bool operator==(const ScatterLabel &) const = default;
};

namespace op
{
// Constants and variables.
struct Imm
{
    uint32_t literal = 0; ///< Literal-pool index.
    MOO_OP_FIELDS(Imm, literal)
};

struct ImmInt
{
    int32_t value = 0;
    MOO_OP_FIELDS(ImmInt, value)
};

struct Push
{
    Name name;
    MOO_OP_FIELDS(Push, name)
};

/// Stores the top of stack without popping it.
struct Put
{
    Name name;
    MOO_OP_FIELDS(Put, name)
};

MOO_OP_NULLARY(Pop)

// Control flow. Conditional jumps pop the tested value.
struct If
{
    Label label;
    MOO_OP_FIELDS(If, label)
};

struct Eif
{
    Label label;
    MOO_OP_FIELDS(Eif, label)
};

struct IfQues
{
    Label label;
    MOO_OP_FIELDS(IfQues, label)
};

struct While
{
    Label label;
    MOO_OP_FIELDS(While, label)
};

struct WhileId
{
    Name id;
    Label label;
    MOO_OP_FIELDS(WhileId, id, label)
};

struct Jump
{
    Label label;
    MOO_OP_FIELDS(Jump, label)
};

/// Iterates over [list, counter]; pops both and jumps to @ref end when done.
struct ForList
{
    Name id;
    Label end;
    MOO_OP_FIELDS(ForList, id, end)
};

/// Iterates over [from, to]; pops both and jumps to @ref end when done.
struct ForRange
{
    Name id;
    Label end;
    MOO_OP_FIELDS(ForRange, id, end)
};

/// Short-circuit: keeps the value and jumps when false, else pops it.
struct And
{
    Label label;
    MOO_OP_FIELDS(And, label)
};

/// Short-circuit: keeps the value and jumps when true, else pops it.
struct Or
{
    Label label;
    MOO_OP_FIELDS(Or, label)
};

// Operators.
MOO_OP_NULLARY(Eq)
MOO_OP_NULLARY(Ne)
MOO_OP_NULLARY(Lt)
MOO_OP_NULLARY(Le)
MOO_OP_NULLARY(Gt)
MOO_OP_NULLARY(Ge)
MOO_OP_NULLARY(In)
MOO_OP_NULLARY(Add)
MOO_OP_NULLARY(Sub)
MOO_OP_NULLARY(Mul)
MOO_OP_NULLARY(Div)
MOO_OP_NULLARY(Mod)
MOO_OP_NULLARY(Exp)
MOO_OP_NULLARY(UnaryMinus)
MOO_OP_NULLARY(Not)

// Indexing and lvalues.
MOO_OP_NULLARY(Ref)
MOO_OP_NULLARY(PushRef)
MOO_OP_NULLARY(RangeRef)
MOO_OP_NULLARY(IndexSet)
MOO_OP_NULLARY(RangeSet)
MOO_OP_NULLARY(PutTemp)
MOO_OP_NULLARY(PushTemp)

/// Pushes the length of the value at stack offset @ref offset.
struct Length
{
    Offset offset;
    MOO_OP_FIELDS(Length, offset)
};

// Properties, verbs and builtins.
MOO_OP_NULLARY(GetProp)
MOO_OP_NULLARY(PushGetProp)
MOO_OP_NULLARY(PutProp)
MOO_OP_NULLARY(CallVerb)
MOO_OP_NULLARY(Pass)

struct FuncCall
{
    uint16_t id = 0; ///< Builtin registry id.
    MOO_OP_FIELDS(FuncCall, id)
};

// List construction.
MOO_OP_NULLARY(MkEmptyList)
MOO_OP_NULLARY(MakeSingletonList)
MOO_OP_NULLARY(ListAddTail)
MOO_OP_NULLARY(ListAppend)
MOO_OP_NULLARY(CheckListForSplice)

/// Destructures the list on top of the stack, leaving it in place.
/// @details @ref rest is the 1-based position of the rest target, or a value
///          greater than @ref nargs when there is none.
struct Scatter
{
    uint16_t nargs = 0;
    uint16_t nreq = 0;
    uint16_t rest = 0;
    std::vector<ScatterLabel> labels;
    Label done;
    MOO_OP_FIELDS(Scatter, nargs, nreq, rest, labels, done)
};

/// Pops the delay and requests a task running fork vector @ref vector.
struct Fork
{
    std::optional<Name> id;
    Offset vector;
    MOO_OP_FIELDS(Fork, id, vector)
};

// Exception handling. Catch, TryExcept and TryFinally push a marker value.
struct PushLabel
{
    Label label;
    MOO_OP_FIELDS(PushLabel, label)
};

struct Catch
{
    Label label;
    MOO_OP_FIELDS(Catch, label)
};

struct TryExcept
{
    uint16_t count = 0;
    MOO_OP_FIELDS(TryExcept, count)
};

struct TryFinally
{
    Label label;
    MOO_OP_FIELDS(TryFinally, label)
};

struct EndCatch
{
    Label label;
    MOO_OP_FIELDS(EndCatch, label)
};

struct EndExcept
{
    Label label;
    MOO_OP_FIELDS(EndExcept, label)
};

MOO_OP_NULLARY(EndFinally)
MOO_OP_NULLARY(Continue)

// Exits and returns.
/// Unwinds to operand depth @ref stack and jumps to @ref label.
struct Exit
{
    Offset stack;
    Label label;
    MOO_OP_FIELDS(Exit, stack, label)
};

/// Exit produced by a labelled break or continue.
struct ExitId
{
    Offset stack;
    Label label;
    MOO_OP_FIELDS(ExitId, stack, label)
};

MOO_OP_NULLARY(Return)
MOO_OP_NULLARY(Return0)
MOO_OP_NULLARY(Done)
} // namespace op

using Op = std::variant<op::Imm,
                        op::ImmInt,
                        op::Push,
                        op::Put,
                        op::Pop,
                        op::If,
                        op::Eif,
                        op::IfQues,
                        op::While,
                        op::WhileId,
                        op::Jump,
                        op::ForList,
                        op::ForRange,
                        op::And,
                        op::Or,
                        op::Eq,
                        op::Ne,
                        op::Lt,
                        op::Le,
                        op::Gt,
                        op::Ge,
                        op::In,
                        op::Add,
                        op::Sub,
                        op::Mul,
                        op::Div,
                        op::Mod,
                        op::Exp,
                        op::UnaryMinus,
                        op::Not,
                        op::Ref,
                        op::PushRef,
                        op::RangeRef,
                        op::IndexSet,
                        op::RangeSet,
                        op::PutTemp,
                        op::PushTemp,
                        op::Length,
                        op::GetProp,
                        op::PushGetProp,
                        op::PutProp,
                        op::CallVerb,
                        op::Pass,
                        op::FuncCall,
                        op::MkEmptyList,
                        op::MakeSingletonList,
                        op::ListAddTail,
                        op::ListAppend,
                        op::CheckListForSplice,
                        op::Scatter,
                        op::Fork,
                        op::PushLabel,
                        op::Catch,
                        op::TryExcept,
                        op::TryFinally,
                        op::EndCatch,
                        op::EndExcept,
                        op::EndFinally,
                        op::Continue,
                        op::Exit,
                        op::ExitId,
                        op::Return,
                        op::Return0,
                        op::Done>;

/// @brief True when instruction type @p T carries operands.
template <typename T>
inline constexpr bool kOpHasFields = requires(T &t) { t.fields(); };

/// @brief Mnemonic of @p op, e.g. "ForList".
std::string_view opcodeName(const Op &op);

/// @brief Mnemonic plus operands, e.g. "ForList n18 L3".
std::string formatOp(const Op &op);

} // namespace moo::compiler
