//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/compiler/Ast.hpp
// Purpose: Statement and expression trees consumed by the code generator and
//          produced by the decompiler.
// Key invariants: Trees are plain values: copying deep-copies, equality is
//                 structural. Every Name refers to the Names table of the
//                 ParsedProgram that holds the tree.
// Ownership/Lifetime: Children are owned through Box (unique ownership with
//                     value semantics).
// Links: src/compiler/Codegen.hpp, src/compiler/Decompiler.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "compiler/Labels.hpp"
#include "compiler/Names.hpp"
#include "values/Var.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace moo::compiler
{

/// @brief Heap-allocated child node with value semantics.
/// @details Copying a Box copies the pointee; comparing two Boxes compares the
///          pointees. This lets recursive node types keep defaulted equality.
template <typename T> class Box
{
  public:
    Box(T value) : ptr_(std::make_unique<T>(std::move(value))) {}

    Box(const Box &other) : ptr_(std::make_unique<T>(*other.ptr_)) {}

    Box(Box &&) noexcept = default;

    Box &operator=(const Box &other)
    {
        if (this != &other)
            ptr_ = std::make_unique<T>(*other.ptr_);
        return *this;
    }

    Box &operator=(Box &&) noexcept = default;

    T &operator*()
    {
        return *ptr_;
    }

    const T &operator*() const
    {
        return *ptr_;
    }

    T *operator->()
    {
        return ptr_.get();
    }

    const T *operator->() const
    {
        return ptr_.get();
    }

    friend bool operator==(const Box &a, const Box &b)
    {
        return *a.ptr_ == *b.ptr_;
    }

  private:
    std::unique_ptr<T> ptr_;
};

struct Expr;
struct Stmt;

enum class BinaryOp
{
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Eq,
    NEq,
    Gt,
    GtE,
    Lt,
    LtE,
    Exp,
    In,
};

enum class UnaryOp
{
    Neg,
    Not,
};

/// @brief Source spelling of @p op, e.g. "<=".
std::string_view binaryOpSymbol(BinaryOp op);

/// @brief Source spelling of @p op, "-" or "!".
std::string_view unaryOpSymbol(UnaryOp op);

enum class ArgKind
{
    Normal,
    Splice, ///< `@expr`: the list value is spliced into the argument list.
};

/// @brief Element of an argument list, list constructor or catch-code list.
struct Arg
{
    ArgKind kind = ArgKind::Normal;
    Box<Expr> expr;

    bool operator==(const Arg &) const = default;
};

/// @brief Error codes a catch expression or except arm intercepts.
struct CatchCodes
{
    bool any = false;       ///< `ANY`: catches every error; @ref codes is empty.
    std::vector<Arg> codes; ///< Explicit list, evaluated at runtime.

    bool operator==(const CatchCodes &) const = default;
};

enum class ScatterKind
{
    Required,
    Optional,
    Rest,
};

/// @brief One target of a scatter assignment `{a, ?b = 1, @c} = ...`.
struct ScatterItem
{
    ScatterKind kind = ScatterKind::Required;
    Name id;
    std::optional<Box<Expr>> expr; ///< Default for an optional target.

    bool operator==(const ScatterItem &) const = default;
};

/// @brief Expression tree node.
struct Expr
{
    struct Value
    {
        values::Var value;
        bool operator==(const Value &) const = default;
    };

    struct Id
    {
        Name name;
        bool operator==(const Id &) const = default;
    };

    struct Binary
    {
        BinaryOp op;
        Box<Expr> lhs;
        Box<Expr> rhs;
        bool operator==(const Binary &) const = default;
    };

    struct And
    {
        Box<Expr> lhs;
        Box<Expr> rhs;
        bool operator==(const And &) const = default;
    };

    struct Or
    {
        Box<Expr> lhs;
        Box<Expr> rhs;
        bool operator==(const Or &) const = default;
    };

    struct Unary
    {
        UnaryOp op;
        Box<Expr> operand;
        bool operator==(const Unary &) const = default;
    };

    /// `location.property` or `location.(expr)`.
    struct Prop
    {
        Box<Expr> location;
        Box<Expr> property;
        bool operator==(const Prop &) const = default;
    };

    /// `location:verb(args)`.
    struct Verb
    {
        Box<Expr> location;
        Box<Expr> verb;
        std::vector<Arg> args;
        bool operator==(const Verb &) const = default;
    };

    /// Builtin function call by name.
    struct Call
    {
        std::string function;
        std::vector<Arg> args;
        bool operator==(const Call &) const = default;
    };

    /// `pass(args)`: call the same verb on the definer's parent.
    struct Pass
    {
        std::vector<Arg> args;
        bool operator==(const Pass &) const = default;
    };

    struct Range
    {
        Box<Expr> base;
        Box<Expr> from;
        Box<Expr> to;
        bool operator==(const Range &) const = default;
    };

    struct Index
    {
        Box<Expr> base;
        Box<Expr> index;
        bool operator==(const Index &) const = default;
    };

    /// `condition ? consequence | alternative`.
    struct Cond
    {
        Box<Expr> condition;
        Box<Expr> consequence;
        Box<Expr> alternative;
        bool operator==(const Cond &) const = default;
    };

    /// `` `trye ! codes => except' ``.
    struct Catch
    {
        Box<Expr> trye;
        CatchCodes codes;
        std::optional<Box<Expr>> except;
        bool operator==(const Catch &) const = default;
    };

    struct List
    {
        std::vector<Arg> items;
        bool operator==(const List &) const = default;
    };

    struct Scatter
    {
        std::vector<ScatterItem> items;
        Box<Expr> rhs;
        bool operator==(const Scatter &) const = default;
    };

    struct Assign
    {
        Box<Expr> left;
        Box<Expr> right;
        bool operator==(const Assign &) const = default;
    };

    /// `$` inside an index or range: length of the value being indexed.
    struct Length
    {
        bool operator==(const Length &) const = default;
    };

    using Node = std::variant<Value,
                              Id,
                              Binary,
                              And,
                              Or,
                              Unary,
                              Prop,
                              Verb,
                              Call,
                              Pass,
                              Range,
                              Index,
                              Cond,
                              Catch,
                              List,
                              Scatter,
                              Assign,
                              Length>;

    Node node;

    bool operator==(const Expr &) const = default;
};

/// @brief Statement tree node with the source line it started on.
struct Stmt
{
    struct CondArm
    {
        Expr condition;
        std::vector<Stmt> statements;
        bool operator==(const CondArm &) const = default;
    };

    /// `if/elseif/else`. An empty @ref otherwise means no else branch.
    struct Cond
    {
        std::vector<CondArm> arms;
        std::vector<Stmt> otherwise;
        bool operator==(const Cond &) const = default;
    };

    /// `for id in (expr)`.
    struct ForList
    {
        Name id;
        Expr expr;
        std::vector<Stmt> body;
        bool operator==(const ForList &) const = default;
    };

    /// `for id in [from..to]`.
    struct ForRange
    {
        Name id;
        Expr from;
        Expr to;
        std::vector<Stmt> body;
        bool operator==(const ForRange &) const = default;
    };

    /// `while [id] (condition)`; a named loop also binds the condition value.
    struct While
    {
        std::optional<Name> id;
        Expr condition;
        std::vector<Stmt> body;
        bool operator==(const While &) const = default;
    };

    /// `fork [id] (time)`; @ref id receives the new task id.
    struct Fork
    {
        std::optional<Name> id;
        Expr time;
        std::vector<Stmt> body;
        bool operator==(const Fork &) const = default;
    };

    struct ExceptArm
    {
        std::optional<Name> id;
        CatchCodes codes;
        std::vector<Stmt> statements;
        bool operator==(const ExceptArm &) const = default;
    };

    struct TryExcept
    {
        std::vector<Stmt> body;
        std::vector<ExceptArm> excepts;
        bool operator==(const TryExcept &) const = default;
    };

    struct TryFinally
    {
        std::vector<Stmt> body;
        std::vector<Stmt> handler;
        bool operator==(const TryFinally &) const = default;
    };

    struct Break
    {
        std::optional<Name> exit;
        bool operator==(const Break &) const = default;
    };

    struct Continue
    {
        std::optional<Name> exit;
        bool operator==(const Continue &) const = default;
    };

    struct Return
    {
        std::optional<Expr> value;
        bool operator==(const Return &) const = default;
    };

    struct ExprStmt
    {
        Expr expr;
        bool operator==(const ExprStmt &) const = default;
    };

    using Node = std::variant<Cond,
                              ForList,
                              ForRange,
                              While,
                              Fork,
                              TryExcept,
                              TryFinally,
                              Break,
                              Continue,
                              Return,
                              ExprStmt>;

    Node node;
    size_t line = 0;

    bool operator==(const Stmt &) const = default;
};

/// @brief A verb body as handed to the code generator: its identifier table
///        and top-level statements.
struct ParsedProgram
{
    Names names;
    std::vector<Stmt> stmts;

    bool operator==(const ParsedProgram &) const = default;
};

} // namespace moo::compiler
