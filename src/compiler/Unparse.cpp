//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the unparser. Every expression form is assigned a binding level
// (0 binds tightest); an operand is parenthesised when its level is looser
// than its parent's, or equally loose on the side that the operator does not
// associate towards.
//
//===----------------------------------------------------------------------===//

#include "compiler/Unparse.hpp"

#include <cctype>

namespace moo::compiler
{
namespace
{
constexpr size_t kIndentWidth = 2;

/// Binding level of @p expr: 0 for primaries and postfix forms, 14 for
/// assignment.
int level(const Expr &expr)
{
    return std::visit(
        [](const auto &node) -> int
        {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Expr::Assign> || std::is_same_v<T, Expr::Scatter>)
                return 14;
            else if constexpr (std::is_same_v<T, Expr::Cond>)
                return 13;
            else if constexpr (std::is_same_v<T, Expr::Or>)
                return 12;
            else if constexpr (std::is_same_v<T, Expr::And>)
                return 11;
            else if constexpr (std::is_same_v<T, Expr::Binary>)
            {
                switch (node.op)
                {
                    case BinaryOp::Eq:
                    case BinaryOp::NEq:
                        return 7;
                    case BinaryOp::Gt:
                    case BinaryOp::GtE:
                    case BinaryOp::Lt:
                    case BinaryOp::LtE:
                    case BinaryOp::In:
                        return 6;
                    case BinaryOp::Add:
                    case BinaryOp::Sub:
                        return 4;
                    case BinaryOp::Mul:
                    case BinaryOp::Div:
                    case BinaryOp::Mod:
                        return 3;
                    case BinaryOp::Exp:
                        return 2;
                }
                return 2;
            }
            else if constexpr (std::is_same_v<T, Expr::Unary>)
                return 1;
            else
                return 0;
        },
        expr.node);
}

bool isIdentifier(const std::string &s)
{
    if (s.empty())
        return false;
    const auto first = static_cast<unsigned char>(s.front());
    if (!std::isalpha(first) && first != '_')
        return false;
    for (char c : s)
    {
        const auto u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && u != '_')
            return false;
    }
    return true;
}

bool isSystemObject(const Expr &expr)
{
    const auto *v = std::get_if<Expr::Value>(&expr.node);
    return v && v->value.isObj() && v->value.asObj() == 0;
}

class Unparser
{
  public:
    explicit Unparser(const Names &names) : names_(names) {}

    std::string expr(const Expr &e) const;

    void stmts(const std::vector<Stmt> &body, size_t indent, std::vector<std::string> &out) const;

  private:
    /// Parenthesise @p operand when it binds looser than @p parent (or
    /// equally loose when @p strict is set).
    std::string operand(const Expr &operand, const Expr &parent, bool strict) const
    {
        const int mine = level(operand);
        const int theirs = level(parent);
        const bool wrap = strict ? mine >= theirs : mine > theirs;
        std::string text = expr(operand);
        return wrap ? "(" + text + ")" : text;
    }

    std::string args(const std::vector<Arg> &list) const
    {
        std::string out;
        for (size_t i = 0; i < list.size(); ++i)
        {
            if (i)
                out += ", ";
            if (list[i].kind == ArgKind::Splice)
                out += '@';
            out += expr(*list[i].expr);
        }
        return out;
    }

    std::string codes(const CatchCodes &c) const
    {
        return c.any ? std::string("ANY") : args(c.codes);
    }

    /// A property or verb selector: bare when it is a valid identifier.
    std::string selector(const Expr &e) const
    {
        if (const auto *v = std::get_if<Expr::Value>(&e.node))
        {
            if (v->value.isStr() && isIdentifier(v->value.asStr()))
                return v->value.asStr();
        }
        return "(" + expr(e) + ")";
    }

    void stmt(const Stmt &s, size_t indent, std::vector<std::string> &out) const;

    const Names &names_;
};

std::string Unparser::expr(const Expr &e) const
{
    return std::visit(
        [&](const auto &node) -> std::string
        {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Expr::Value>)
                return node.value.toLiteral();
            else if constexpr (std::is_same_v<T, Expr::Id>)
                return names_.name(node.name);
            else if constexpr (std::is_same_v<T, Expr::Binary>)
            {
                // `^` associates to the right, everything else to the left.
                const bool right = node.op == BinaryOp::Exp;
                return operand(*node.lhs, e, right) + " " + std::string(binaryOpSymbol(node.op)) +
                       " " + operand(*node.rhs, e, !right);
            }
            else if constexpr (std::is_same_v<T, Expr::And>)
                return operand(*node.lhs, e, false) + " && " + operand(*node.rhs, e, true);
            else if constexpr (std::is_same_v<T, Expr::Or>)
                return operand(*node.lhs, e, false) + " || " + operand(*node.rhs, e, true);
            else if constexpr (std::is_same_v<T, Expr::Unary>)
            {
                std::string inner = operand(*node.operand, e, false);
                std::string sym(unaryOpSymbol(node.op));
                if (!inner.empty() && inner.front() == sym.front())
                    inner = "(" + inner + ")";
                return sym + inner;
            }
            else if constexpr (std::is_same_v<T, Expr::Prop>)
            {
                if (isSystemObject(*node.location) &&
                    std::holds_alternative<Expr::Value>(node.property->node))
                    return "$" + selector(*node.property);
                return operand(*node.location, e, false) + "." + selector(*node.property);
            }
            else if constexpr (std::is_same_v<T, Expr::Verb>)
            {
                std::string head;
                if (isSystemObject(*node.location) &&
                    std::holds_alternative<Expr::Value>(node.verb->node))
                    head = "$" + selector(*node.verb);
                else
                    head = operand(*node.location, e, false) + ":" + selector(*node.verb);
                return head + "(" + args(node.args) + ")";
            }
            else if constexpr (std::is_same_v<T, Expr::Call>)
                return node.function + "(" + args(node.args) + ")";
            else if constexpr (std::is_same_v<T, Expr::Pass>)
                return "pass(" + args(node.args) + ")";
            else if constexpr (std::is_same_v<T, Expr::Range>)
                return operand(*node.base, e, false) + "[" + expr(*node.from) + ".." +
                       expr(*node.to) + "]";
            else if constexpr (std::is_same_v<T, Expr::Index>)
                return operand(*node.base, e, false) + "[" + expr(*node.index) + "]";
            else if constexpr (std::is_same_v<T, Expr::Cond>)
                return operand(*node.condition, e, true) + " ? " + expr(*node.consequence) +
                       " | " + operand(*node.alternative, e, false);
            else if constexpr (std::is_same_v<T, Expr::Catch>)
            {
                std::string out = "`" + expr(*node.trye) + " ! " + codes(node.codes);
                if (node.except)
                    out += " => " + expr(**node.except);
                return out + "'";
            }
            else if constexpr (std::is_same_v<T, Expr::List>)
                return "{" + args(node.items) + "}";
            else if constexpr (std::is_same_v<T, Expr::Scatter>)
            {
                std::string out = "{";
                for (size_t i = 0; i < node.items.size(); ++i)
                {
                    const auto &item = node.items[i];
                    if (i)
                        out += ", ";
                    if (item.kind == ScatterKind::Optional)
                        out += '?';
                    else if (item.kind == ScatterKind::Rest)
                        out += '@';
                    out += names_.name(item.id);
                    if (item.expr)
                        out += " = " + expr(**item.expr);
                }
                return out + "} = " + expr(*node.rhs);
            }
            else if constexpr (std::is_same_v<T, Expr::Assign>)
                return expr(*node.left) + " = " + expr(*node.right);
            else
                return "$";
        },
        e.node);
}

void Unparser::stmts(const std::vector<Stmt> &body,
                     size_t indent,
                     std::vector<std::string> &out) const
{
    for (const auto &s : body)
        stmt(s, indent, out);
}

void Unparser::stmt(const Stmt &s, size_t indent, std::vector<std::string> &out) const
{
    const std::string pad(indent, ' ');
    const size_t inner = indent + kIndentWidth;

    std::visit(
        [&](const auto &node)
        {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Stmt::Cond>)
            {
                for (size_t i = 0; i < node.arms.size(); ++i)
                {
                    out.push_back(pad + (i ? "elseif (" : "if (") + expr(node.arms[i].condition) +
                                  ")");
                    stmts(node.arms[i].statements, inner, out);
                }
                if (!node.otherwise.empty())
                {
                    out.push_back(pad + "else");
                    stmts(node.otherwise, inner, out);
                }
                out.push_back(pad + "endif");
            }
            else if constexpr (std::is_same_v<T, Stmt::ForList>)
            {
                out.push_back(pad + "for " + names_.name(node.id) + " in (" + expr(node.expr) +
                              ")");
                stmts(node.body, inner, out);
                out.push_back(pad + "endfor");
            }
            else if constexpr (std::is_same_v<T, Stmt::ForRange>)
            {
                out.push_back(pad + "for " + names_.name(node.id) + " in [" + expr(node.from) +
                              ".." + expr(node.to) + "]");
                stmts(node.body, inner, out);
                out.push_back(pad + "endfor");
            }
            else if constexpr (std::is_same_v<T, Stmt::While>)
            {
                std::string head = pad + "while ";
                if (node.id)
                    head += names_.name(*node.id) + " ";
                out.push_back(head + "(" + expr(node.condition) + ")");
                stmts(node.body, inner, out);
                out.push_back(pad + "endwhile");
            }
            else if constexpr (std::is_same_v<T, Stmt::Fork>)
            {
                std::string head = pad + "fork ";
                if (node.id)
                    head += names_.name(*node.id) + " ";
                out.push_back(head + "(" + expr(node.time) + ")");
                stmts(node.body, inner, out);
                out.push_back(pad + "endfork");
            }
            else if constexpr (std::is_same_v<T, Stmt::TryExcept>)
            {
                out.push_back(pad + "try");
                stmts(node.body, inner, out);
                for (const auto &arm : node.excepts)
                {
                    std::string head = pad + "except ";
                    if (arm.id)
                        head += names_.name(*arm.id) + " ";
                    out.push_back(head + "(" + codes(arm.codes) + ")");
                    stmts(arm.statements, inner, out);
                }
                out.push_back(pad + "endtry");
            }
            else if constexpr (std::is_same_v<T, Stmt::TryFinally>)
            {
                out.push_back(pad + "try");
                stmts(node.body, inner, out);
                out.push_back(pad + "finally");
                stmts(node.handler, inner, out);
                out.push_back(pad + "endtry");
            }
            else if constexpr (std::is_same_v<T, Stmt::Break> || std::is_same_v<T, Stmt::Continue>)
            {
                std::string line = pad + (std::is_same_v<T, Stmt::Break> ? "break" : "continue");
                if (node.exit)
                    line += " " + names_.name(*node.exit);
                out.push_back(line + ";");
            }
            else if constexpr (std::is_same_v<T, Stmt::Return>)
            {
                if (node.value)
                    out.push_back(pad + "return " + expr(*node.value) + ";");
                else
                    out.push_back(pad + "return;");
            }
            else
                out.push_back(pad + expr(node.expr) + ";");
        },
        s.node);
}
} // namespace

std::string unparseExpr(const Names &names, const Expr &expr)
{
    return Unparser(names).expr(expr);
}

std::vector<std::string> unparseLines(const ParsedProgram &program)
{
    std::vector<std::string> out;
    Unparser(program.names).stmts(program.stmts, 0, out);
    return out;
}

std::string unparse(const ParsedProgram &program)
{
    std::string text;
    for (const auto &line : unparseLines(program))
    {
        text += line;
        text += '\n';
    }
    return text;
}

} // namespace moo::compiler
