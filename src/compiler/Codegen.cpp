//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the code generator. Every emission is paired with the matching
// operand-stack bookkeeping so loop exits can record absolute stack depths
// and the final balance check can catch generator bugs.
//
// Handler markers (Catch, TryExcept, TryFinally) occupy one operand slot so
// the interpreter can tell handlers inside a loop from handlers around it by
// depth alone. PushLabel only registers a handler and does not touch the
// operand stack.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief AST to instruction-stream lowering.
/// @details Jump targets are indirected through the label table: a label is
///          created when a branch needs it and committed once the target
///          position is known, so no instruction is ever patched.

#include "compiler/Codegen.hpp"
#include "compiler/Builtins.hpp"

#include <utility>

namespace moo::compiler
{
using support::Expected;
using values::Var;

namespace
{
/// Bookkeeping for break/continue inside a loop body.
struct Loop
{
    std::optional<Name> name;
    Label topLabel;
    Offset topStack;
    Label bottomLabel;
    Offset bottomStack;
};

support::Diag compileError(CompileErrorKind kind, std::string msg, size_t line)
{
    return support::makeCodedError(static_cast<uint32_t>(kind),
                                   std::move(msg),
                                   support::SourceLoc{static_cast<uint32_t>(line), 0});
}

class CodegenState
{
  public:
    explicit CodegenState(const Names &names) : names_(names) {}

    Expected<void> generateStmt(const Stmt &stmt);
    Expected<Program> finish();

  private:
    Label makeJumpLabel(std::optional<Name> name)
    {
        Label id{static_cast<uint32_t>(jumps_.size())};
        jumps_.push_back(JumpLabel{id, name, ops_.size()});
        return id;
    }

    void commitJumpLabel(Label id)
    {
        jumps_[id.id].position = ops_.size();
    }

    /// Literal dedupe is exact: "Foo" and "foo" get separate slots.
    uint32_t addLiteral(const Var &v)
    {
        for (size_t i = 0; i < literals_.size(); ++i)
        {
            if (literals_[i] == v)
                return static_cast<uint32_t>(i);
        }
        literals_.push_back(v);
        return static_cast<uint32_t>(literals_.size() - 1);
    }

    void emit(Op op)
    {
        ops_.push_back(std::move(op));
    }

    void pushStack(size_t n)
    {
        curStack_ += n;
    }

    void popStack(size_t n)
    {
        if (n > curStack_)
        {
            imbalance_ = true;
            curStack_ = 0;
            return;
        }
        curStack_ -= n;
    }

    Offset currentStack() const
    {
        return Offset{static_cast<uint32_t>(curStack_)};
    }

    std::optional<Offset> saveStackTop()
    {
        auto old = savedStack_;
        savedStack_ = Offset{static_cast<uint32_t>(curStack_ - 1)};
        return old;
    }

    void restoreStackTop(std::optional<Offset> old)
    {
        savedStack_ = old;
    }

    Expected<void> generateBody(const std::vector<Stmt> &body);
    Expected<void> generateExpr(const Expr &expr);
    Expected<void> generateAssign(const Expr &left, const Expr &right);
    Expected<void> generateScatterAssign(const Expr::Scatter &scatter);
    Expected<void> pushLvalue(const Expr &expr, bool indexedAbove);
    Expected<void> generateCodes(const CatchCodes &codes);
    Expected<void> generateArgList(const std::vector<Arg> &args);
    Expected<void> generateExit(const std::optional<Name> &exit, bool isBreak);

    Names names_;
    std::vector<Op> ops_;
    std::vector<JumpLabel> jumps_;
    std::vector<Var> literals_;
    std::vector<Loop> loops_;
    std::optional<Offset> savedStack_;
    size_t curStack_ = 0;
    bool imbalance_ = false;
    size_t line_ = 0;
    std::vector<std::vector<Op>> forkVectors_;
    std::vector<LineSpan> spans_;
    std::vector<std::vector<LineSpan>> forkSpans_;
};

Expected<void> CodegenState::generateBody(const std::vector<Stmt> &body)
{
    for (const auto &stmt : body)
    {
        if (auto result = generateStmt(stmt); !result)
            return result;
    }
    return {};
}

Expected<void> CodegenState::generateArgList(const std::vector<Arg> &args)
{
    if (args.empty())
    {
        emit(op::MkEmptyList{});
        pushStack(1);
        return {};
    }
    bool first = true;
    for (const auto &arg : args)
    {
        if (auto result = generateExpr(*arg.expr); !result)
            return result;
        if (arg.kind == ArgKind::Normal)
            emit(first ? Op{op::MakeSingletonList{}} : Op{op::ListAddTail{}});
        else
            emit(first ? Op{op::CheckListForSplice{}} : Op{op::ListAppend{}});
        if (!first)
            popStack(1);
        first = false;
    }
    return {};
}

Expected<void> CodegenState::generateCodes(const CatchCodes &codes)
{
    if (codes.any)
    {
        emit(op::ImmInt{0});
        pushStack(1);
        return {};
    }
    return generateArgList(codes.codes);
}

Expected<void> CodegenState::pushLvalue(const Expr &expr, bool indexedAbove)
{
    if (const auto *range = std::get_if<Expr::Range>(&expr.node))
    {
        if (auto result = pushLvalue(*range->base, true); !result)
            return result;
        auto old = saveStackTop();
        if (auto result = generateExpr(*range->from); !result)
            return result;
        if (auto result = generateExpr(*range->to); !result)
            return result;
        restoreStackTop(old);
        return {};
    }
    if (const auto *index = std::get_if<Expr::Index>(&expr.node))
    {
        if (auto result = pushLvalue(*index->base, true); !result)
            return result;
        auto old = saveStackTop();
        if (auto result = generateExpr(*index->index); !result)
            return result;
        restoreStackTop(old);
        if (indexedAbove)
        {
            emit(op::PushRef{});
            pushStack(1);
        }
        return {};
    }
    if (const auto *id = std::get_if<Expr::Id>(&expr.node))
    {
        if (indexedAbove)
        {
            emit(op::Push{id->name});
            pushStack(1);
        }
        return {};
    }
    if (const auto *prop = std::get_if<Expr::Prop>(&expr.node))
    {
        if (auto result = generateExpr(*prop->location); !result)
            return result;
        if (auto result = generateExpr(*prop->property); !result)
            return result;
        if (indexedAbove)
        {
            emit(op::PushGetProp{});
            pushStack(1);
        }
        return {};
    }
    return compileError(CompileErrorKind::InvalidLvalue, "invalid assignment target", line_);
}

Expected<void> CodegenState::generateAssign(const Expr &left, const Expr &right)
{
    if (auto result = pushLvalue(left, false); !result)
        return result;
    if (auto result = generateExpr(right); !result)
        return result;
    if (std::holds_alternative<Expr::Range>(left.node) ||
        std::holds_alternative<Expr::Index>(left.node))
        emit(op::PutTemp{});

    // Walk outward through the lvalue chain, storing each updated container
    // into the one that holds it.
    bool isIndexed = false;
    const Expr *e = &left;
    while (true)
    {
        if (const auto *range = std::get_if<Expr::Range>(&e->node))
        {
            emit(op::RangeSet{});
            popStack(3);
            e = &*range->base;
            isIndexed = true;
            continue;
        }
        if (const auto *index = std::get_if<Expr::Index>(&e->node))
        {
            emit(op::IndexSet{});
            popStack(2);
            e = &*index->base;
            isIndexed = true;
            continue;
        }
        if (const auto *id = std::get_if<Expr::Id>(&e->node))
        {
            emit(op::Put{id->name});
            break;
        }
        if (std::holds_alternative<Expr::Prop>(e->node))
        {
            emit(op::PutProp{});
            popStack(2);
            break;
        }
        return compileError(CompileErrorKind::InvalidLvalue, "invalid assignment target", line_);
    }
    if (isIndexed)
    {
        emit(op::Pop{});
        emit(op::PushTemp{});
    }
    return {};
}

Expected<void> CodegenState::generateScatterAssign(const Expr::Scatter &scatter)
{
    if (auto result = generateExpr(*scatter.rhs); !result)
        return result;

    op::Scatter sc;
    sc.nargs = static_cast<uint16_t>(scatter.items.size());
    sc.rest = static_cast<uint16_t>(scatter.items.size() + 1);
    for (size_t i = 0; i < scatter.items.size(); ++i)
    {
        const auto &item = scatter.items[i];
        ScatterLabel sl{item.kind, item.id, std::nullopt};
        switch (item.kind)
        {
            case ScatterKind::Required:
                ++sc.nreq;
                break;
            case ScatterKind::Optional:
                if (item.expr)
                    sl.label = makeJumpLabel(std::nullopt);
                break;
            case ScatterKind::Rest:
                sc.rest = static_cast<uint16_t>(i + 1);
                break;
        }
        sc.labels.push_back(sl);
    }
    sc.done = makeJumpLabel(std::nullopt);
    const auto labels = sc.labels;
    const Label done = sc.done;
    emit(std::move(sc));

    // Default expressions are only reached through their labels.
    for (size_t i = 0; i < labels.size(); ++i)
    {
        if (!labels[i].label)
            continue;
        commitJumpLabel(*labels[i].label);
        if (auto result = generateExpr(**scatter.items[i].expr); !result)
            return result;
        emit(op::Put{labels[i].id});
        emit(op::Pop{});
        popStack(1);
    }
    commitJumpLabel(done);
    return {};
}

Expected<void> CodegenState::generateExpr(const Expr &expr)
{
    return std::visit(
        [this](const auto &node) -> Expected<void>
        {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Expr::Value>)
            {
                emit(op::Imm{addLiteral(node.value)});
                pushStack(1);
            }
            else if constexpr (std::is_same_v<T, Expr::Id>)
            {
                emit(op::Push{node.name});
                pushStack(1);
            }
            else if constexpr (std::is_same_v<T, Expr::And> || std::is_same_v<T, Expr::Or>)
            {
                if (auto result = generateExpr(*node.lhs); !result)
                    return result;
                Label end = makeJumpLabel(std::nullopt);
                if constexpr (std::is_same_v<T, Expr::And>)
                    emit(op::And{end});
                else
                    emit(op::Or{end});
                popStack(1);
                if (auto result = generateExpr(*node.rhs); !result)
                    return result;
                commitJumpLabel(end);
            }
            else if constexpr (std::is_same_v<T, Expr::Binary>)
            {
                if (auto result = generateExpr(*node.lhs); !result)
                    return result;
                if (auto result = generateExpr(*node.rhs); !result)
                    return result;
                switch (node.op)
                {
                    case BinaryOp::Add:
                        emit(op::Add{});
                        break;
                    case BinaryOp::Sub:
                        emit(op::Sub{});
                        break;
                    case BinaryOp::Mul:
                        emit(op::Mul{});
                        break;
                    case BinaryOp::Div:
                        emit(op::Div{});
                        break;
                    case BinaryOp::Mod:
                        emit(op::Mod{});
                        break;
                    case BinaryOp::Eq:
                        emit(op::Eq{});
                        break;
                    case BinaryOp::NEq:
                        emit(op::Ne{});
                        break;
                    case BinaryOp::Gt:
                        emit(op::Gt{});
                        break;
                    case BinaryOp::GtE:
                        emit(op::Ge{});
                        break;
                    case BinaryOp::Lt:
                        emit(op::Lt{});
                        break;
                    case BinaryOp::LtE:
                        emit(op::Le{});
                        break;
                    case BinaryOp::Exp:
                        emit(op::Exp{});
                        break;
                    case BinaryOp::In:
                        emit(op::In{});
                        break;
                }
                popStack(1);
            }
            else if constexpr (std::is_same_v<T, Expr::Index>)
            {
                if (auto result = generateExpr(*node.base); !result)
                    return result;
                auto old = saveStackTop();
                if (auto result = generateExpr(*node.index); !result)
                    return result;
                restoreStackTop(old);
                emit(op::Ref{});
                popStack(1);
            }
            else if constexpr (std::is_same_v<T, Expr::Range>)
            {
                if (auto result = generateExpr(*node.base); !result)
                    return result;
                auto old = saveStackTop();
                if (auto result = generateExpr(*node.from); !result)
                    return result;
                if (auto result = generateExpr(*node.to); !result)
                    return result;
                restoreStackTop(old);
                emit(op::RangeRef{});
                popStack(2);
            }
            else if constexpr (std::is_same_v<T, Expr::Length>)
            {
                if (!savedStack_)
                    return compileError(CompileErrorKind::LengthOutsideIndex,
                                        "'$' used outside of an index or range",
                                        line_);
                emit(op::Length{*savedStack_});
                pushStack(1);
            }
            else if constexpr (std::is_same_v<T, Expr::Unary>)
            {
                if (auto result = generateExpr(*node.operand); !result)
                    return result;
                if (node.op == UnaryOp::Neg)
                    emit(op::UnaryMinus{});
                else
                    emit(op::Not{});
            }
            else if constexpr (std::is_same_v<T, Expr::Prop>)
            {
                if (auto result = generateExpr(*node.location); !result)
                    return result;
                if (auto result = generateExpr(*node.property); !result)
                    return result;
                emit(op::GetProp{});
                popStack(1);
            }
            else if constexpr (std::is_same_v<T, Expr::Pass>)
            {
                if (auto result = generateArgList(node.args); !result)
                    return result;
                emit(op::Pass{});
            }
            else if constexpr (std::is_same_v<T, Expr::Call>)
            {
                auto id = Builtins::instance().find(node.function);
                if (!id)
                    return compileError(CompileErrorKind::UnknownBuiltinFunction,
                                        "unknown built-in function: " + node.function,
                                        line_);
                if (auto result = generateArgList(node.args); !result)
                    return result;
                emit(op::FuncCall{*id});
            }
            else if constexpr (std::is_same_v<T, Expr::Verb>)
            {
                if (auto result = generateExpr(*node.location); !result)
                    return result;
                if (auto result = generateExpr(*node.verb); !result)
                    return result;
                if (auto result = generateArgList(node.args); !result)
                    return result;
                emit(op::CallVerb{});
                popStack(2);
            }
            else if constexpr (std::is_same_v<T, Expr::Cond>)
            {
                if (auto result = generateExpr(*node.condition); !result)
                    return result;
                Label elseLabel = makeJumpLabel(std::nullopt);
                emit(op::IfQues{elseLabel});
                popStack(1);
                if (auto result = generateExpr(*node.consequence); !result)
                    return result;
                Label end = makeJumpLabel(std::nullopt);
                emit(op::Jump{end});
                popStack(1);
                commitJumpLabel(elseLabel);
                if (auto result = generateExpr(*node.alternative); !result)
                    return result;
                commitJumpLabel(end);
            }
            else if constexpr (std::is_same_v<T, Expr::Catch>)
            {
                Label handler = makeJumpLabel(std::nullopt);
                if (auto result = generateCodes(node.codes); !result)
                    return result;
                emit(op::PushLabel{handler});
                emit(op::Catch{handler});
                pushStack(1);
                if (auto result = generateExpr(*node.trye); !result)
                    return result;
                Label end = makeJumpLabel(std::nullopt);
                emit(op::EndCatch{end});
                popStack(2);
                commitJumpLabel(handler);
                // The handler starts with the error list where the codes were.
                if (!node.except)
                {
                    emit(op::ImmInt{1});
                    pushStack(1);
                    emit(op::Ref{});
                    popStack(1);
                }
                else
                {
                    emit(op::Pop{});
                    popStack(1);
                    if (auto result = generateExpr(**node.except); !result)
                        return result;
                }
                commitJumpLabel(end);
            }
            else if constexpr (std::is_same_v<T, Expr::List>)
            {
                return generateArgList(node.items);
            }
            else if constexpr (std::is_same_v<T, Expr::Scatter>)
            {
                return generateScatterAssign(node);
            }
            else if constexpr (std::is_same_v<T, Expr::Assign>)
            {
                return generateAssign(*node.left, *node.right);
            }
            return {};
        },
        expr.node);
}

Expected<void> CodegenState::generateExit(const std::optional<Name> &exit, bool isBreak)
{
    const Loop *loop = nullptr;
    if (exit)
    {
        for (auto it = loops_.rbegin(); it != loops_.rend(); ++it)
        {
            if (it->name && *it->name == *exit)
            {
                loop = &*it;
                break;
            }
        }
        if (!loop)
            return compileError(CompileErrorKind::UnknownLoopLabel,
                                "unknown loop label: " + names_.name(*exit),
                                line_);
        if (isBreak)
            emit(op::ExitId{loop->bottomStack, loop->bottomLabel});
        else
            emit(op::ExitId{loop->topStack, loop->topLabel});
        return {};
    }
    if (loops_.empty())
        return compileError(CompileErrorKind::UnknownLoopLabel,
                            isBreak ? "break outside of a loop" : "continue outside of a loop",
                            line_);
    loop = &loops_.back();
    if (isBreak)
        emit(op::Exit{loop->bottomStack, loop->bottomLabel});
    else
        emit(op::Exit{loop->topStack, loop->topLabel});
    return {};
}

Expected<void> CodegenState::generateStmt(const Stmt &stmt)
{
    line_ = stmt.line;
    spans_.push_back(LineSpan{ops_.size(), stmt.line});
    return std::visit(
        [this](const auto &node) -> Expected<void>
        {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Stmt::Cond>)
            {
                Label end = makeJumpLabel(std::nullopt);
                bool first = true;
                for (const auto &arm : node.arms)
                {
                    if (auto result = generateExpr(arm.condition); !result)
                        return result;
                    Label otherwise = makeJumpLabel(std::nullopt);
                    if (first)
                        emit(op::If{otherwise});
                    else
                        emit(op::Eif{otherwise});
                    first = false;
                    popStack(1);
                    if (auto result = generateBody(arm.statements); !result)
                        return result;
                    emit(op::Jump{end});
                    commitJumpLabel(otherwise);
                }
                if (auto result = generateBody(node.otherwise); !result)
                    return result;
                commitJumpLabel(end);
            }
            else if constexpr (std::is_same_v<T, Stmt::ForList>)
            {
                if (auto result = generateExpr(node.expr); !result)
                    return result;
                // The counter is 0-based; ForList bumps it before indexing.
                emit(op::ImmInt{0});
                pushStack(1);
                Label top = makeJumpLabel(node.id);
                commitJumpLabel(top);
                Label end = makeJumpLabel(node.id);
                emit(op::ForList{node.id, end});
                loops_.push_back(Loop{node.id,
                                      top,
                                      currentStack(),
                                      end,
                                      Offset{static_cast<uint32_t>(curStack_ - 2)}});
                if (auto result = generateBody(node.body); !result)
                    return result;
                emit(op::Jump{top});
                commitJumpLabel(end);
                popStack(2);
                loops_.pop_back();
            }
            else if constexpr (std::is_same_v<T, Stmt::ForRange>)
            {
                if (auto result = generateExpr(node.from); !result)
                    return result;
                if (auto result = generateExpr(node.to); !result)
                    return result;
                Label top = makeJumpLabel(node.id);
                Label end = makeJumpLabel(node.id);
                commitJumpLabel(top);
                emit(op::ForRange{node.id, end});
                loops_.push_back(Loop{node.id,
                                      top,
                                      currentStack(),
                                      end,
                                      Offset{static_cast<uint32_t>(curStack_ - 2)}});
                if (auto result = generateBody(node.body); !result)
                    return result;
                emit(op::Jump{top});
                commitJumpLabel(end);
                popStack(2);
                loops_.pop_back();
            }
            else if constexpr (std::is_same_v<T, Stmt::While>)
            {
                Label start = makeJumpLabel(node.id);
                commitJumpLabel(start);
                Label end = makeJumpLabel(node.id);
                if (auto result = generateExpr(node.condition); !result)
                    return result;
                if (node.id)
                    emit(op::WhileId{*node.id, end});
                else
                    emit(op::While{end});
                popStack(1);
                loops_.push_back(Loop{node.id, start, currentStack(), end, currentStack()});
                if (auto result = generateBody(node.body); !result)
                    return result;
                emit(op::Jump{start});
                commitJumpLabel(end);
                loops_.pop_back();
            }
            else if constexpr (std::is_same_v<T, Stmt::Fork>)
            {
                if (auto result = generateExpr(node.time); !result)
                    return result;
                // The delay is consumed by Fork before the body starts.
                popStack(1);
                const size_t entryStack = curStack_;
                auto stashedOps = std::exchange(ops_, {});
                auto stashedSpans = std::exchange(spans_, {});
                auto stashedLoops = std::exchange(loops_, {});
                auto result = generateBody(node.body);
                if (result)
                {
                    emit(op::Done{});
                    if (curStack_ != entryStack)
                        imbalance_ = true;
                }
                Offset fv{static_cast<uint32_t>(forkVectors_.size())};
                forkVectors_.push_back(std::exchange(ops_, std::move(stashedOps)));
                forkSpans_.push_back(std::exchange(spans_, std::move(stashedSpans)));
                loops_ = std::move(stashedLoops);
                if (!result)
                    return result;
                emit(op::Fork{node.id, fv});
            }
            else if constexpr (std::is_same_v<T, Stmt::TryExcept>)
            {
                std::vector<Label> labels;
                for (const auto &arm : node.excepts)
                {
                    if (auto result = generateCodes(arm.codes); !result)
                        return result;
                    Label l = makeJumpLabel(std::nullopt);
                    emit(op::PushLabel{l});
                    labels.push_back(l);
                }
                const size_t count = node.excepts.size();
                emit(op::TryExcept{static_cast<uint16_t>(count)});
                pushStack(1);
                if (auto result = generateBody(node.body); !result)
                    return result;
                Label end = makeJumpLabel(std::nullopt);
                emit(op::EndExcept{end});
                popStack(count + 1);
                for (size_t i = 0; i < count; ++i)
                {
                    const auto &arm = node.excepts[i];
                    commitJumpLabel(labels[i]);
                    // Entered with the error list on the stack.
                    pushStack(1);
                    if (arm.id)
                        emit(op::Put{*arm.id});
                    emit(op::Pop{});
                    popStack(1);
                    if (auto result = generateBody(arm.statements); !result)
                        return result;
                    if (i + 1 < count)
                        emit(op::Jump{end});
                }
                commitJumpLabel(end);
            }
            else if constexpr (std::is_same_v<T, Stmt::TryFinally>)
            {
                Label handler = makeJumpLabel(std::nullopt);
                emit(op::TryFinally{handler});
                pushStack(1);
                if (auto result = generateBody(node.body); !result)
                    return result;
                // Replaces the marker with (payload, reason).
                emit(op::EndFinally{});
                pushStack(1);
                commitJumpLabel(handler);
                if (auto result = generateBody(node.handler); !result)
                    return result;
                emit(op::Continue{});
                popStack(2);
            }
            else if constexpr (std::is_same_v<T, Stmt::Break>)
            {
                return generateExit(node.exit, true);
            }
            else if constexpr (std::is_same_v<T, Stmt::Continue>)
            {
                return generateExit(node.exit, false);
            }
            else if constexpr (std::is_same_v<T, Stmt::Return>)
            {
                if (!node.value)
                {
                    emit(op::Return0{});
                    return {};
                }
                if (auto result = generateExpr(*node.value); !result)
                    return result;
                emit(op::Return{});
                popStack(1);
            }
            else if constexpr (std::is_same_v<T, Stmt::ExprStmt>)
            {
                if (auto result = generateExpr(node.expr); !result)
                    return result;
                emit(op::Pop{});
                popStack(1);
            }
            return {};
        },
        stmt.node);
}

Expected<Program> CodegenState::finish()
{
    emit(op::Done{});
    if (curStack_ != 0 || savedStack_ || imbalance_)
        return compileError(CompileErrorKind::StackImbalance,
                            "operand stack not balanced at end of compilation (depth " +
                                std::to_string(curStack_) + ")",
                            line_);

    Program program;
    program.literals = std::move(literals_);
    program.jumpLabels = std::move(jumps_);
    program.varNames = std::move(names_);
    program.mainVector = std::move(ops_);
    program.forkVectors = std::move(forkVectors_);
    program.lineNumberSpans = std::move(spans_);
    program.forkLineNumberSpans = std::move(forkSpans_);
    return program;
}
} // namespace

Expected<Program> compile(const ParsedProgram &parsed)
{
    CodegenState state(parsed.names);
    for (const auto &stmt : parsed.stmts)
    {
        if (auto result = state.generateStmt(stmt); !result)
            return result.error();
    }
    return state.finish();
}

} // namespace moo::compiler
