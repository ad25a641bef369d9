//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the decompiler as a single forward pass over each instruction
// vector. Expression instructions build partial trees on a simulated operand
// stack; control-flow instructions decode their nested statement lists up to
// the positions recorded in the label table. Loop exits are matched against a
// stack of enclosing loops to recover break/continue and their labels.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Program to statement-tree reconstruction.

#include "compiler/Decompiler.hpp"
#include "compiler/Builtins.hpp"

#include <utility>

namespace moo::compiler
{
using support::Diag;
using support::Expected;
using values::Var;

namespace
{
Diag malformed(const std::string &what, size_t pc)
{
    return support::makeCodedError(static_cast<uint32_t>(DecompileErrorKind::MalformedProgram),
                                   "malformed program: " + what + " at pc " + std::to_string(pc));
}

/// Instructions that complete a statement (or open a statement block).
bool isStatementOp(const Op &op)
{
    return std::holds_alternative<op::If>(op) || std::holds_alternative<op::While>(op) ||
           std::holds_alternative<op::WhileId>(op) || std::holds_alternative<op::ForList>(op) ||
           std::holds_alternative<op::ForRange>(op) || std::holds_alternative<op::Fork>(op) ||
           std::holds_alternative<op::TryExcept>(op) ||
           std::holds_alternative<op::TryFinally>(op) || std::holds_alternative<op::Exit>(op) ||
           std::holds_alternative<op::ExitId>(op) || std::holds_alternative<op::Return>(op) ||
           std::holds_alternative<op::Return0>(op) || std::holds_alternative<op::Pop>(op);
}

struct LoopContext
{
    std::optional<Name> name;
    Label top;
    Label bottom;
};

class Decompile
{
  public:
    explicit Decompile(const Program &program) : program_(program) {}

    /// Decode a whole vector: statements followed by the closing Done.
    Expected<std::vector<Stmt>> run(std::optional<size_t> forkVector);

  private:
    const Op *peek(size_t ahead = 0) const
    {
        if (position_ + ahead >= ops_->size())
            return nullptr;
        return &(*ops_)[position_ + ahead];
    }

    template <typename T> Expected<T> expectOp()
    {
        const Op *op = peek();
        const T *typed = op ? std::get_if<T>(op) : nullptr;
        if (!typed)
            return malformed("expected " + std::string(opcodeName(Op{T{}})), position_);
        ++position_;
        return *typed;
    }

    Expected<size_t> labelPosition(Label label) const
    {
        if (label.id >= program_.jumpLabels.size())
            return malformed("unknown label L" + std::to_string(label.id), position_);
        return program_.jumpLabels[label.id].position;
    }

    Expected<Expr> popExpr()
    {
        if (exprs_.empty())
            return malformed("expected expression on stack", position_);
        Expr e = std::move(exprs_.back());
        exprs_.pop_back();
        return e;
    }

    void pushExpr(Expr::Node node)
    {
        exprs_.push_back(Expr{std::move(node)});
    }

    Expected<std::vector<Stmt>> statementsUntil(size_t end);
    template <typename T> Expected<std::vector<Stmt>> statementsUntilOp();
    Expected<Stmt> statement();
    Expected<Stmt::Node> statementNode();
    Expected<Stmt::Node> condStatement(Expr condition, Label otherwise);
    Expected<std::vector<Stmt>> loopBody(const std::optional<Name> &name, Label end);
    Expected<Stmt::Node> tryExceptStatement(uint16_t count);
    Expected<Stmt::Node> exitStatement(Label label, bool named);

    Expected<void> stepExpr();
    Expected<Expr> exprUntil(size_t end);
    Expected<void> assignChain();
    Expected<void> catchExpr(Label handler);
    Expected<void> scatterExpr(const op::Scatter &sc);
    Expected<std::vector<Arg>> argsOf(Expr e);
    Expected<CatchCodes> codesOf(Expr e);

    const Program &program_;
    std::optional<size_t> forkVector_;
    const std::vector<Op> *ops_ = nullptr;
    size_t position_ = 0;
    std::vector<Expr> exprs_;
    std::vector<Label> pendingLabels_;
    std::vector<LoopContext> loops_;
};

Expected<std::vector<Stmt>> Decompile::run(std::optional<size_t> forkVector)
{
    if (forkVector && *forkVector >= program_.forkVectors.size())
        return malformed("unknown fork vector " + std::to_string(*forkVector), position_);
    forkVector_ = forkVector;
    ops_ = &program_.vector(forkVector);
    position_ = 0;
    if (ops_->empty() || !std::holds_alternative<op::Done>(ops_->back()))
        return malformed("vector does not end with Done", ops_->size());
    auto stmts = statementsUntil(ops_->size() - 1);
    if (!stmts)
        return stmts.error();
    return stmts;
}

Expected<std::vector<Stmt>> Decompile::statementsUntil(size_t end)
{
    std::vector<Stmt> out;
    while (position_ < end)
    {
        auto stmt = statement();
        if (!stmt)
            return stmt.error();
        out.push_back(std::move(stmt.value()));
    }
    if (position_ != end)
        return malformed("statement overran block end " + std::to_string(end), position_);
    return out;
}

template <typename T> Expected<std::vector<Stmt>> Decompile::statementsUntilOp()
{
    std::vector<Stmt> out;
    while (true)
    {
        const Op *op = peek();
        if (!op)
            return malformed("unterminated block", position_);
        if (std::holds_alternative<T>(*op))
            return out;
        auto stmt = statement();
        if (!stmt)
            return stmt.error();
        out.push_back(std::move(stmt.value()));
    }
}

Expected<Stmt> Decompile::statement()
{
    const size_t start = position_;
    while (true)
    {
        const Op *op = peek();
        if (!op)
            return malformed("unexpected end of vector", position_);
        if (isStatementOp(*op))
            break;
        if (auto result = stepExpr(); !result)
            return result.error();
    }
    auto node = statementNode();
    if (!node)
        return node.error();
    if (!exprs_.empty() || !pendingLabels_.empty())
        return malformed("operand stack not empty at statement end", position_);
    return Stmt{std::move(node.value()), program_.findLine(forkVector_, start)};
}

Expected<Stmt::Node> Decompile::statementNode()
{
    const Op op = (*ops_)[position_++];

    if (const auto *o = std::get_if<op::If>(&op))
    {
        auto cond = popExpr();
        if (!cond)
            return cond.error();
        return condStatement(std::move(cond.value()), o->label);
    }
    if (std::holds_alternative<op::While>(op) || std::holds_alternative<op::WhileId>(op))
    {
        std::optional<Name> id;
        Label end;
        if (const auto *w = std::get_if<op::WhileId>(&op))
        {
            id = w->id;
            end = w->label;
        }
        else
        {
            end = std::get<op::While>(op).label;
        }
        auto cond = popExpr();
        if (!cond)
            return cond.error();
        auto body = loopBody(id, end);
        if (!body)
            return body.error();
        return Stmt::While{id, std::move(cond.value()), std::move(body.value())};
    }
    if (const auto *o = std::get_if<op::ForList>(&op))
    {
        auto counter = popExpr();
        if (!counter)
            return counter.error();
        const auto *seed = std::get_if<Expr::Value>(&counter.value().node);
        if (!seed || !(seed->value == Var::fromInt(0)))
            return malformed("ForList without counter seed", position_ - 1);
        auto list = popExpr();
        if (!list)
            return list.error();
        auto body = loopBody(o->id, o->end);
        if (!body)
            return body.error();
        return Stmt::ForList{o->id, std::move(list.value()), std::move(body.value())};
    }
    if (const auto *o = std::get_if<op::ForRange>(&op))
    {
        auto to = popExpr();
        if (!to)
            return to.error();
        auto from = popExpr();
        if (!from)
            return from.error();
        auto body = loopBody(o->id, o->end);
        if (!body)
            return body.error();
        return Stmt::ForRange{
            o->id, std::move(from.value()), std::move(to.value()), std::move(body.value())};
    }
    if (const auto *o = std::get_if<op::Fork>(&op))
    {
        auto time = popExpr();
        if (!time)
            return time.error();
        Decompile sub(program_);
        auto body = sub.run(o->vector.value);
        if (!body)
            return body.error();
        return Stmt::Fork{o->id, std::move(time.value()), std::move(body.value())};
    }
    if (const auto *o = std::get_if<op::TryExcept>(&op))
        return tryExceptStatement(o->count);
    if (const auto *o = std::get_if<op::TryFinally>(&op))
    {
        auto handlerPos = labelPosition(o->label);
        if (!handlerPos)
            return handlerPos.error();
        if (handlerPos.value() == 0)
            return malformed("bad finally label", position_);
        auto body = statementsUntil(handlerPos.value() - 1);
        if (!body)
            return body.error();
        if (auto end = expectOp<op::EndFinally>(); !end)
            return end.error();
        auto handler = statementsUntilOp<op::Continue>();
        if (!handler)
            return handler.error();
        if (auto cont = expectOp<op::Continue>(); !cont)
            return cont.error();
        return Stmt::TryFinally{std::move(body.value()), std::move(handler.value())};
    }
    if (const auto *o = std::get_if<op::Exit>(&op))
        return exitStatement(o->label, false);
    if (const auto *o = std::get_if<op::ExitId>(&op))
        return exitStatement(o->label, true);
    if (std::holds_alternative<op::Return>(op))
    {
        auto value = popExpr();
        if (!value)
            return value.error();
        return Stmt::Return{std::move(value.value())};
    }
    if (std::holds_alternative<op::Return0>(op))
        return Stmt::Return{};

    auto expr = popExpr();
    if (!expr)
        return expr.error();
    return Stmt::ExprStmt{std::move(expr.value())};
}

Expected<Stmt::Node> Decompile::condStatement(Expr condition, Label otherwise)
{
    Stmt::Cond cond;
    std::optional<Label> end;
    while (true)
    {
        auto otherwisePos = labelPosition(otherwise);
        if (!otherwisePos)
            return otherwisePos.error();
        if (otherwisePos.value() == 0)
            return malformed("bad if label", position_);
        auto body = statementsUntil(otherwisePos.value() - 1);
        if (!body)
            return body.error();
        auto jump = expectOp<op::Jump>();
        if (!jump)
            return jump.error();
        if (end && !(jump.value().label == *end))
            return malformed("if arms jump to different ends", position_ - 1);
        end = jump.value().label;
        cond.arms.push_back(Stmt::CondArm{std::move(condition), std::move(body.value())});

        auto endPos = labelPosition(*end);
        if (!endPos)
            return endPos.error();
        if (position_ >= endPos.value())
            break;

        // Either an elseif arm (condition then Eif) or the else body.
        const size_t savedPos = position_;
        const size_t savedExprs = exprs_.size();
        const size_t savedLabels = pendingLabels_.size();
        while (position_ < endPos.value())
        {
            const Op *op = peek();
            if (!op || isStatementOp(*op) || std::holds_alternative<op::Eif>(*op))
                break;
            if (!stepExpr())
                break;
        }
        const Op *op = peek();
        if (op && std::holds_alternative<op::Eif>(*op) && exprs_.size() == savedExprs + 1)
        {
            otherwise = std::get<op::Eif>(*op).label;
            ++position_;
            condition = std::move(exprs_.back());
            exprs_.pop_back();
            continue;
        }
        position_ = savedPos;
        exprs_.resize(savedExprs);
        pendingLabels_.resize(savedLabels);
        auto elseBody = statementsUntil(endPos.value());
        if (!elseBody)
            return elseBody.error();
        cond.otherwise = std::move(elseBody.value());
        break;
    }
    return cond;
}

Expected<std::vector<Stmt>> Decompile::loopBody(const std::optional<Name> &name, Label end)
{
    auto endPos = labelPosition(end);
    if (!endPos)
        return endPos.error();
    if (endPos.value() == 0 || endPos.value() > ops_->size())
        return malformed("bad loop end label", position_);
    // The body always closes with a jump back to the loop top.
    const auto *back = std::get_if<op::Jump>(&(*ops_)[endPos.value() - 1]);
    if (!back)
        return malformed("loop without back jump", endPos.value() - 1);
    loops_.push_back(LoopContext{name, back->label, end});
    auto body = statementsUntil(endPos.value() - 1);
    loops_.pop_back();
    if (!body)
        return body.error();
    if (auto jump = expectOp<op::Jump>(); !jump)
        return jump.error();
    return body;
}

Expected<Stmt::Node> Decompile::tryExceptStatement(uint16_t count)
{
    if (pendingLabels_.size() < count || exprs_.size() < count)
        return malformed("TryExcept without handler labels", position_ - 1);
    std::vector<Label> labels(pendingLabels_.end() - count, pendingLabels_.end());
    pendingLabels_.resize(pendingLabels_.size() - count);

    Stmt::TryExcept tryExcept;
    std::vector<CatchCodes> codes(count);
    for (size_t i = count; i-- > 0;)
    {
        auto e = popExpr();
        if (!e)
            return e.error();
        auto c = codesOf(std::move(e.value()));
        if (!c)
            return c.error();
        codes[i] = std::move(c.value());
    }

    auto body = statementsUntilOp<op::EndExcept>();
    if (!body)
        return body.error();
    tryExcept.body = std::move(body.value());
    auto endExcept = expectOp<op::EndExcept>();
    if (!endExcept)
        return endExcept.error();
    auto endPos = labelPosition(endExcept.value().label);
    if (!endPos)
        return endPos.error();

    for (size_t i = 0; i < count; ++i)
    {
        auto armPos = labelPosition(labels[i]);
        if (!armPos)
            return armPos.error();
        if (position_ != armPos.value())
            return malformed("except arm out of place", position_);
        Stmt::ExceptArm arm;
        arm.codes = std::move(codes[i]);
        if (const Op *op = peek(); op && std::holds_alternative<op::Put>(*op))
        {
            arm.id = std::get<op::Put>(*op).name;
            ++position_;
        }
        if (auto pop = expectOp<op::Pop>(); !pop)
            return pop.error();

        size_t stop = endPos.value();
        if (i + 1 < count)
        {
            auto nextPos = labelPosition(labels[i + 1]);
            if (!nextPos)
                return nextPos.error();
            if (nextPos.value() == 0)
                return malformed("bad except label", position_);
            stop = nextPos.value() - 1;
        }
        auto stmts = statementsUntil(stop);
        if (!stmts)
            return stmts.error();
        arm.statements = std::move(stmts.value());
        if (i + 1 < count)
        {
            if (auto jump = expectOp<op::Jump>(); !jump)
                return jump.error();
        }
        tryExcept.excepts.push_back(std::move(arm));
    }
    if (position_ != endPos.value())
        return malformed("try/except does not end at its end label", position_);
    return tryExcept;
}

Expected<Stmt::Node> Decompile::exitStatement(Label label, bool named)
{
    if (!named)
    {
        if (loops_.empty())
            return malformed("loop exit outside of a loop", position_ - 1);
        const auto &loop = loops_.back();
        if (label == loop.bottom)
            return Stmt::Break{};
        if (label == loop.top)
            return Stmt::Continue{};
        return malformed("loop exit to a foreign label", position_ - 1);
    }
    for (auto it = loops_.rbegin(); it != loops_.rend(); ++it)
    {
        if (!it->name)
            continue;
        if (label == it->bottom)
            return Stmt::Break{it->name};
        if (label == it->top)
            return Stmt::Continue{it->name};
    }
    return malformed("named loop exit without matching loop", position_ - 1);
}

Expected<Expr> Decompile::exprUntil(size_t end)
{
    const size_t base = exprs_.size();
    while (position_ < end)
    {
        if (auto result = stepExpr(); !result)
            return result.error();
    }
    if (position_ != end || exprs_.size() != base + 1)
        return malformed("expression does not fit its block", position_);
    return popExpr();
}

Expected<std::vector<Arg>> Decompile::argsOf(Expr e)
{
    auto *list = std::get_if<Expr::List>(&e.node);
    if (!list)
        return malformed("expected argument list", position_ - 1);
    return std::move(list->items);
}

Expected<CatchCodes> Decompile::codesOf(Expr e)
{
    if (const auto *v = std::get_if<Expr::Value>(&e.node); v && v->value == Var::fromInt(0))
        return CatchCodes{true, {}};
    auto args = argsOf(std::move(e));
    if (!args)
        return args.error();
    return CatchCodes{false, std::move(args.value())};
}

Expected<void> Decompile::assignChain()
{
    auto rhs = popExpr();
    if (!rhs)
        return rhs.error();
    std::optional<Expr> target;
    while (true)
    {
        const Op *op = peek();
        if (!op)
            return malformed("unterminated indexed assignment", position_);
        ++position_;
        if (std::holds_alternative<op::RangeSet>(*op))
        {
            auto to = popExpr();
            auto from = popExpr();
            auto base = popExpr();
            if (!to || !from || !base)
                return malformed("range assignment underflow", position_ - 1);
            if (!target)
                target = Expr{Expr::Range{
                    std::move(base.value()), std::move(from.value()), std::move(to.value())}};
            continue;
        }
        if (std::holds_alternative<op::IndexSet>(*op))
        {
            auto idx = popExpr();
            auto base = popExpr();
            if (!idx || !base)
                return malformed("index assignment underflow", position_ - 1);
            if (!target)
                target = Expr{Expr::Index{std::move(base.value()), std::move(idx.value())}};
            continue;
        }
        if (std::holds_alternative<op::Put>(*op))
            break;
        if (std::holds_alternative<op::PutProp>(*op))
        {
            auto prop = popExpr();
            auto loc = popExpr();
            if (!prop || !loc)
                return malformed("property assignment underflow", position_ - 1);
            break;
        }
        return malformed("unexpected " + std::string(opcodeName(*op)) + " in assignment",
                         position_ - 1);
    }
    if (!target)
        return malformed("indexed assignment without target", position_);
    if (auto pop = expectOp<op::Pop>(); !pop)
        return pop.error();
    if (auto temp = expectOp<op::PushTemp>(); !temp)
        return temp.error();
    pushExpr(Expr::Assign{std::move(*target), std::move(rhs.value())});
    return {};
}

Expected<void> Decompile::catchExpr(Label handler)
{
    auto codesExpr = popExpr();
    if (!codesExpr)
        return codesExpr.error();
    auto codes = codesOf(std::move(codesExpr.value()));
    if (!codes)
        return codes.error();
    if (auto c = expectOp<op::Catch>(); !c)
        return c.error();
    auto handlerPos = labelPosition(handler);
    if (!handlerPos)
        return handlerPos.error();
    if (handlerPos.value() == 0)
        return malformed("bad catch label", position_);
    auto trye = exprUntil(handlerPos.value() - 1);
    if (!trye)
        return trye.error();
    auto endCatch = expectOp<op::EndCatch>();
    if (!endCatch)
        return endCatch.error();
    auto endPos = labelPosition(endCatch.value().label);
    if (!endPos)
        return endPos.error();

    std::optional<Box<Expr>> except;
    const Op *first = peek();
    const Op *second = peek(1);
    const auto *one = first ? std::get_if<op::ImmInt>(first) : nullptr;
    if (one && one->value == 1 && second && std::holds_alternative<op::Ref>(*second) &&
        position_ + 2 == endPos.value())
    {
        position_ += 2;
    }
    else
    {
        if (auto pop = expectOp<op::Pop>(); !pop)
            return pop.error();
        auto e = exprUntil(endPos.value());
        if (!e)
            return e.error();
        except = Box<Expr>(std::move(e.value()));
    }
    pushExpr(Expr::Catch{std::move(trye.value()), std::move(codes.value()), std::move(except)});
    return {};
}

Expected<void> Decompile::scatterExpr(const op::Scatter &sc)
{
    auto rhs = popExpr();
    if (!rhs)
        return rhs.error();
    std::vector<ScatterItem> items;
    std::vector<size_t> withDefault;
    for (size_t i = 0; i < sc.labels.size(); ++i)
    {
        const auto &sl = sc.labels[i];
        items.push_back(ScatterItem{sl.kind, sl.id, std::nullopt});
        if (sl.label)
            withDefault.push_back(i);
    }
    auto donePos = labelPosition(sc.done);
    if (!donePos)
        return donePos.error();

    // Each default is `expr, Put id, Pop`, ending where the next one starts.
    for (size_t k = 0; k < withDefault.size(); ++k)
    {
        const auto &sl = sc.labels[withDefault[k]];
        auto start = labelPosition(*sl.label);
        if (!start)
            return start.error();
        if (position_ != start.value())
            return malformed("scatter default out of place", position_);
        size_t boundary = donePos.value();
        if (k + 1 < withDefault.size())
        {
            auto next = labelPosition(*sc.labels[withDefault[k + 1]].label);
            if (!next)
                return next.error();
            boundary = next.value();
        }
        if (boundary < position_ + 2)
            return malformed("scatter default too short", position_);
        auto e = exprUntil(boundary - 2);
        if (!e)
            return e.error();
        auto put = expectOp<op::Put>();
        if (!put)
            return put.error();
        if (!(put.value().name == sl.id))
            return malformed("scatter default stores to the wrong variable", position_ - 1);
        if (auto pop = expectOp<op::Pop>(); !pop)
            return pop.error();
        items[withDefault[k]].expr = Box<Expr>(std::move(e.value()));
    }
    if (position_ != donePos.value())
        return malformed("scatter does not end at its done label", position_);
    pushExpr(Expr::Scatter{std::move(items), std::move(rhs.value())});
    return {};
}

Expected<void> Decompile::stepExpr()
{
    const size_t pc = position_;
    const Op op = (*ops_)[position_++];

    auto binary = [this](BinaryOp bop) -> Expected<void>
    {
        auto rhs = popExpr();
        if (!rhs)
            return rhs.error();
        auto lhs = popExpr();
        if (!lhs)
            return lhs.error();
        pushExpr(Expr::Binary{bop, std::move(lhs.value()), std::move(rhs.value())});
        return {};
    };
    auto withArgs = [this](auto build) -> Expected<void>
    {
        auto list = popExpr();
        if (!list)
            return list.error();
        auto args = argsOf(std::move(list.value()));
        if (!args)
            return args.error();
        return build(std::move(args.value()));
    };

    return std::visit(
        [&](const auto &o) -> Expected<void>
        {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, op::Imm>)
            {
                if (o.literal >= program_.literals.size())
                    return malformed("literal index out of range", pc);
                pushExpr(Expr::Value{program_.literals[o.literal]});
            }
            else if constexpr (std::is_same_v<T, op::ImmInt>)
                pushExpr(Expr::Value{Var::fromInt(o.value)});
            else if constexpr (std::is_same_v<T, op::Push>)
                pushExpr(Expr::Id{o.name});
            else if constexpr (std::is_same_v<T, op::Put>)
            {
                auto rhs = popExpr();
                if (!rhs)
                    return rhs.error();
                pushExpr(Expr::Assign{Expr{Expr::Id{o.name}}, std::move(rhs.value())});
            }
            else if constexpr (std::is_same_v<T, op::PutProp>)
            {
                auto value = popExpr();
                auto prop = popExpr();
                auto loc = popExpr();
                if (!value || !prop || !loc)
                    return malformed("property assignment underflow", pc);
                Expr target{Expr::Prop{std::move(loc.value()), std::move(prop.value())}};
                pushExpr(Expr::Assign{std::move(target), std::move(value.value())});
            }
            else if constexpr (std::is_same_v<T, op::PutTemp>)
                return assignChain();
            else if constexpr (std::is_same_v<T, op::PushRef> || std::is_same_v<T, op::PushGetProp>)
            {
                if (exprs_.size() < 2)
                    return malformed("lvalue reference underflow", pc);
                Expr base = exprs_[exprs_.size() - 2];
                Expr key = exprs_.back();
                if constexpr (std::is_same_v<T, op::PushRef>)
                    pushExpr(Expr::Index{std::move(base), std::move(key)});
                else
                    pushExpr(Expr::Prop{std::move(base), std::move(key)});
            }
            else if constexpr (std::is_same_v<T, op::Add>)
                return binary(BinaryOp::Add);
            else if constexpr (std::is_same_v<T, op::Sub>)
                return binary(BinaryOp::Sub);
            else if constexpr (std::is_same_v<T, op::Mul>)
                return binary(BinaryOp::Mul);
            else if constexpr (std::is_same_v<T, op::Div>)
                return binary(BinaryOp::Div);
            else if constexpr (std::is_same_v<T, op::Mod>)
                return binary(BinaryOp::Mod);
            else if constexpr (std::is_same_v<T, op::Exp>)
                return binary(BinaryOp::Exp);
            else if constexpr (std::is_same_v<T, op::Eq>)
                return binary(BinaryOp::Eq);
            else if constexpr (std::is_same_v<T, op::Ne>)
                return binary(BinaryOp::NEq);
            else if constexpr (std::is_same_v<T, op::Lt>)
                return binary(BinaryOp::Lt);
            else if constexpr (std::is_same_v<T, op::Le>)
                return binary(BinaryOp::LtE);
            else if constexpr (std::is_same_v<T, op::Gt>)
                return binary(BinaryOp::Gt);
            else if constexpr (std::is_same_v<T, op::Ge>)
                return binary(BinaryOp::GtE);
            else if constexpr (std::is_same_v<T, op::In>)
                return binary(BinaryOp::In);
            else if constexpr (std::is_same_v<T, op::UnaryMinus> || std::is_same_v<T, op::Not>)
            {
                auto operand = popExpr();
                if (!operand)
                    return operand.error();
                pushExpr(Expr::Unary{std::is_same_v<T, op::Not> ? UnaryOp::Not : UnaryOp::Neg,
                                     std::move(operand.value())});
            }
            else if constexpr (std::is_same_v<T, op::Ref>)
            {
                auto idx = popExpr();
                auto base = popExpr();
                if (!idx || !base)
                    return malformed("index underflow", pc);
                pushExpr(Expr::Index{std::move(base.value()), std::move(idx.value())});
            }
            else if constexpr (std::is_same_v<T, op::RangeRef>)
            {
                auto to = popExpr();
                auto from = popExpr();
                auto base = popExpr();
                if (!to || !from || !base)
                    return malformed("range underflow", pc);
                pushExpr(Expr::Range{
                    std::move(base.value()), std::move(from.value()), std::move(to.value())});
            }
            else if constexpr (std::is_same_v<T, op::Length>)
                pushExpr(Expr::Length{});
            else if constexpr (std::is_same_v<T, op::GetProp>)
            {
                auto prop = popExpr();
                auto loc = popExpr();
                if (!prop || !loc)
                    return malformed("property underflow", pc);
                pushExpr(Expr::Prop{std::move(loc.value()), std::move(prop.value())});
            }
            else if constexpr (std::is_same_v<T, op::CallVerb>)
            {
                auto list = popExpr();
                if (!list)
                    return list.error();
                auto args = argsOf(std::move(list.value()));
                if (!args)
                    return args.error();
                auto verb = popExpr();
                auto loc = popExpr();
                if (!verb || !loc)
                    return malformed("verb call underflow", pc);
                pushExpr(Expr::Verb{
                    std::move(loc.value()), std::move(verb.value()), std::move(args.value())});
            }
            else if constexpr (std::is_same_v<T, op::Pass>)
                return withArgs(
                    [this](std::vector<Arg> args) -> Expected<void>
                    {
                        pushExpr(Expr::Pass{std::move(args)});
                        return {};
                    });
            else if constexpr (std::is_same_v<T, op::FuncCall>)
            {
                const auto &builtins = Builtins::instance();
                if (o.id >= builtins.size())
                    return malformed("unknown builtin id " + std::to_string(o.id), pc);
                std::string name(builtins.descriptor(o.id).name);
                return withArgs(
                    [this, &name](std::vector<Arg> args) -> Expected<void>
                    {
                        pushExpr(Expr::Call{std::move(name), std::move(args)});
                        return {};
                    });
            }
            else if constexpr (std::is_same_v<T, op::MkEmptyList>)
                pushExpr(Expr::List{});
            else if constexpr (std::is_same_v<T, op::MakeSingletonList> ||
                               std::is_same_v<T, op::CheckListForSplice>)
            {
                auto item = popExpr();
                if (!item)
                    return item.error();
                const ArgKind kind = std::is_same_v<T, op::MakeSingletonList> ? ArgKind::Normal
                                                                             : ArgKind::Splice;
                std::vector<Arg> items;
                items.push_back(Arg{kind, std::move(item.value())});
                pushExpr(Expr::List{std::move(items)});
            }
            else if constexpr (std::is_same_v<T, op::ListAddTail> ||
                               std::is_same_v<T, op::ListAppend>)
            {
                auto item = popExpr();
                if (!item)
                    return item.error();
                if (exprs_.empty())
                    return malformed("list append underflow", pc);
                auto *list = std::get_if<Expr::List>(&exprs_.back().node);
                if (!list)
                    return malformed("list append onto a non-list", pc);
                const ArgKind kind =
                    std::is_same_v<T, op::ListAddTail> ? ArgKind::Normal : ArgKind::Splice;
                list->items.push_back(Arg{kind, std::move(item.value())});
            }
            else if constexpr (std::is_same_v<T, op::And> || std::is_same_v<T, op::Or>)
            {
                auto lhs = popExpr();
                if (!lhs)
                    return lhs.error();
                auto end = labelPosition(o.label);
                if (!end)
                    return end.error();
                auto rhs = exprUntil(end.value());
                if (!rhs)
                    return rhs.error();
                if constexpr (std::is_same_v<T, op::And>)
                    pushExpr(Expr::And{std::move(lhs.value()), std::move(rhs.value())});
                else
                    pushExpr(Expr::Or{std::move(lhs.value()), std::move(rhs.value())});
            }
            else if constexpr (std::is_same_v<T, op::IfQues>)
            {
                auto cond = popExpr();
                if (!cond)
                    return cond.error();
                auto elsePos = labelPosition(o.label);
                if (!elsePos)
                    return elsePos.error();
                if (elsePos.value() == 0)
                    return malformed("bad conditional label", pc);
                auto consequence = exprUntil(elsePos.value() - 1);
                if (!consequence)
                    return consequence.error();
                auto jump = expectOp<op::Jump>();
                if (!jump)
                    return jump.error();
                auto endPos = labelPosition(jump.value().label);
                if (!endPos)
                    return endPos.error();
                auto alternative = exprUntil(endPos.value());
                if (!alternative)
                    return alternative.error();
                pushExpr(Expr::Cond{std::move(cond.value()),
                                    std::move(consequence.value()),
                                    std::move(alternative.value())});
            }
            else if constexpr (std::is_same_v<T, op::PushLabel>)
            {
                const Op *next = peek();
                if (next && std::holds_alternative<op::Catch>(*next))
                    return catchExpr(o.label);
                pendingLabels_.push_back(o.label);
            }
            else if constexpr (std::is_same_v<T, op::Scatter>)
                return scatterExpr(o);
            else
                return malformed("unexpected " + std::string(opcodeName(op)), pc);
            return {};
        },
        op);
}
} // namespace

Expected<ParsedProgram> decompile(const Program &program)
{
    Decompile d(program);
    auto stmts = d.run(std::nullopt);
    if (!stmts)
        return stmts.error();
    return ParsedProgram{program.varNames, std::move(stmts.value())};
}

} // namespace moo::compiler
