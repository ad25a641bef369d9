//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Operator spellings shared by the unparser and diagnostic messages.
//
//===----------------------------------------------------------------------===//

#include "compiler/Ast.hpp"

namespace moo::compiler
{

std::string_view binaryOpSymbol(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Mod:
            return "%";
        case BinaryOp::Eq:
            return "==";
        case BinaryOp::NEq:
            return "!=";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::GtE:
            return ">=";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::LtE:
            return "<=";
        case BinaryOp::Exp:
            return "^";
        case BinaryOp::In:
            return "in";
    }
    return "?";
}

std::string_view unaryOpSymbol(UnaryOp op)
{
    return op == UnaryOp::Neg ? "-" : "!";
}

} // namespace moo::compiler
