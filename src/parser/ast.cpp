//! # AST Helpers

#include "parser/ast.hpp"

namespace semdiff::parser {

auto binary_op_to_string(BinaryOp op) -> const char* {
    switch (op) {
    case BinaryOp::Add:
        return "+";
    case BinaryOp::Sub:
        return "-";
    case BinaryOp::Mul:
        return "*";
    case BinaryOp::Div:
        return "/";
    case BinaryOp::Rem:
        return "%";
    case BinaryOp::And:
        return "&&";
    case BinaryOp::Or:
        return "||";
    case BinaryOp::BitAnd:
        return "&";
    case BinaryOp::BitOr:
        return "|";
    case BinaryOp::BitXor:
        return "^";
    case BinaryOp::Shl:
        return "<<";
    case BinaryOp::Shr:
        return ">>";
    case BinaryOp::Eq:
        return "==";
    case BinaryOp::Ne:
        return "!=";
    case BinaryOp::Lt:
        return "<";
    case BinaryOp::Le:
        return "<=";
    case BinaryOp::Gt:
        return ">";
    case BinaryOp::Ge:
        return ">=";
    case BinaryOp::Assign:
        return "=";
    case BinaryOp::AddAssign:
        return "+=";
    case BinaryOp::SubAssign:
        return "-=";
    case BinaryOp::MulAssign:
        return "*=";
    case BinaryOp::DivAssign:
        return "/=";
    case BinaryOp::RemAssign:
        return "%=";
    case BinaryOp::BitAndAssign:
        return "&=";
    case BinaryOp::BitOrAssign:
        return "|=";
    case BinaryOp::BitXorAssign:
        return "^=";
    case BinaryOp::ShlAssign:
        return "<<=";
    case BinaryOp::ShrAssign:
        return ">>=";
    }
    return "?";
}

auto is_block_like(const Expr& expr) -> bool {
    if (const auto* mac = std::get_if<MacroExpr>(&expr.kind)) {
        return mac->delimiter == lexer::TokenKind::LBrace;
    }
    return expr.is<BlockExpr>() || expr.is<IfExpr>() || expr.is<MatchExpr>() ||
           expr.is<LoopExpr>() || expr.is<WhileExpr>() || expr.is<ForExpr>();
}

} // namespace semdiff::parser
