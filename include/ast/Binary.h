/**
 * @file
 * @brief AST declarations.
 */
#pragma once
#include <string>
#include <vector>

#include "ast/Expr.h"

namespace pyinfer::ast {
    // Layout: [left, right]
    struct Binary final : Expr {
        std::string op;
        explicit Binary(std::string o) : Expr(NodeKind::BinaryExpr), op(std::move(o)) {}
        const Node &lhs() const { return child(0); }
        const Node &rhs() const { return child(1); }
    };

    // Layout: [operand]
    struct Unary final : Expr {
        std::string op;
        explicit Unary(std::string o) : Expr(NodeKind::UnaryExpr), op(std::move(o)) {}
        const Node &operand() const { return child(0); }
    };

    // Layout: [left, comparators...]; ops.size() == comparator count.
    struct Compare final : Expr {
        std::vector<std::string> ops;
        explicit Compare(std::vector<std::string> o) : Expr(NodeKind::Compare), ops(std::move(o)) {}
        const Node &left() const { return child(0); }
    };
} // namespace pyinfer::ast
