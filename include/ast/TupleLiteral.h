/**
 * @file
 * @brief AST tuple and list literal declarations.
 */
/***
 * Name: pyinfer::ast::TupleLiteral / ListLiteral
 * Purpose: Represent sequence displays; children are the elements in order.
 */
#pragma once

#include "ast/Expr.h"

namespace pyinfer::ast {

struct TupleLiteral final : Expr {
  TupleLiteral() : Expr(NodeKind::TupleLiteral) {}
};

struct ListLiteral final : Expr {
  ListLiteral() : Expr(NodeKind::ListLiteral) {}
};

} // namespace pyinfer::ast
