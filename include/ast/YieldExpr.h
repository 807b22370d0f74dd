/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Expr.h"

namespace pyinfer::ast {

struct YieldExpr final : Expr {
  YieldExpr() : Expr(NodeKind::YieldExpr) {}
  const Node *value() const { return children.empty() ? nullptr : &child(0); }
};

} // namespace pyinfer::ast
