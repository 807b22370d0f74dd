/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Expr.h"

namespace pyinfer::ast {

// `body if test else orelse`. Layout: [body, test, orelse]
struct IfExpr final : Expr {
  IfExpr() : Expr(NodeKind::IfExpr) {}
  const Node &body() const { return child(0); }
  const Node &test() const { return child(1); }
  const Node &orelse() const { return child(2); }
};

} // namespace pyinfer::ast
