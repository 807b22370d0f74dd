/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Expr.h"
#include "ast/HasLocals.h"

namespace pyinfer::ast {

// Layout: [element, target, iterable]
struct GeneratorExpr final : Expr, HasLocals {
  GeneratorExpr() : Expr(NodeKind::GeneratorExpr) {}
  const Node &element() const { return child(0); }
  const Node &target() const { return child(1); }
  const Node &iterable() const { return child(2); }
};

} // namespace pyinfer::ast
