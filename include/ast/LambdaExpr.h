/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <vector>
#include "ast/Expr.h"
#include "ast/HasLocals.h"
#include "ast/HasParams.h"

namespace pyinfer::ast {

// Layout: [defaults..., body expression]
struct LambdaExpr final : Expr, HasLocals, HasParams {
  LambdaExpr() : Expr(NodeKind::LambdaExpr) {}
  std::vector<NodeId> defaults() const;
  const Node &body() const;
  const Node *defaultFor(const std::string &param) const;
  bool inBody(const Node &node) const;
};

} // namespace pyinfer::ast
