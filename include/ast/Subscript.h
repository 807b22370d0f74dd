/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include "ast/Expr.h"

namespace pyinfer::ast {

// Layout: [value, index]
struct Subscript final : Expr {
  Subscript() : Expr(NodeKind::Subscript) {}
  const Node &value() const { return child(0); }
  const Node &index() const { return child(1); }
};

} // namespace pyinfer::ast
