/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <cstddef>
#include "ast/Expr.h"

namespace pyinfer::ast {

// Layout: [key0, value0, key1, value1, ...]
struct DictLiteral final : Expr {
  DictLiteral() : Expr(NodeKind::DictLiteral) {}
  std::size_t itemCount() const { return childCount() / 2; }
  const Node &key(std::size_t i) const { return child(i * 2); }
  const Node &value(std::size_t i) const { return child(i * 2 + 1); }
};

} // namespace pyinfer::ast
