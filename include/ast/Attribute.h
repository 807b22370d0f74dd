/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <string>
#include "ast/Expr.h"

namespace pyinfer::ast {

// Layout: [expression]
struct Attribute final : Expr {
  std::string attr;
  explicit Attribute(std::string a) : Expr(NodeKind::Attribute), attr(std::move(a)) {}
  const Node &expr() const { return child(0); }
};

// Store form of Attribute (`obj.attr = ...`). Layout: [expression]
struct AssignAttr final : Expr {
  std::string attr;
  explicit AssignAttr(std::string a) : Expr(NodeKind::AssignAttr), attr(std::move(a)) {}
  const Node &expr() const { return child(0); }
};

} // namespace pyinfer::ast
