/***
 * Name: pyinfer::ast::NoneLiteral
 * Purpose: Represent the None constant (never a Name node; see ConstFactory).
 */
#pragma once

#include "ast/Expr.h"

namespace pyinfer::ast {

struct NoneLiteral final : Expr {
  NoneLiteral() : Expr(NodeKind::NoneLiteral) {}
};

}
