#pragma once

#include <cstdint>
#include <string>
#include "ast/Expr.h"

namespace pyinfer::ast {

template <typename T, NodeKind K>
struct Literal final : Expr {
    T value;
    explicit Literal(T v) : Expr(K), value(std::move(v)) {}
};

using IntLiteral = Literal<std::int64_t, NodeKind::IntLiteral>;
using FloatLiteral = Literal<double, NodeKind::FloatLiteral>;
using StringLiteral = Literal<std::string, NodeKind::StringLiteral>;
// True/False are dedicated nodes rather than names; see ConstFactory.
using BoolLiteral = Literal<bool, NodeKind::BoolLiteral>;

} // namespace pyinfer::ast
