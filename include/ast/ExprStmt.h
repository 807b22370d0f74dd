#pragma once

#include "ast/Stmt.h"

namespace pyinfer::ast {
    struct ExprStmt final : Stmt {
        ExprStmt() : Stmt(NodeKind::ExprStmt) {}
        const Node &value() const { return child(0); }
    };
} // namespace pyinfer::ast
