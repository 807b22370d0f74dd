#pragma once

#include "ast/Stmt.h"

namespace pyinfer::ast {
    struct ReturnStmt final : Stmt {
        ReturnStmt() : Stmt(NodeKind::ReturnStmt) {}
        // nullptr for a bare `return`.
        const Node *value() const { return children.empty() ? nullptr : &child(0); }
    };
} // namespace pyinfer::ast
