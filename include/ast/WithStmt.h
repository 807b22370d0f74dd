#pragma once

#include "ast/Block.h"
#include "ast/Stmt.h"

namespace pyinfer::ast {
    // Layout: [context, target?, body]
    struct WithStmt final : Stmt {
        WithStmt() : Stmt(NodeKind::WithStmt) {}
        const Node &context() const { return child(0); }
        const Node *target() const { return childCount() > 2 ? &child(1) : nullptr; }
        const Block &body() const;
    };
}
