/**
 * @file
 * @brief Statements without structure of their own (pass, break, continue, raise).
 */
#pragma once

#include "ast/Stmt.h"

namespace pyinfer::ast {
    struct PassStmt final : Stmt {
        PassStmt() : Stmt(NodeKind::PassStmt) {}
    };

    struct BreakStmt final : Stmt {
        BreakStmt() : Stmt(NodeKind::BreakStmt) {}
    };

    struct ContinueStmt final : Stmt {
        ContinueStmt() : Stmt(NodeKind::ContinueStmt) {}
    };

    struct RaiseStmt final : Stmt {
        RaiseStmt() : Stmt(NodeKind::RaiseStmt) {}
        const Node *exception() const { return children.empty() ? nullptr : &child(0); }
    };
} // namespace pyinfer::ast
