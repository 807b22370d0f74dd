#pragma once

#include "ast/Block.h"
#include "ast/Stmt.h"

namespace pyinfer::ast {
    // Layout: [test, body, orelse?]
    struct WhileStmt final : Stmt {
        WhileStmt() : Stmt(NodeKind::WhileStmt) {}
        const Node &test() const { return child(0); }
        const Block &body() const;
        const Block *orelse() const;
    };
}
