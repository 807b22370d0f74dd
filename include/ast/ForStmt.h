#pragma once

#include "ast/Block.h"
#include "ast/Stmt.h"

namespace pyinfer::ast {
    // Layout: [target, iterable, body, orelse?]
    struct ForStmt final : Stmt {
        ForStmt() : Stmt(NodeKind::ForStmt) {}
        const Node &target() const { return child(0); }
        const Node &iterable() const { return child(1); }
        const Block &body() const;
        const Block *orelse() const;
    };
}
