#pragma once

#include <cstddef>
#include "ast/Block.h"
#include "ast/Stmt.h"

namespace pyinfer::ast {
    // Layout: [test0, body0, test1, body1, ..., orelse?]. Branch i > 0 is an `elif`.
    struct IfStmt final : Stmt {
        IfStmt() : Stmt(NodeKind::IfStmt) {}
        std::size_t branchCount() const { return childCount() / 2; }
        const Node &test(std::size_t branch) const { return child(branch * 2); }
        const Block &branchBody(std::size_t branch) const;
        const Block *orelse() const;
    };
} // namespace pyinfer::ast
