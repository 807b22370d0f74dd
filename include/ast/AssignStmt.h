#pragma once

#include <vector>
#include "ast/Stmt.h"

namespace pyinfer::ast {
    // Layout: [targets..., value]; `a = b = v` has two targets.
    struct AssignStmt final : Stmt {
        AssignStmt() : Stmt(NodeKind::AssignStmt) {}
        std::vector<NodeId> targets() const { return {children.begin(), children.end() - 1}; }
        const Node &value() const { return child(childCount() - 1); }
    };
} // namespace pyinfer::ast
