#pragma once

#include <string>
#include "ast/Stmt.h"

namespace pyinfer::ast {
    // Layout: [target, value]
    struct AugAssignStmt final : Stmt {
        std::string op;
        explicit AugAssignStmt(std::string o) : Stmt(NodeKind::AugAssignStmt), op(std::move(o)) {}
        const Node &target() const { return child(0); }
        const Node &value() const { return child(1); }
    };
}
