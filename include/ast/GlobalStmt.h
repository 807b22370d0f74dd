#pragma once

#include <string>
#include <vector>
#include "ast/Stmt.h"

namespace pyinfer::ast {
    struct GlobalStmt final : Stmt {
        std::vector<std::string> names;
        explicit GlobalStmt(std::vector<std::string> n) : Stmt(NodeKind::GlobalStmt), names(std::move(n)) {}
    };
}
