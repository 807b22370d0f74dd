#pragma once

#include <string>
#include <vector>
#include "ast/Alias.h"
#include "ast/Stmt.h"

namespace pyinfer::ast {
    struct Import final : Stmt {
        std::vector<Alias> names;
        explicit Import(std::vector<Alias> n) : Stmt(NodeKind::Import), names(std::move(n)) {}
        std::string realName(const std::string &asname) const { return ast::realName(names, asname); }
    };
}
