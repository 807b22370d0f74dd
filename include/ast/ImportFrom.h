#pragma once

#include <string>
#include <vector>
#include "ast/Alias.h"
#include "ast/Stmt.h"

namespace pyinfer::ast {
    struct ImportFrom final : Stmt {
        std::string module;
        std::vector<Alias> names;
        int level{0};
        ImportFrom(std::string m, std::vector<Alias> n)
            : Stmt(NodeKind::ImportFrom), module(std::move(m)), names(std::move(n)) {}
        std::string realName(const std::string &asname) const { return ast::realName(names, asname); }
    };
}
