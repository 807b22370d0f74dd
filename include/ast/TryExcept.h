/**
 * @file
 * @brief AST try/except declarations.
 */
#pragma once

#include <vector>
#include "ast/Block.h"
#include "ast/ExceptHandler.h"
#include "ast/Stmt.h"

namespace pyinfer::ast {
    // Layout: [body, handlers..., orelse?]
    struct TryExcept final : Stmt {
        TryExcept() : Stmt(NodeKind::TryExcept) {}
        const Block &body() const;
        std::vector<const ExceptHandler *> handlers() const;
        const Block *orelse() const;
    };
}
