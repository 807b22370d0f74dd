/**
 * @file
 * @brief AST try/finally declarations.
 */
#pragma once

#include "ast/Block.h"
#include "ast/Stmt.h"

namespace pyinfer::ast {
    // Layout: [body, finalbody]
    struct TryFinally final : Stmt {
        TryFinally() : Stmt(NodeKind::TryFinally) {}
        const Block &body() const;
        const Block *finalbody() const;
    };
}
