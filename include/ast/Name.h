/**
 * @file
 * @brief AST name node declarations.
 */
#pragma once
#include <string>
#include "ast/Expr.h"

namespace pyinfer::ast {

    // A name being read. Stores use AssignName.
    struct Name final : Expr {
        std::string id; // hides Node::id; use Node::id for the arena index
        explicit Name(std::string s) : Expr(NodeKind::Name), id(std::move(s)) {}
    };

} // namespace pyinfer::ast
