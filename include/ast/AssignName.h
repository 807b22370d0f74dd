#pragma once
#include <string>
#include "ast/Expr.h"

namespace pyinfer::ast {

    // Binding occurrence of a name (assignment, loop, with or comprehension target).
    struct AssignName final : Expr {
        std::string id; // hides Node::id; use Node::id for the arena index
        explicit AssignName(std::string s) : Expr(NodeKind::AssignName), id(std::move(s)) {}
    };

} // namespace pyinfer::ast
