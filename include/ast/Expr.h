/**
 * @file
 * @brief Expression base declarations.
 */
#pragma once

#include "ast/Node.h"

namespace pyinfer::ast {
    struct Expr : Node {
        using Node::Node;
    };
} // namespace pyinfer::ast
