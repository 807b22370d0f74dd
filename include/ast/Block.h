/***
 * Name: pyinfer::ast::Block
 * Purpose: Ordered statement suite (module/def/class bodies, branch bodies).
 */
#pragma once

#include "ast/Node.h"

namespace pyinfer::ast {
    struct Block final : Node {
        Block() : Node(NodeKind::Block) {}
    };
} // namespace pyinfer::ast
