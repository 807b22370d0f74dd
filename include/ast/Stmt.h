/**
 * @file
 * @brief Statement base declarations.
 */
#pragma once

#include "ast/Node.h"

namespace pyinfer::ast {
    struct Stmt : Node {
        using Node::Node;
    };
}
