/**
 * @file
 * @brief AST module node declarations.
 */
#pragma once

#include <string>
#include <vector>
#include "ast/Block.h"
#include "ast/HasLocals.h"
#include "ast/HasName.h"
#include "ast/Node.h"

namespace pyinfer::ast {
    // Layout: [body Block]
    struct Module final : Node, HasLocals, HasName {
        bool package{false};
        explicit Module(std::string n) : Node(NodeKind::Module), HasName{std::move(n)} {}

        const Block &body() const;

        // Module-level bindings of `attr`; throws NotFoundError when unbound.
        const std::vector<NodeId> &getAttr(const std::string &attr) const;
    };
} // namespace pyinfer::ast
