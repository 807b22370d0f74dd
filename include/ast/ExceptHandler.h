#pragma once

#include <string>
#include "ast/Block.h"
#include "ast/Node.h"

namespace pyinfer::ast {
    // Layout: [type?, body]
    struct ExceptHandler final : Node {
        std::string target; // bound name (empty if none)
        explicit ExceptHandler(std::string t) : Node(NodeKind::ExceptHandler), target(std::move(t)) {}
        const Node *type() const { return childCount() > 1 ? &child(0) : nullptr; }
        const Block &body() const;
    };
}
