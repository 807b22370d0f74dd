#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "ast/Expr.h"

namespace pyinfer::ast {
    // Layout: [callee, positional args..., keyword values...]
    struct Call final : Expr {
        std::vector<std::string> keywordNames; // aligned with the trailing keyword values
        Call() : Expr(NodeKind::Call) {}

        const Node &callee() const { return child(0); }
        std::vector<NodeId> args() const {
            return {children.begin() + 1, children.end() - static_cast<std::ptrdiff_t>(keywordNames.size())};
        }
        // nullptr when no keyword of that name was passed.
        const Node *keyword(const std::string &name) const;
    };

} // namespace pyinfer::ast
