#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "ast/Block.h"
#include "ast/HasLocals.h"
#include "ast/HasName.h"
#include "ast/HasParams.h"
#include "ast/Stmt.h"

namespace pyinfer::ast {
    enum class FunctionType { Function, Method, ClassMethod, StaticMethod };

    const char *to_string(FunctionType type);

    // Layout: [decorators..., defaults..., body Block]
    struct FunctionDef final : Stmt, HasLocals, HasName, HasParams {
        std::size_t decoratorCount{0};
        explicit FunctionDef(std::string n) : Stmt(NodeKind::FunctionDef), HasName{std::move(n)} {}

        std::vector<NodeId> decorators() const;
        std::vector<NodeId> defaults() const;
        const Block &body() const;
        // Default value expression of `param`, nullptr if it has none.
        const Node *defaultFor(const std::string &param) const;

        FunctionType type() const;
        bool isGenerator() const;
        // True for nodes under the body (as opposed to decorators and defaults).
        bool inBody(const Node &node) const;
    };

} // namespace pyinfer::ast
