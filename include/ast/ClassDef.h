#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "ast/Block.h"
#include "ast/HasLocals.h"
#include "ast/HasName.h"
#include "ast/Stmt.h"

namespace pyinfer::ast {
    // Layout: [decorators..., bases..., body Block]
    struct ClassDef final : Stmt, HasLocals, HasName {
        std::size_t decoratorCount{0};
        std::size_t baseCount{0};
        explicit ClassDef(std::string n) : Stmt(NodeKind::ClassDef), HasName{std::move(n)} {}

        std::vector<NodeId> decorators() const;
        std::vector<NodeId> bases() const; // positional base expressions
        const Block &body() const;

        // `self.attr = ...` targets recorded while building methods.
        void addInstanceAttr(const std::string &attr, NodeId assignAttr);
        const HasLocals &instanceAttrs() const { return instanceAttrs_; }

    private:
        HasLocals instanceAttrs_{};
    };
}
