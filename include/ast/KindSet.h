/***
 * Name: pyinfer::ast::KindSet
 * Purpose: Small set of node kinds used as predicate and skip sets for tree walks.
 */
#pragma once

#include "ast/NodeKind.h"
#include <bitset>
#include <initializer_list>

namespace pyinfer::ast {
    class KindSet {
    public:
        KindSet() = default;

        KindSet(std::initializer_list<NodeKind> kinds) {
            for (const auto kind : kinds) { add(kind); }
        }

        KindSet &add(NodeKind kind) {
            bits_.set(static_cast<std::size_t>(kind));
            return *this;
        }

        bool contains(NodeKind kind) const { return bits_.test(static_cast<std::size_t>(kind)); }
        bool empty() const { return bits_.none(); }

        static KindSet statements();
        static KindSet frames();
        static KindSet scopes();

    private:
        std::bitset<kNodeKindCount> bits_{};
    };
} // namespace pyinfer::ast
