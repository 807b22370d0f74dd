/**
 * @file
 * @brief Tree node base: identity, parent index, ordered children and line metadata.
 */
#pragma once

#include "ast/KindSet.h"
#include "ast/NodeId.h"
#include "ast/NodeKind.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pyinfer::ast {

    class NodeArena;
    class NodeWalk;

    /***
     * Name: pyinfer::ast::Node
     * Purpose: Common part of every node kind.
     * Theory of Operation:
     *   Nodes are owned by a NodeArena and refer to each other by NodeId. The
     *   parent relation is a plain index (non-owning); children are exclusively
     *   owned and kept in source order. Kind-specific structure is exposed by the
     *   derived node types as accessors over the ordered children.
     */
    struct Node {
        NodeKind kind;
        NodeId id{kNoNode};
        NodeId parent{kNoNode};
        std::vector<NodeId> children{};
        int fromLine{0};
        int toLine{0};

        explicit Node(const NodeKind k) : kind(k) {}
        virtual ~Node() = default;
        Node(const Node &) = delete;
        Node &operator=(const Node &) = delete;

        bool isStatement() const { return isStatementKind(kind); }
        bool isFrame() const { return isFrameKind(kind); }
        bool isScope() const { return isScopeKind(kind); }

        NodeArena &arena() const { return *arena_; }

        const Node *parentNode() const;
        Node *parentNode();
        const Node &child(std::size_t index) const;
        std::size_t childCount() const { return children.size(); }

        // True if this node appears in other's parent chain.
        bool parentOf(const Node &other) const;

        const Node &statement() const;
        const Node &frame() const;
        Node &frame();
        const Node &scope() const;
        const Node &root() const;

        const Node *nextSibling() const;
        const Node *previousSibling() const;

        // Candidates must come from the same tree in non-decreasing line order.
        const Node *nearest(const std::vector<const Node *> &candidates) const;

        int sourceLine() const;
        int lastSourceLine() const;

        LineRange blockRange(int line) const;

        // Construction-time only: append a binding to the nearest binding table.
        void setLocal(const std::string &name, NodeId binding);

        NodeWalk nodesOfClass(KindSet match, KindSet skip = {}) const;

    private:
        friend class NodeArena;
        NodeArena *arena_{nullptr};
        mutable std::optional<int> sourceLine_{};
        mutable std::optional<int> lastSourceLine_{};
    };

} // namespace pyinfer::ast

#include "ast/NodeWalk.h"
