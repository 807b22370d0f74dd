/***
 * Name: pyinfer::ast::NodeArena
 * Purpose: Own every node of one analysis session and register modules by name.
 * Inputs:
 *   - Nodes created through make<T>(parent, ...), in source order.
 * Outputs:
 *   - Stable node references addressed by NodeId; module registry; builtins.
 * Theory of Operation:
 *   Nodes are heap-allocated once and never move, so references handed out
 *   stay valid for the arena's lifetime. make<T> appends the new node to its
 *   parent's children, which keeps children in creation order. Construction
 *   of the arena also builds the `__builtin__` module consulted by scope
 *   lookup and by the proxy model.
 */
#pragma once

#include "ast/Node.h"
#include "ast/NodeId.h"
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pyinfer::ast {

    struct Module;
    struct ClassDef;

    class NodeArena {
    public:
        NodeArena();
        ~NodeArena();
        NodeArena(const NodeArena &) = delete;
        NodeArena &operator=(const NodeArena &) = delete;

        template <typename T, typename... Args>
        T &make(const NodeId parent, Args &&...args) {
            auto node = std::make_unique<T>(std::forward<Args>(args)...);
            T &ref = *node;
            adopt(std::move(node), parent);
            return ref;
        }

        const Node &at(NodeId id) const;
        Node &at(NodeId id);
        // nullptr for kNoNode.
        const Node *get(NodeId id) const;
        std::size_t size() const { return nodes_.size(); }

        void registerModule(const std::string &name, NodeId module);
        const Module *findModule(const std::string &name) const;

        const Module &builtins() const;
        const ClassDef *builtinClass(const std::string &name) const;
        const Node &noneConstant() const { return at(none_); }
        const Node &boolConstant(bool value) const { return at(value ? true_ : false_); }

    private:
        void adopt(std::unique_ptr<Node> node, NodeId parent);

        std::vector<std::unique_ptr<Node>> nodes_{};
        std::unordered_map<std::string, NodeId> modules_{};
        NodeId builtins_{kNoNode};
        NodeId none_{kNoNode};
        NodeId true_{kNoNode};
        NodeId false_{kNoNode};
    };

} // namespace pyinfer::ast
