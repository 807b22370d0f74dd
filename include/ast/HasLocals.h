/***
 * Name: pyinfer::ast::HasLocals
 * Purpose: Local-binding table mixin for scope nodes.
 * Theory of Operation:
 *   Maps an identifier to the binding nodes registered for it. Both the name
 *   order and the per-name binding order follow insertion, so lookups are
 *   deterministic. The table is append-only and written while the tree is
 *   being built.
 */
#pragma once

#include "ast/NodeId.h"
#include <string>
#include <unordered_map>
#include <vector>

namespace pyinfer::ast {

struct Node;

class HasLocals {
public:
    void addLocal(const std::string &name, NodeId binding);

    // nullptr when the name has no binding in this table.
    const std::vector<NodeId> *locals(const std::string &name) const;

    bool hasLocal(const std::string &name) const { return table_.contains(name); }

    const std::vector<std::string> &localNames() const { return order_; }

private:
    std::unordered_map<std::string, std::vector<NodeId>> table_{};
    std::vector<std::string> order_{};
};

// Binding table of a scope node, nullptr for every other kind.
HasLocals *localsOf(Node &node);
const HasLocals *localsOf(const Node &node);

} // namespace pyinfer::ast
