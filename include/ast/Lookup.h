/***
 * Name: pyinfer::ast::lookup
 * Purpose: Resolve a name to the binding nodes visible from a node.
 * Inputs:
 *   - node: where the name is used
 *   - name: identifier
 * Outputs:
 *   - The scope holding the bindings and the bindings in registration order;
 *     an empty result when no scope binds the name.
 * Theory of Operation:
 *   Starts at node.scope(), except that decorators and default values belong
 *   to the scope enclosing their function or lambda. Walks outward through
 *   parent scopes, skipping class bodies once the walk has left a nested
 *   function, lambda or generator expression, then falls back to the
 *   builtins module.
 */
#pragma once

#include "ast/Node.h"
#include <string>
#include <vector>

namespace pyinfer::ast {

    struct LookupResult {
        const Node *scope{nullptr};
        std::vector<NodeId> bindings{};
        bool found() const { return scope != nullptr && !bindings.empty(); }
    };

    LookupResult lookup(const Node &node, const std::string &name);

    // Dotted name of a frame, e.g. `pkg.mod.Class.method`.
    std::string qualifiedName(const Node &frame);

} // namespace pyinfer::ast
