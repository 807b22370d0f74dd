/***
 * Name: pyinfer::ast::NodeArena
 * Purpose: Node ownership, id assignment and the module registry.
 */
#include "ast/Builtins.h"
#include "ast/ClassDef.h"
#include "ast/Module.h"
#include "ast/NodeArena.h"
#include "pyinfer/exceptions/precondition_error.h"

#include <string>

namespace pyinfer::ast {

NodeArena::NodeArena() {
    const BuiltinsLayout layout = buildBuiltins(*this);
    builtins_ = layout.module;
    none_ = layout.none;
    true_ = layout.trueConst;
    false_ = layout.falseConst;
}

NodeArena::~NodeArena() = default;

void NodeArena::adopt(std::unique_ptr<Node> node, const NodeId parent) {
    if (parent != kNoNode && parent >= nodes_.size()) {
        throw exceptions::PreconditionError("adopt: unknown parent " + std::to_string(parent));
    }
    node->id = static_cast<NodeId>(nodes_.size());
    node->parent = parent;
    node->arena_ = this;
    if (parent != kNoNode) { nodes_[parent]->children.push_back(node->id); }
    nodes_.push_back(std::move(node));
}

const Node &NodeArena::at(const NodeId id) const {
    if (id >= nodes_.size()) { throw exceptions::PreconditionError("no node with id " + std::to_string(id)); }
    return *nodes_[id];
}

Node &NodeArena::at(const NodeId id) {
    if (id >= nodes_.size()) { throw exceptions::PreconditionError("no node with id " + std::to_string(id)); }
    return *nodes_[id];
}

const Node *NodeArena::get(const NodeId id) const { return id < nodes_.size() ? nodes_[id].get() : nullptr; }

void NodeArena::registerModule(const std::string &name, const NodeId module) { modules_[name] = module; }

const Module *NodeArena::findModule(const std::string &name) const {
    const auto it = modules_.find(name);
    if (it == modules_.end()) { return nullptr; }
    return static_cast<const Module *>(nodes_[it->second].get());
}

const Module &NodeArena::builtins() const { return static_cast<const Module &>(at(builtins_)); }

const ClassDef *NodeArena::builtinClass(const std::string &name) const {
    const auto *bindings = builtins().locals(name);
    if (bindings == nullptr) { return nullptr; }
    for (const NodeId id : *bindings) {
        if (at(id).kind == NodeKind::ClassDef) { return static_cast<const ClassDef *>(&at(id)); }
    }
    return nullptr;
}

} // namespace pyinfer::ast
