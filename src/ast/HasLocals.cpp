/***
 * Name: pyinfer::ast::HasLocals
 * Purpose: Append-only binding tables and their lookup by node kind.
 */
#include "ast/HasLocals.h"
#include "ast/Nodes.h"

namespace pyinfer::ast {

void HasLocals::addLocal(const std::string &name, const NodeId binding) {
    auto [it, inserted] = table_.try_emplace(name);
    if (inserted) { order_.push_back(name); }
    it->second.push_back(binding);
}

const std::vector<NodeId> *HasLocals::locals(const std::string &name) const {
    const auto it = table_.find(name);
    return it == table_.end() ? nullptr : &it->second;
}

HasLocals *localsOf(Node &node) {
    switch (node.kind) {
        case NodeKind::Module: return &static_cast<Module &>(node);
        case NodeKind::FunctionDef: return &static_cast<FunctionDef &>(node);
        case NodeKind::ClassDef: return &static_cast<ClassDef &>(node);
        case NodeKind::LambdaExpr: return &static_cast<LambdaExpr &>(node);
        case NodeKind::GeneratorExpr: return &static_cast<GeneratorExpr &>(node);
        default: return nullptr;
    }
}

const HasLocals *localsOf(const Node &node) { return localsOf(const_cast<Node &>(node)); }

} // namespace pyinfer::ast
