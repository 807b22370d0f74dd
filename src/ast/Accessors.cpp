/***
 * Name: pyinfer::ast accessors
 * Purpose: Decode the per-kind child layouts into typed views.
 * Theory of Operation:
 *   The ordered children vector is the only storage; counts kept on the node
 *   (decorators, defaults, bases, keywords) split it into sections. A child
 *   expected to be a Block is checked before it is handed out.
 */
#include "ast/Nodes.h"
#include "pyinfer/exceptions/not_found_error.h"
#include "pyinfer/exceptions/precondition_error.h"

#include <string>

namespace pyinfer::ast {

namespace {

const Block &asBlock(const Node &node) {
    if (node.kind != NodeKind::Block) {
        throw exceptions::PreconditionError(std::string("expected Block, found ") + to_string(node.kind));
    }
    return static_cast<const Block &>(node);
}

const Block *optionalBlock(const Node &owner, const std::size_t index) {
    if (index >= owner.childCount()) { return nullptr; }
    return &asBlock(owner.child(index));
}

std::vector<NodeId> slice(const Node &node, const std::size_t from, const std::size_t count) {
    const auto begin = node.children.begin() + static_cast<std::ptrdiff_t>(from);
    return {begin, begin + static_cast<std::ptrdiff_t>(count)};
}

const Node *defaultOf(const Node &owner, const HasParams &params, const std::size_t firstDefault,
                      const std::string &param) {
    const auto index = params.paramIndex(param);
    const std::size_t firstWithDefault = params.params.size() - params.defaultCount;
    if (!index || *index < firstWithDefault) { return nullptr; }
    return &owner.child(firstDefault + (*index - firstWithDefault));
}

bool under(const Node &top, const Node &node) { return &top == &node || top.parentOf(node); }

} // namespace

const Block &Module::body() const { return asBlock(child(0)); }

const std::vector<NodeId> &Module::getAttr(const std::string &attr) const {
    const auto *bindings = locals(attr);
    if (bindings == nullptr) { throw exceptions::NotFoundError(attr); }
    return *bindings;
}

std::vector<NodeId> FunctionDef::decorators() const { return slice(*this, 0, decoratorCount); }

std::vector<NodeId> FunctionDef::defaults() const { return slice(*this, decoratorCount, defaultCount); }

const Block &FunctionDef::body() const { return asBlock(child(childCount() - 1)); }

const Node *FunctionDef::defaultFor(const std::string &param) const {
    return defaultOf(*this, *this, decoratorCount, param);
}

FunctionType FunctionDef::type() const {
    const Node *owner = parentNode();
    if (owner == nullptr || owner->parentNode() == nullptr || owner->parentNode()->kind != NodeKind::ClassDef) {
        return FunctionType::Function;
    }
    for (const NodeId id : decorators()) {
        const Node &decorator = arena().at(id);
        if (decorator.kind != NodeKind::Name) { continue; }
        const auto &name = static_cast<const Name &>(decorator).id;
        if (name == "classmethod") { return FunctionType::ClassMethod; }
        if (name == "staticmethod") { return FunctionType::StaticMethod; }
    }
    return FunctionType::Method;
}

bool FunctionDef::isGenerator() const {
    const KindSet nested{NodeKind::FunctionDef, NodeKind::ClassDef, NodeKind::LambdaExpr, NodeKind::GeneratorExpr};
    const auto walk = body().nodesOfClass({NodeKind::YieldExpr}, nested);
    return walk.begin() != walk.end();
}

bool FunctionDef::inBody(const Node &node) const { return under(body(), node); }

std::vector<NodeId> ClassDef::decorators() const { return slice(*this, 0, decoratorCount); }

std::vector<NodeId> ClassDef::bases() const { return slice(*this, decoratorCount, baseCount); }

const Block &ClassDef::body() const { return asBlock(child(childCount() - 1)); }

void ClassDef::addInstanceAttr(const std::string &attr, const NodeId assignAttr) {
    instanceAttrs_.addLocal(attr, assignAttr);
}

std::vector<NodeId> LambdaExpr::defaults() const { return slice(*this, 0, defaultCount); }

const Node &LambdaExpr::body() const { return child(childCount() - 1); }

const Node *LambdaExpr::defaultFor(const std::string &param) const { return defaultOf(*this, *this, 0, param); }

bool LambdaExpr::inBody(const Node &node) const { return under(body(), node); }

const Block &IfStmt::branchBody(const std::size_t branch) const { return asBlock(child(branch * 2 + 1)); }

const Block *IfStmt::orelse() const { return childCount() % 2 == 1 ? &asBlock(child(childCount() - 1)) : nullptr; }

const Block &WhileStmt::body() const { return asBlock(child(1)); }

const Block *WhileStmt::orelse() const { return optionalBlock(*this, 2); }

const Block &ForStmt::body() const { return asBlock(child(2)); }

const Block *ForStmt::orelse() const { return optionalBlock(*this, 3); }

const Block &ExceptHandler::body() const { return asBlock(child(childCount() - 1)); }

const Block &TryExcept::body() const { return asBlock(child(0)); }

std::vector<const ExceptHandler *> TryExcept::handlers() const {
    std::vector<const ExceptHandler *> out;
    for (std::size_t i = 1; i < childCount(); ++i) {
        const Node &c = child(i);
        if (c.kind == NodeKind::ExceptHandler) { out.push_back(static_cast<const ExceptHandler *>(&c)); }
    }
    return out;
}

const Block *TryExcept::orelse() const {
    if (childCount() < 2) { return nullptr; }
    const Node &last = child(childCount() - 1);
    return last.kind == NodeKind::Block ? &asBlock(last) : nullptr;
}

const Block &TryFinally::body() const { return asBlock(child(0)); }

const Block *TryFinally::finalbody() const { return optionalBlock(*this, 1); }

const Block &WithStmt::body() const { return asBlock(child(childCount() - 1)); }

const Node *Call::keyword(const std::string &name) const {
    const std::size_t first = childCount() - keywordNames.size();
    for (std::size_t i = 0; i < keywordNames.size(); ++i) {
        if (keywordNames[i] == name) { return &child(first + i); }
    }
    return nullptr;
}

} // namespace pyinfer::ast
