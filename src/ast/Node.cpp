/**
 * @file
 * @brief Node relationships: parent/child access, statement/frame/scope resolution, siblings.
 */
/***
 * Name: pyinfer::ast::Node (scope resolver)
 * Purpose: Answer structural questions about a node's position in its tree.
 * Theory of Operation:
 *   Every query is an iterative walk over parent indices, so depth is bounded
 *   only by the tree. The walks never allocate and never mutate the tree;
 *   setLocal is the single construction-time mutation path.
 */
#include "ast/HasLocals.h"
#include "ast/Node.h"
#include "ast/NodeArena.h"
#include "pyinfer/exceptions/precondition_error.h"

#include <string>

namespace pyinfer::ast {

const Node *Node::parentNode() const { return arena_ == nullptr ? nullptr : arena_->get(parent); }

Node *Node::parentNode() {
    if (arena_ == nullptr || parent == kNoNode) { return nullptr; }
    return &arena_->at(parent);
}

const Node &Node::child(const std::size_t index) const {
    if (index >= children.size()) {
        throw exceptions::PreconditionError(std::string(to_string(kind)) + " has no child " + std::to_string(index));
    }
    return arena_->at(children[index]);
}

bool Node::parentOf(const Node &other) const {
    for (const Node *node = other.parentNode(); node != nullptr; node = node->parentNode()) {
        if (node == this) { return true; }
    }
    return false;
}

const Node &Node::statement() const {
    for (const Node *node = this; node != nullptr; node = node->parentNode()) {
        if (node->isStatement()) { return *node; }
    }
    throw exceptions::PreconditionError(std::string("no statement encloses ") + to_string(kind));
}

const Node &Node::frame() const {
    for (const Node *node = this; node != nullptr; node = node->parentNode()) {
        if (node->isFrame()) { return *node; }
    }
    throw exceptions::PreconditionError(std::string("no frame encloses ") + to_string(kind));
}

Node &Node::frame() {
    for (Node *node = this; node != nullptr; node = node->parentNode()) {
        if (node->isFrame()) { return *node; }
    }
    throw exceptions::PreconditionError(std::string("no frame encloses ") + to_string(kind));
}

const Node &Node::scope() const {
    for (const Node *node = this; node != nullptr; node = node->parentNode()) {
        if (node->isScope()) { return *node; }
    }
    throw exceptions::PreconditionError(std::string("no scope encloses ") + to_string(kind));
}

const Node &Node::root() const {
    const Node *node = this;
    while (const Node *up = node->parentNode()) { node = up; }
    return *node;
}

namespace {
// Sibling statement at `offset` from `stmt` in its parent's statement children.
const Node *siblingAt(const Node &stmt, const int offset) {
    const Node *owner = stmt.parentNode();
    if (owner == nullptr) { return nullptr; }
    std::vector<const Node *> stmts;
    for (std::size_t i = 0; i < owner->childCount(); ++i) {
        const Node &c = owner->child(i);
        if (c.isStatement()) { stmts.push_back(&c); }
    }
    for (std::size_t i = 0; i < stmts.size(); ++i) {
        if (stmts[i] != &stmt) { continue; }
        const auto target = static_cast<long>(i) + offset;
        if (target < 0 || target >= static_cast<long>(stmts.size())) { return nullptr; }
        return stmts[static_cast<std::size_t>(target)];
    }
    return nullptr;
}
} // namespace

const Node *Node::nextSibling() const { return siblingAt(statement(), 1); }

const Node *Node::previousSibling() const { return siblingAt(statement(), -1); }

const Node *Node::nearest(const std::vector<const Node *> &candidates) const {
    const Node &top = root();
    const int line = sourceLine();
    const Node *best = nullptr;
    for (const Node *candidate : candidates) {
        if (&candidate->root() != &top) {
            throw exceptions::PreconditionError("nearest: candidate belongs to another tree");
        }
        if (candidate->sourceLine() > line) { break; }
        best = candidate;
    }
    return best;
}

void Node::setLocal(const std::string &name, const NodeId binding) {
    for (Node *node = this; node != nullptr; node = node->parentNode()) {
        if (HasLocals *table = localsOf(*node)) {
            table->addLocal(name, binding);
            return;
        }
    }
    throw exceptions::PreconditionError("setLocal: no binding table above " + std::string(to_string(kind)));
}

NodeWalk Node::nodesOfClass(const KindSet match, const KindSet skip) const { return NodeWalk(*this, match, skip); }

} // namespace pyinfer::ast
