/***
 * Name: pyinfer::ast::NodeWalk
 * Purpose: Depth-first pre-order traversal filtered by node kind.
 */
#include "ast/NodeArena.h"
#include "ast/NodeWalk.h"

namespace pyinfer::ast {

NodeWalk::iterator::iterator(const Node &start, const KindSet match, const KindSet skip)
    : arena_(&start.arena()), match_(match), skip_(skip) {
    pending_.push_back(start.id);
    advance();
}

NodeWalk::iterator &NodeWalk::iterator::operator++() {
    advance();
    return *this;
}

void NodeWalk::iterator::advance() {
    current_ = nullptr;
    while (!pending_.empty()) {
        const Node &node = arena_->at(pending_.back());
        pending_.pop_back();
        // Children go on in reverse so the leftmost child is visited next.
        for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
            if (!skip_.contains(arena_->at(*it).kind)) { pending_.push_back(*it); }
        }
        if (match_.contains(node.kind)) {
            current_ = &node;
            return;
        }
    }
}

std::vector<const Node *> NodeWalk::collect() const {
    std::vector<const Node *> out;
    for (const Node *node : *this) { out.push_back(node); }
    return out;
}

} // namespace pyinfer::ast
