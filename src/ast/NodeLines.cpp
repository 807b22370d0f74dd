/***
 * Name: pyinfer::ast::Node::sourceLine / lastSourceLine
 * Purpose: Derive line numbers for nodes whose parser metadata is incomplete.
 * Inputs: Externally populated fromLine/toLine (0 = not set).
 * Outputs: First and last line of the node's extent.
 * Theory of Operation:
 *   sourceLine prefers the node's own fromLine, then the first line found
 *   descending through first children, then the nearest ancestor's line.
 *   lastSourceLine is the maximum over the node and its whole subtree. Both
 *   results are cached on the node after the first computation.
 */
#include "ast/Node.h"
#include "ast/NodeArena.h"

#include <algorithm>

namespace pyinfer::ast {

int Node::sourceLine() const {
    if (sourceLine_) { return *sourceLine_; }
    int line = kind == NodeKind::Module ? 0 : fromLine;
    if (kind != NodeKind::Module) {
        for (const Node *node = this; line == 0 && !node->children.empty();) {
            node = &node->child(0);
            line = node->fromLine;
        }
        for (const Node *node = parentNode(); line == 0 && node != nullptr; node = node->parentNode()) {
            line = node->fromLine;
        }
    }
    sourceLine_ = line;
    return line;
}

int Node::lastSourceLine() const {
    if (lastSourceLine_) { return *lastSourceLine_; }
    int line = std::max(sourceLine(), toLine);
    for (std::size_t i = 0; i < children.size(); ++i) {
        line = std::max(line, child(i).lastSourceLine());
    }
    lastSourceLine_ = line;
    return line;
}

} // namespace pyinfer::ast
