/***
 * Name: pyinfer::ast::Node::blockRange
 * Purpose: Map a line inside a compound statement to the span of the sub-block holding it.
 * Inputs:
 *   - line: a line known to lie inside this node
 * Outputs:
 *   - Inclusive (start, end) span.
 * Theory of Operation:
 *   Central switch over the node kind. Definitions always answer their whole
 *   extent. Loops and try/finally use the elsed rule against their trailing
 *   clause. Conditionals and try/except first test each elif or handler
 *   clause (exact header line, or inside the clause body) and otherwise fall
 *   back to the elsed rule, bounded by the line before the first clause that
 *   did not match. Everything else spans from the line to the node's end.
 */
#include "ast/Nodes.h"

#include <optional>

namespace pyinfer::ast {

namespace {

LineRange elsedBlockRange(const Node &node, const Node *clause, const int line,
                          const std::optional<int> fallback = std::nullopt) {
    if (line == node.sourceLine()) { return {line, line}; }
    if (clause != nullptr) {
        if (line >= clause->sourceLine()) { return {line, clause->lastSourceLine()}; }
        return {line, clause->sourceLine() - 1};
    }
    return {line, fallback.value_or(node.lastSourceLine())};
}

LineRange ifBlockRange(const IfStmt &stmt, const int line) {
    std::optional<int> fallback;
    for (std::size_t i = 1; i < stmt.branchCount(); ++i) {
        const int header = stmt.test(i).sourceLine();
        if (line == header) { return {line, line}; }
        const Block &body = stmt.branchBody(i);
        if (line > header && line <= body.lastSourceLine()) { return {line, body.lastSourceLine()}; }
        if (!fallback) { fallback = header - 1; }
    }
    return elsedBlockRange(stmt, stmt.orelse(), line, fallback);
}

LineRange tryExceptBlockRange(const TryExcept &stmt, const int line) {
    std::optional<int> fallback;
    for (const ExceptHandler *handler : stmt.handlers()) {
        const Node *type = handler->type();
        if (type != nullptr && line == type->sourceLine()) { return {line, line}; }
        const Block &body = handler->body();
        if (line >= body.sourceLine() && line <= body.lastSourceLine()) { return {line, body.lastSourceLine()}; }
        if (!fallback) { fallback = body.sourceLine() - 1; }
    }
    return elsedBlockRange(stmt, stmt.orelse(), line, fallback);
}

} // namespace

LineRange Node::blockRange(const int line) const {
    switch (kind) {
        case NodeKind::Module:
        case NodeKind::FunctionDef:
        case NodeKind::ClassDef:
            return {sourceLine(), lastSourceLine()};
        case NodeKind::WhileStmt: {
            const auto &stmt = static_cast<const WhileStmt &>(*this);
            return elsedBlockRange(stmt, stmt.orelse(), line);
        }
        case NodeKind::ForStmt: {
            const auto &stmt = static_cast<const ForStmt &>(*this);
            return elsedBlockRange(stmt, stmt.orelse(), line);
        }
        case NodeKind::TryFinally: {
            const auto &stmt = static_cast<const TryFinally &>(*this);
            return elsedBlockRange(stmt, stmt.finalbody(), line);
        }
        case NodeKind::IfStmt:
            return ifBlockRange(static_cast<const IfStmt &>(*this), line);
        case NodeKind::TryExcept:
            return tryExceptBlockRange(static_cast<const TryExcept &>(*this), line);
        default:
            return {line, lastSourceLine()};
    }
}

} // namespace pyinfer::ast
