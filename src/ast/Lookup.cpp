/***
 * Name: pyinfer::ast::lookup / qualifiedName
 * Purpose: Scope chain name resolution and dotted names of frames.
 * Theory of Operation:
 *   Expressions written on a definition but outside its body (decorators,
 *   defaults, class bases) and the iterable of a generator expression are
 *   evaluated by the enclosing scope, so the walk starts there for them.
 *   Class scopes are invisible to code nested in a function, lambda or
 *   generator expression below the class. The builtins module closes every
 *   chain.
 */
#include "ast/Lookup.h"
#include "ast/Nodes.h"

#include <algorithm>

namespace pyinfer::ast {

namespace {

bool under(const Node &top, const Node &node) { return &top == &node || top.parentOf(node); }

bool evaluatedInside(const Node &scope, const Node &node) {
    if (&scope == &node) { return true; }
    switch (scope.kind) {
        case NodeKind::FunctionDef: return static_cast<const FunctionDef &>(scope).inBody(node);
        case NodeKind::LambdaExpr: return static_cast<const LambdaExpr &>(scope).inBody(node);
        case NodeKind::ClassDef: return under(static_cast<const ClassDef &>(scope).body(), node);
        case NodeKind::GeneratorExpr: return !under(static_cast<const GeneratorExpr &>(scope).iterable(), node);
        default: return true;
    }
}

const Node *enclosingScope(const Node &scope) {
    const Node *up = scope.parentNode();
    return up == nullptr ? nullptr : &up->scope();
}

} // namespace

LookupResult lookup(const Node &node, const std::string &name) {
    const Node *scope = &node.scope();
    if (!evaluatedInside(*scope, node)) { scope = enclosingScope(*scope); }
    bool nested = false;
    for (; scope != nullptr; scope = enclosingScope(*scope)) {
        if (!(nested && scope->kind == NodeKind::ClassDef)) {
            if (const auto *bindings = localsOf(*scope)->locals(name)) { return {scope, *bindings}; }
        }
        if (scope->kind != NodeKind::ClassDef) { nested = nested || scope->kind != NodeKind::Module; }
    }
    const Module &builtins = node.arena().builtins();
    if (const auto *bindings = builtins.locals(name)) { return {&builtins, *bindings}; }
    return {};
}

std::string qualifiedName(const Node &frame) {
    std::vector<std::string> parts;
    for (const Node *node = &frame.frame(); node != nullptr;) {
        switch (node->kind) {
            case NodeKind::Module: parts.push_back(static_cast<const Module &>(*node).name); break;
            case NodeKind::FunctionDef: parts.push_back(static_cast<const FunctionDef &>(*node).name); break;
            case NodeKind::ClassDef: parts.push_back(static_cast<const ClassDef &>(*node).name); break;
            default: break;
        }
        const Node *up = node->parentNode();
        node = up == nullptr ? nullptr : &up->frame();
    }
    std::reverse(parts.begin(), parts.end());
    std::string out;
    for (const auto &part : parts) {
        if (!out.empty()) { out += '.'; }
        out += part;
    }
    return out;
}

} // namespace pyinfer::ast
