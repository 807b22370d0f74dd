/***
 * Name: pyinfer::infer::kinds::name / assigned
 * Purpose: Resolve names through their bindings and binding targets through
 *   the value their construct assigns.
 * Theory of Operation:
 *   A name is looked up from its own position; every binding found is a
 *   candidate for multi-candidate resolution in the scope that holds it.
 *   A binding target climbs to the construct that assigns it: plain
 *   assignment, tuple or list destructuring (by position), a for loop or
 *   generator expression (elements of the iterable), or a with statement
 *   (the `__enter__` result). Augmented assignment cannot be inferred.
 */
#include "ast/Lookup.h"
#include "infer/Infer.h"
#include "infer/KindInference.h"
#include "infer/Proxies.h"
#include "infer/Sources.h"
#include "pyinfer/exceptions/inference_error.h"
#include "pyinfer/exceptions/precondition_error.h"
#include "pyinfer/exceptions/unresolvable_name.h"

#include <string>

namespace pyinfer::infer::kinds {

namespace {

bool isSequenceLiteral(const Value &value) {
    return value.isNode(ast::NodeKind::TupleLiteral) || value.isNode(ast::NodeKind::ListLiteral);
}

// Element `index` of a tuple/list literal value, Unknown for anything else.
InferStream elementAt(const Value &sequence, const std::size_t index, const InferenceContext &ctx) {
    if (!isSequenceLiteral(sequence) || index >= sequence.node->childCount()) {
        return InferStream::single(Value::unknown());
    }
    return infer(sequence.node->child(index), ctx.clone());
}

// Every element of a tuple/list literal value, Unknown for anything else.
InferStream elementsOf(const Value &sequence, const InferenceContext &ctx) {
    if (!isSequenceLiteral(sequence)) { return InferStream::single(Value::unknown()); }
    std::vector<Value> elements;
    for (std::size_t i = 0; i < sequence.node->childCount(); ++i) {
        elements.push_back(Value::of(sequence.node->child(i)));
    }
    return flatMap(InferStream::values(std::move(elements)),
                   [ctx](const Value &element) { return infer(element, ctx.clone()); }, InnerFailure::Propagate);
}

InferStream enterResult(const Value &manager, const InferenceContext &ctx) {
    if (manager.kind != ValueKind::Instance) { return InferStream::single(Value::unknown()); }
    const Instance instance(static_cast<const ast::ClassDef &>(*manager.node));
    return flatMap(instance.inferredGetAttr("__enter__", ctx),
                   [ctx](const Value &method) { return inferCallResult(method, nullptr, ctx); }, InnerFailure::Skip);
}

std::size_t positionIn(const ast::Node &parent, const ast::Node &child) {
    for (std::size_t i = 0; i < parent.childCount(); ++i) {
        if (parent.children[i] == child.id) { return i; }
    }
    throw exceptions::PreconditionError("node is not a child of its parent");
}

} // namespace

InferStream name(const ast::Name &node, const InferenceContext &ctx) {
    const ast::LookupResult found = ast::lookup(node, node.id);
    if (!found.found()) { throw exceptions::UnresolvableName(node.id); }
    InferenceContext named = ctx;
    named.lookupName = node.id;
    return inferStatements(valuesOf(node.arena(), found.bindings), named, found.scope);
}

InferStream assigned(const ast::Node &target, const InferenceContext &ctx) {
    const ast::Node *parent = target.parentNode();
    if (parent == nullptr) { throw exceptions::InferenceError("binding target without a parent"); }
    switch (parent->kind) {
        case ast::NodeKind::AssignStmt:
            return infer(static_cast<const ast::AssignStmt &>(*parent).value(), ctx.clone());
        case ast::NodeKind::AugAssignStmt:
            throw exceptions::InferenceError("augmented assignment at line " + std::to_string(parent->sourceLine()));
        case ast::NodeKind::TupleLiteral:
        case ast::NodeKind::ListLiteral: {
            const std::size_t index = positionIn(*parent, target);
            return flatMap(assigned(*parent, ctx),
                           [index, ctx](const Value &sequence) { return elementAt(sequence, index, ctx); },
                           InnerFailure::Propagate);
        }
        case ast::NodeKind::ForStmt: {
            const auto &loop = static_cast<const ast::ForStmt &>(*parent);
            if (&loop.target() != &target) { break; }
            return flatMap(infer(loop.iterable(), ctx.clone()),
                           [ctx](const Value &iterable) { return elementsOf(iterable, ctx); }, InnerFailure::Propagate);
        }
        case ast::NodeKind::GeneratorExpr: {
            const auto &gen = static_cast<const ast::GeneratorExpr &>(*parent);
            if (&gen.target() != &target) { break; }
            return flatMap(infer(gen.iterable(), ctx.clone()),
                           [ctx](const Value &iterable) { return elementsOf(iterable, ctx); }, InnerFailure::Propagate);
        }
        case ast::NodeKind::WithStmt: {
            const auto &with = static_cast<const ast::WithStmt &>(*parent);
            if (with.target() != &target) { break; }
            return flatMap(infer(with.context(), ctx.clone()),
                           [ctx](const Value &manager) { return enterResult(manager, ctx); }, InnerFailure::Skip);
        }
        default:
            break;
    }
    throw exceptions::InferenceError(std::string("no assigned value for target under ") + ast::to_string(parent->kind));
}

} // namespace pyinfer::infer::kinds
