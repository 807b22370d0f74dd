/***
 * Name: pyinfer::infer::kinds::attribute / inferAttr
 * Purpose: Attribute access on inferred owners.
 * Theory of Operation:
 *   Owners are inferred first. Unknown owners yield Unknown; each other
 *   owner is asked for the attribute with itself as bound receiver, and
 *   owners lacking the attribute are skipped. Modules answer from their
 *   top-level bindings, classes through the class model, instances and
 *   literals through the instance rules of their (builtin) class.
 */
#include "infer/ClassModel.h"
#include "infer/Infer.h"
#include "infer/KindInference.h"
#include "infer/Proxies.h"
#include "infer/Sources.h"
#include "pyinfer/exceptions/not_found_error.h"

namespace pyinfer::infer {

namespace kinds {

InferStream attribute(const ast::Attribute &node, const InferenceContext &ctx) {
    const std::string attr = node.attr;
    return flatMap(
        infer(node.expr(), ctx.clone()),
        [attr, ctx](const Value &owner) {
            if (owner.isUnknown()) { return InferStream::single(owner); }
            InferenceContext bound = ctx.clone();
            bound.boundNode = owner;
            return inferAttr(owner, attr, bound);
        },
        InnerFailure::Skip);
}

} // namespace kinds

InferStream inferAttr(const Value &owner, const std::string &attr, const InferenceContext &ctx) {
    switch (owner.kind) {
        case ValueKind::Unknown:
            return InferStream::single(owner);
        case ValueKind::Instance:
            return Instance(static_cast<const ast::ClassDef &>(*owner.node)).inferredGetAttr(attr, ctx);
        case ValueKind::InstanceMethod:
        case ValueKind::Generator:
            return inferAttr(Value::of(*owner.node), attr, ctx);
        case ValueKind::Node:
            break;
    }
    const ast::Node &node = *owner.node;
    if (node.kind == ast::NodeKind::Module) {
        const auto &module = static_cast<const ast::Module &>(node);
        InferenceContext named = ctx;
        named.lookupName = attr;
        return inferStatements(valuesOf(node.arena(), module.getAttr(attr)), named, &module);
    }
    if (node.kind == ast::NodeKind::ClassDef) {
        return classInferredGetAttr(static_cast<const ast::ClassDef &>(node), attr, ctx);
    }
    if (const ast::ClassDef *cls = proxiedClass(node)) { return Instance(*cls).inferredGetAttr(attr, ctx); }
    throw exceptions::NotFoundError(attr);
}

} // namespace pyinfer::infer
