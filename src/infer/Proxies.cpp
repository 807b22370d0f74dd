/***
 * Name: pyinfer::infer proxies (impl)
 * Purpose: Instance, InstanceMethod and Generator behavior, and the call
 *   result of plain functions shared by all of them.
 */
#include "infer/Proxies.h"
#include "ast/Lookup.h"
#include "ast/NodeArena.h"
#include "ast/ReturnStmt.h"
#include "infer/ClassModel.h"
#include "infer/Infer.h"
#include "infer/Sources.h"
#include "pyinfer/exceptions/inference_error.h"
#include "pyinfer/exceptions/not_found_error.h"

#include <functional>
#include <memory>

namespace pyinfer::infer {

namespace {

// Plain methods found on the class become methods bound to an instance of it.
std::function<Value(const Value &)> bindMethods(const ast::ClassDef &cls) {
    return [receiver = &cls](const Value &value) {
        if (value.isNode(ast::NodeKind::FunctionDef)) {
            const auto &fn = static_cast<const ast::FunctionDef &>(*value.node);
            if (fn.type() == ast::FunctionType::Method) { return Value::method(fn, *receiver); }
        }
        return value;
    };
}

} // namespace

std::vector<Value> Instance::getAttr(const std::string &name, const bool lookupClass) const {
    try {
        return instanceAttr(cls_, name);
    } catch (const exceptions::NotFoundError &) {
        if (name == "__class__") { return {Value::of(cls_)}; }
        if (name == "__name__" || !lookupClass) { throw; }
        return classGetAttr(cls_, name);
    }
}

InferStream Instance::inferredGetAttr(const std::string &name, const InferenceContext &ctx) const {
    std::vector<Value> attrs;
    try {
        attrs = getAttr(name, false);
    } catch (const exceptions::NotFoundError &) {
        try {
            return mapValues(classInferredGetAttr(cls_, name, ctx), bindMethods(cls_));
        } catch (const exceptions::NotFoundError &) {
            throw exceptions::InferenceError(describe() + " has no attribute " + name);
        }
    }
    const auto bind = bindMethods(cls_);
    for (auto &attr : attrs) { attr = bind(attr); }
    return inferStatements(std::move(attrs), ctx, &cls_);
}

InferStream Instance::inferCallResult(const ast::Call *caller, const InferenceContext &ctx) const {
    InferStream callables;
    try {
        callables = classInferredGetAttr(cls_, "__call__", ctx);
    } catch (const exceptions::NotFoundError &) {
        throw exceptions::InferenceError(describe() + " is not callable");
    }
    const Value self = value();
    return flatMap(
        std::move(callables),
        [caller, ctx, self](const Value &callable) {
            if (callable.isNode(ast::NodeKind::FunctionDef)) {
                return functionCallResult(static_cast<const ast::FunctionDef &>(*callable.node), caller, ctx, self);
            }
            return infer::inferCallResult(callable, caller, ctx);
        },
        InnerFailure::Skip, describe() + " returned nothing when called");
}

bool Instance::isCallable() const {
    try {
        classGetAttr(cls_, "__call__");
        return true;
    } catch (const exceptions::NotFoundError &) {
        return false;
    }
}

std::string Instance::pytype() const { return ast::qualifiedName(cls_); }

std::string Instance::describe() const { return "Instance of " + ast::qualifiedName(cls_); }

InferStream InstanceMethod::inferCallResult(const ast::Call *caller, const InferenceContext &ctx) const {
    return functionCallResult(fn_, caller, ctx, Value::instance(receiver_));
}

std::string InstanceMethod::describe() const {
    return "Bound method " + fn_.name + " of " + ast::qualifiedName(receiver_);
}

std::string Generator::describe() const { return "Generator of " + ast::qualifiedName(fn_); }

InferStream functionCallResult(const ast::FunctionDef &fn, const ast::Call *caller, const InferenceContext &ctx,
                               const std::optional<Value> &receiver) {
    if (fn.isGenerator()) { return InferStream::single(Value::generator(fn)); }
    InferenceContext body = ctx.clone();
    body.callContext = std::make_shared<const CallContext>(CallContext{caller, &fn, ctx.callContext, ctx.boundNode});
    body.boundNode = receiver;

    const ast::KindSet nested{ast::NodeKind::FunctionDef, ast::NodeKind::ClassDef, ast::NodeKind::LambdaExpr,
                              ast::NodeKind::GeneratorExpr};
    std::vector<Value> returns;
    for (const ast::Node *node : fn.body().nodesOfClass({ast::NodeKind::ReturnStmt}, nested)) {
        const ast::Node *value = static_cast<const ast::ReturnStmt *>(node)->value();
        returns.push_back(Value::of(value != nullptr ? *value : fn.arena().noneConstant()));
    }
    if (returns.empty()) { returns.push_back(Value::of(fn.arena().noneConstant())); }
    return inferStatements(std::move(returns), body, &fn);
}

} // namespace pyinfer::infer
