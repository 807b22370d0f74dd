/***
 * Name: pyinfer::infer::kinds::call / argument / inferCallResult
 * Purpose: Call results and the inference of parameters from call sites.
 * Theory of Operation:
 *   The callee is inferred in the caller's context; each callee value is
 *   then asked for its call result with a CallContext naming the call and
 *   the function applied. Inside the function, a parameter resolves to the
 *   bound receiver (first parameter of a bound method), the class (first
 *   parameter of a classmethod), the matching positional or keyword
 *   argument when the call context targets this very function, or its
 *   default value. Arguments are inferred in the context of their call site.
 */
#include "ast/NodeArena.h"
#include "infer/Infer.h"
#include "infer/KindInference.h"
#include "infer/Proxies.h"
#include "infer/Sources.h"
#include "pyinfer/exceptions/inference_error.h"

#include <memory>
#include <string>

namespace pyinfer::infer {

namespace {

const ast::ClassDef &enclosingClass(const ast::FunctionDef &fn) {
    return static_cast<const ast::ClassDef &>(*fn.parentNode()->parentNode());
}

// Argument expressions are evaluated where the call was written.
InferStream inferArgument(const ast::Node &arg, const CallContext &call, const InferenceContext &ctx) {
    InferenceContext site = ctx.clone();
    site.callContext = call.outer;
    site.boundNode = call.outerBound;
    return infer(arg, site);
}

} // namespace

namespace kinds {

InferStream call(const ast::Call &node, const InferenceContext &ctx) {
    return flatMap(
        infer(node.callee(), ctx.clone()),
        [&node, ctx](const Value &callee) {
            if (callee.isUnknown()) { return InferStream::single(callee); }
            return inferCallResult(callee, &node, ctx);
        },
        InnerFailure::Skip);
}

InferStream argument(const ast::Node &def, const InferenceContext &ctx) {
    const std::string &name = *ctx.lookupName;
    const bool isFunction = def.kind == ast::NodeKind::FunctionDef;
    const ast::HasParams &params = isFunction ? static_cast<const ast::HasParams &>(static_cast<const ast::FunctionDef &>(def))
                                              : static_cast<const ast::HasParams &>(static_cast<const ast::LambdaExpr &>(def));
    const auto index = params.paramIndex(name);
    if (!index) { throw exceptions::InferenceError("no parameter named " + name); }

    const ast::FunctionType type =
        isFunction ? static_cast<const ast::FunctionDef &>(def).type() : ast::FunctionType::Function;
    const bool targeted = ctx.callContext && ctx.callContext->callee == &def && ctx.callContext->call != nullptr;
    std::size_t offset = 0;
    if (type == ast::FunctionType::ClassMethod) {
        if (*index == 0) { return InferStream::single(Value::of(enclosingClass(static_cast<const ast::FunctionDef &>(def)))); }
        offset = 1;
    } else if (type == ast::FunctionType::Method) {
        if (ctx.boundNode) {
            if (*index == 0) { return InferStream::single(*ctx.boundNode); }
            offset = 1;
        } else if (*index == 0 && !(targeted && !ctx.callContext->call->args().empty())) {
            return InferStream::single(Value::instance(enclosingClass(static_cast<const ast::FunctionDef &>(def))));
        }
    }

    if (targeted) {
        const CallContext &site = *ctx.callContext;
        const auto args = site.call->args();
        if (*index >= offset && *index - offset < args.size()) {
            return inferArgument(def.arena().at(args[*index - offset]), site, ctx);
        }
        if (const ast::Node *keyword = site.call->keyword(name)) { return inferArgument(*keyword, site, ctx); }
    }

    const ast::Node *fallback = isFunction ? static_cast<const ast::FunctionDef &>(def).defaultFor(name)
                                           : static_cast<const ast::LambdaExpr &>(def).defaultFor(name);
    if (fallback != nullptr) {
        InferenceContext defining = ctx.clone();
        defining.callContext.reset();
        defining.boundNode.reset();
        return infer(*fallback, defining);
    }
    throw exceptions::InferenceError("no value for argument " + name);
}

} // namespace kinds

InferStream inferCallResult(const Value &callee, const ast::Call *caller, const InferenceContext &ctx) {
    switch (callee.kind) {
        case ValueKind::Unknown:
            return InferStream::single(callee);
        case ValueKind::Instance:
            return Instance(static_cast<const ast::ClassDef &>(*callee.node)).inferCallResult(caller, ctx);
        case ValueKind::InstanceMethod:
            return InstanceMethod(static_cast<const ast::FunctionDef &>(*callee.node), *callee.receiver)
                .inferCallResult(caller, ctx);
        case ValueKind::Generator:
            throw exceptions::InferenceError("generator object is not callable");
        case ValueKind::Node:
            break;
    }
    const ast::Node &node = *callee.node;
    switch (node.kind) {
        case ast::NodeKind::ClassDef:
            return InferStream::single(Value::instance(static_cast<const ast::ClassDef &>(node)));
        case ast::NodeKind::FunctionDef:
            return functionCallResult(static_cast<const ast::FunctionDef &>(node), caller, ctx, std::nullopt);
        case ast::NodeKind::LambdaExpr: {
            const auto &lambda = static_cast<const ast::LambdaExpr &>(node);
            InferenceContext body = ctx.clone();
            body.callContext = std::make_shared<const CallContext>(CallContext{caller, &lambda, ctx.callContext, ctx.boundNode});
            body.boundNode.reset();
            return infer(lambda.body(), body);
        }
        default:
            throw exceptions::InferenceError(describe(callee) + " is not callable");
    }
}

bool isCallable(const Value &value) {
    switch (value.kind) {
        case ValueKind::Unknown:
        case ValueKind::InstanceMethod:
            return true;
        case ValueKind::Generator:
            return Generator(static_cast<const ast::FunctionDef &>(*value.node)).isCallable();
        case ValueKind::Instance:
            return Instance(static_cast<const ast::ClassDef &>(*value.node)).isCallable();
        case ValueKind::Node:
            break;
    }
    switch (value.node->kind) {
        case ast::NodeKind::ClassDef:
        case ast::NodeKind::FunctionDef:
        case ast::NodeKind::LambdaExpr:
            return true;
        default:
            return false;
    }
}

} // namespace pyinfer::infer
