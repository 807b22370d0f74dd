/***
 * Name: pyinfer::infer::infer
 * Purpose: Central dispatch of inference over node kinds and value kinds.
 * Theory of Operation:
 *   One exhaustive switch routes each node kind to its rule. Guarded kinds
 *   run inside the cycle guard keyed by (node, lookup name); the rest are
 *   deferred so nothing is computed before the first pull.
 */
#include "infer/Infer.h"
#include "infer/KindInference.h"
#include "infer/Sources.h"
#include "pyinfer/exceptions/inference_error.h"

#include <string>

namespace pyinfer::infer {

namespace {

InferStream notAnExpression(const ast::Node &node) {
    throw exceptions::InferenceError(std::string(ast::to_string(node.kind)) + " at line " +
                                     std::to_string(node.sourceLine()) + " is not an expression");
}

InferStream dispatch(const ast::Node &node, const InferenceContext &ctx) {
    using ast::NodeKind;
    switch (node.kind) {
        case NodeKind::Module:
        case NodeKind::ClassDef:
        case NodeKind::GeneratorExpr:
        case NodeKind::TupleLiteral:
        case NodeKind::ListLiteral:
        case NodeKind::DictLiteral:
        case NodeKind::IntLiteral:
        case NodeKind::FloatLiteral:
        case NodeKind::StringLiteral:
        case NodeKind::BoolLiteral:
        case NodeKind::NoneLiteral:
            return InferStream::single(Value::of(node));
        case NodeKind::FunctionDef:
        case NodeKind::LambdaExpr:
            if (!ctx.lookupName) { return InferStream::single(Value::of(node)); }
            return kinds::argument(node, ctx);
        case NodeKind::Name:
            return kinds::name(static_cast<const ast::Name &>(node), ctx);
        case NodeKind::AssignName:
        case NodeKind::AssignAttr:
            return kinds::assigned(node, ctx);
        case NodeKind::Attribute:
            return kinds::attribute(static_cast<const ast::Attribute &>(node), ctx);
        case NodeKind::Call:
            return kinds::call(static_cast<const ast::Call &>(node), ctx);
        case NodeKind::Import:
            return kinds::import(static_cast<const ast::Import &>(node), ctx);
        case NodeKind::ImportFrom:
            return kinds::importFrom(static_cast<const ast::ImportFrom &>(node), ctx);
        case NodeKind::GlobalStmt:
            return kinds::global(static_cast<const ast::GlobalStmt &>(node), ctx);
        case NodeKind::TryExcept:
            return kinds::tryExcept(static_cast<const ast::TryExcept &>(node), ctx);
        case NodeKind::IfExpr:
            return kinds::ifExpr(static_cast<const ast::IfExpr &>(node), ctx);
        case NodeKind::Subscript:
            return kinds::subscript(static_cast<const ast::Subscript &>(node), ctx);
        case NodeKind::Compare:
            return kinds::boolResult(node);
        case NodeKind::UnaryExpr:
            if (static_cast<const ast::Unary &>(node).op == "not") { return kinds::boolResult(node); }
            return InferStream::single(Value::unknown());
        case NodeKind::BinaryExpr:
        case NodeKind::YieldExpr:
            return InferStream::single(Value::unknown());
        case NodeKind::Block:
        case NodeKind::AssignStmt:
        case NodeKind::AugAssignStmt:
        case NodeKind::ExprStmt:
        case NodeKind::ReturnStmt:
        case NodeKind::PassStmt:
        case NodeKind::BreakStmt:
        case NodeKind::ContinueStmt:
        case NodeKind::RaiseStmt:
        case NodeKind::IfStmt:
        case NodeKind::WhileStmt:
        case NodeKind::ForStmt:
        case NodeKind::ExceptHandler:
        case NodeKind::TryFinally:
        case NodeKind::WithStmt:
            return notAnExpression(node);
    }
    return notAnExpression(node);
}

} // namespace

bool isGuardedKind(const ast::NodeKind kind) {
    switch (kind) {
        case ast::NodeKind::Name:
        case ast::NodeKind::AssignName:
        case ast::NodeKind::AssignAttr:
        case ast::NodeKind::Attribute:
        case ast::NodeKind::Call:
        case ast::NodeKind::Import:
        case ast::NodeKind::ImportFrom:
        case ast::NodeKind::GlobalStmt:
        case ast::NodeKind::TryExcept:
            return true;
        default:
            return false;
    }
}

InferStream infer(const ast::Node &node, const InferenceContext &ctx) {
    if (isGuardedKind(node.kind)) {
        return guarded(node, ctx, [&node](InferenceContext &inner) { return dispatch(node, inner); });
    }
    return deferred([&node, ctx] { return dispatch(node, ctx); });
}

InferStream infer(const ast::Node &node) { return infer(node, InferenceContext(&node)); }

InferStream infer(const Value &value, const InferenceContext &ctx) {
    if (value.isNode()) { return infer(*value.node, ctx); }
    return InferStream::single(value);
}

} // namespace pyinfer::infer
