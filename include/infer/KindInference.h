/***
 * Name: pyinfer::infer::kinds
 * Purpose: Per-kind inference rules dispatched by infer().
 * Theory of Operation:
 *   Each rule receives the context of the guarded stream it runs in and may
 *   throw NotFoundError, UnresolvableName or InferenceError; the enclosing
 *   stream turns those into its failure.
 */
#pragma once

#include "ast/Nodes.h"
#include "infer/InferStream.h"
#include "infer/InferenceContext.h"

namespace pyinfer::infer::kinds {

    InferStream name(const ast::Name &node, const InferenceContext &ctx);
    // AssignName and AssignAttr: the value assigned by the enclosing construct.
    InferStream assigned(const ast::Node &target, const InferenceContext &ctx);
    InferStream attribute(const ast::Attribute &node, const InferenceContext &ctx);
    InferStream call(const ast::Call &node, const InferenceContext &ctx);

    InferStream import(const ast::Import &node, const InferenceContext &ctx);
    InferStream importFrom(const ast::ImportFrom &node, const InferenceContext &ctx);
    InferStream global(const ast::GlobalStmt &node, const InferenceContext &ctx);
    InferStream tryExcept(const ast::TryExcept &node, const InferenceContext &ctx);

    // FunctionDef/LambdaExpr inferred for one of their parameters.
    InferStream argument(const ast::Node &def, const InferenceContext &ctx);

    InferStream ifExpr(const ast::IfExpr &node, const InferenceContext &ctx);
    InferStream subscript(const ast::Subscript &node, const InferenceContext &ctx);
    // Compare and `not`: an instance of the builtin bool.
    InferStream boolResult(const ast::Node &node);

} // namespace pyinfer::infer::kinds
