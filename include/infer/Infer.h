/***
 * Name: pyinfer::infer::infer
 * Purpose: Entry points of the inference engine.
 * Inputs:
 *   - A node or value and an InferenceContext.
 * Outputs:
 *   - Lazy InferStream of the values the expression may evaluate to.
 * Theory of Operation:
 *   infer() dispatches on the node kind through one central switch. Kinds
 *   that resolve through bindings (names, attributes, calls, imports,
 *   globals, exception handlers) run behind the cycle guard; the others are
 *   computed on first pull. Terminal kinds yield themselves.
 */
#pragma once

#include "ast/Call.h"
#include "ast/Import.h"
#include "ast/Node.h"
#include "infer/InferStream.h"
#include "infer/InferenceContext.h"
#include "infer/Value.h"

#include <string>

namespace pyinfer::infer {

    InferStream infer(const ast::Node &node, const InferenceContext &ctx);
    InferStream infer(const ast::Node &node);
    // Proxies and Unknown yield themselves; node values infer the node.
    InferStream infer(const Value &value, const InferenceContext &ctx);

    // True for the kinds inferred behind the cycle guard.
    bool isGuardedKind(ast::NodeKind kind);

    // Values produced by calling `callee` at `caller` (nullptr when synthetic).
    InferStream inferCallResult(const Value &callee, const ast::Call *caller, const InferenceContext &ctx);

    // Inferred attribute lookup on any value.
    InferStream inferAttr(const Value &owner, const std::string &attr, const InferenceContext &ctx);

    // Module imported by `stmt` under its real dotted name `name`.
    InferStream inferNameModule(const ast::Import &stmt, const std::string &name);

    bool isCallable(const Value &value);

    // Dotted runtime type name (`__builtin__.int`, `mod.Class`); throws NotFoundError for plain syntax.
    std::string pytype(const Value &value);

    // Human-readable description used by logs and tools.
    std::string describe(const Value &value);

} // namespace pyinfer::infer
