/***
 * Name: pyinfer::infer::Value
 * Purpose: One inferred value: a syntactic node or a runtime proxy.
 * Inputs:
 *   - The node being proxied (ClassDef for instances, FunctionDef for bound
 *     methods and generators) and, for bound methods, the receiver's class.
 * Outputs:
 *   - Small copyable tagged value with equality.
 * Theory of Operation:
 *   Unknown carries no node, so every Unknown compares equal to every other.
 *   Proxies are views: the Instance, InstanceMethod and Generator classes in
 *   Proxies.h wrap a Value of the matching kind.
 */
#pragma once

#include "ast/ClassDef.h"
#include "ast/FunctionDef.h"
#include "ast/Node.h"
#include "ast/NodeArena.h"

#include <vector>

namespace pyinfer::infer {

    enum class ValueKind { Node, Instance, InstanceMethod, Generator, Unknown };

    const char *to_string(ValueKind kind);

    struct Value {
        ValueKind kind{ValueKind::Unknown};
        const ast::Node *node{nullptr};
        const ast::ClassDef *receiver{nullptr}; // InstanceMethod only

        static Value of(const ast::Node &n) { return {ValueKind::Node, &n, nullptr}; }
        static Value unknown() { return {}; }
        static Value instance(const ast::ClassDef &cls) { return {ValueKind::Instance, &cls, nullptr}; }
        static Value method(const ast::FunctionDef &fn, const ast::ClassDef &receiverClass) {
            return {ValueKind::InstanceMethod, &fn, &receiverClass};
        }
        static Value generator(const ast::FunctionDef &fn) { return {ValueKind::Generator, &fn, nullptr}; }

        bool isUnknown() const { return kind == ValueKind::Unknown; }
        bool isNode() const { return kind == ValueKind::Node; }
        bool isNode(const ast::NodeKind k) const { return kind == ValueKind::Node && node->kind == k; }

        bool operator==(const Value &other) const = default;
    };

    // Node values for binding ids, in order.
    std::vector<Value> valuesOf(const ast::NodeArena &arena, const std::vector<ast::NodeId> &ids);

} // namespace pyinfer::infer
