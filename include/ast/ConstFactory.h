/***
 * Name: pyinfer::ast::ConstFactory
 * Purpose: Turn constant spellings and runtime values into literal nodes.
 * Inputs:
 *   - A name spelling (`None`, `True`, `False`) or a runtime constant value.
 * Outputs:
 *   - A literal node created under the given parent.
 * Theory of Operation:
 *   Two process-wide immutable tables drive the transform: one keyed by the
 *   spelling a parser sees, one keyed by runtime value. None and booleans map
 *   to the dedicated NoneLiteral/BoolLiteral kinds, so attribute lookups on
 *   them go through the proxy model instead of generic name resolution. Any
 *   other value gets the generic literal kind for its type.
 */
#pragma once

#include "ast/NodeArena.h"
#include "ast/NodeKind.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace pyinfer::ast {

    // std::monostate stands for None.
    using ConstValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

    struct ConstTransform {
        NodeKind kind;
        ConstValue value;
    };

    const std::unordered_map<std::string, ConstTransform> &constNameTransforms();
    const std::map<ConstValue, ConstTransform> &constValueTransforms();

    Node &makeConst(NodeArena &arena, NodeId parent, const ConstValue &value, int line);

    // nullptr when `spelling` is not a transformed constant name.
    Node *makeNamedConst(NodeArena &arena, NodeId parent, const std::string &spelling, int line);

    // Value carried by a literal node; std::nullopt for non-literals.
    std::optional<ConstValue> constValueOf(const Node &node);

} // namespace pyinfer::ast
