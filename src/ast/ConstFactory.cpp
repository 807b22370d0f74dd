/***
 * Name: pyinfer::ast::ConstFactory
 * Purpose: Constant transform tables and literal node creation.
 */
#include "ast/ConstFactory.h"
#include "ast/Literal.h"
#include "ast/NoneLiteral.h"

namespace pyinfer::ast {

const std::unordered_map<std::string, ConstTransform> &constNameTransforms() {
    static const std::unordered_map<std::string, ConstTransform> table{
        {"None", {NodeKind::NoneLiteral, std::monostate{}}},
        {"True", {NodeKind::BoolLiteral, true}},
        {"False", {NodeKind::BoolLiteral, false}},
    };
    return table;
}

const std::map<ConstValue, ConstTransform> &constValueTransforms() {
    static const std::map<ConstValue, ConstTransform> table{
        {ConstValue{std::monostate{}}, {NodeKind::NoneLiteral, std::monostate{}}},
        {ConstValue{true}, {NodeKind::BoolLiteral, true}},
        {ConstValue{false}, {NodeKind::BoolLiteral, false}},
    };
    return table;
}

namespace {
Node &makeLiteral(NodeArena &arena, const NodeId parent, const ConstValue &value) {
    const auto &transforms = constValueTransforms();
    if (const auto it = transforms.find(value); it != transforms.end()) {
        if (it->second.kind == NodeKind::NoneLiteral) { return arena.make<NoneLiteral>(parent); }
        return arena.make<BoolLiteral>(parent, std::get<bool>(it->second.value));
    }
    if (const auto *i = std::get_if<std::int64_t>(&value)) { return arena.make<IntLiteral>(parent, *i); }
    if (const auto *d = std::get_if<double>(&value)) { return arena.make<FloatLiteral>(parent, *d); }
    return arena.make<StringLiteral>(parent, std::get<std::string>(value));
}
} // namespace

Node &makeConst(NodeArena &arena, const NodeId parent, const ConstValue &value, const int line) {
    Node &node = makeLiteral(arena, parent, value);
    node.fromLine = line;
    node.toLine = line;
    return node;
}

Node *makeNamedConst(NodeArena &arena, const NodeId parent, const std::string &spelling, const int line) {
    const auto &names = constNameTransforms();
    const auto it = names.find(spelling);
    if (it == names.end()) { return nullptr; }
    return &makeConst(arena, parent, it->second.value, line);
}

std::optional<ConstValue> constValueOf(const Node &node) {
    switch (node.kind) {
        case NodeKind::NoneLiteral: return ConstValue{std::monostate{}};
        case NodeKind::BoolLiteral: return ConstValue{static_cast<const BoolLiteral &>(node).value};
        case NodeKind::IntLiteral: return ConstValue{static_cast<const IntLiteral &>(node).value};
        case NodeKind::FloatLiteral: return ConstValue{static_cast<const FloatLiteral &>(node).value};
        case NodeKind::StringLiteral: return ConstValue{static_cast<const StringLiteral &>(node).value};
        default: return std::nullopt;
    }
}

} // namespace pyinfer::ast
