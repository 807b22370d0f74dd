/***
 * Name: pyinfer::infer::kinds::ifExpr / subscript / boolResult
 * Purpose: Expression kinds with a fixed, shallow rule.
 * Theory of Operation:
 *   Literal keys and indexes compare the way Python hashes them: bools act
 *   as the ints 0 and 1, and ints equal floats of the same value. Strings
 *   and None only match themselves.
 */
#include "ast/ConstFactory.h"
#include "ast/NodeArena.h"
#include "infer/Infer.h"
#include "infer/KindInference.h"
#include "infer/Sources.h"

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace pyinfer::infer::kinds {

namespace {

std::optional<std::int64_t> integralOf(const ast::ConstValue &value) {
    if (const auto *i = std::get_if<std::int64_t>(&value)) { return *i; }
    if (const auto *b = std::get_if<bool>(&value)) { return *b ? 1 : 0; }
    return std::nullopt;
}

std::optional<double> numberOf(const ast::ConstValue &value) {
    if (const auto *d = std::get_if<double>(&value)) { return *d; }
    if (const auto i = integralOf(value)) { return static_cast<double>(*i); }
    return std::nullopt;
}

bool sameKey(const ast::ConstValue &lhs, const ast::ConstValue &rhs) {
    const auto li = integralOf(lhs);
    const auto ri = integralOf(rhs);
    if (li && ri) { return *li == *ri; }
    const auto ln = numberOf(lhs);
    const auto rn = numberOf(rhs);
    if (ln && rn) { return *ln == *rn; }
    return lhs == rhs;
}

InferStream indexInto(const Value &container, const ast::Node &index, const InferenceContext &ctx) {
    if (!container.isNode()) { return InferStream::single(Value::unknown()); }
    const ast::Node &node = *container.node;
    const auto key = ast::constValueOf(index);
    if (!key) { return InferStream::single(Value::unknown()); }
    if (node.kind == ast::NodeKind::TupleLiteral || node.kind == ast::NodeKind::ListLiteral) {
        const auto position = integralOf(*key);
        if (!position) { return InferStream::single(Value::unknown()); }
        const auto size = static_cast<std::int64_t>(node.childCount());
        const std::int64_t at = *position < 0 ? *position + size : *position;
        if (at < 0 || at >= size) { return InferStream::single(Value::unknown()); }
        return infer(node.child(static_cast<std::size_t>(at)), ctx.clone());
    }
    if (node.kind == ast::NodeKind::DictLiteral) {
        const auto &dict = static_cast<const ast::DictLiteral &>(node);
        // Later keys win, as in a dict display.
        for (std::size_t i = dict.itemCount(); i > 0; --i) {
            const auto candidate = ast::constValueOf(dict.key(i - 1));
            if (candidate && sameKey(*candidate, *key)) { return infer(dict.value(i - 1), ctx.clone()); }
        }
    }
    return InferStream::single(Value::unknown());
}

} // namespace

InferStream ifExpr(const ast::IfExpr &node, const InferenceContext &ctx) {
    std::vector<Value> branches{Value::of(node.body()), Value::of(node.orelse())};
    return flatMap(InferStream::values(std::move(branches)),
                   [ctx](const Value &branch) { return infer(branch, ctx.clone()); }, InnerFailure::Skip,
                   "no branch of the conditional expression could be inferred");
}

InferStream subscript(const ast::Subscript &node, const InferenceContext &ctx) {
    return flatMap(infer(node.value(), ctx.clone()),
                   [&node, ctx](const Value &container) { return indexInto(container, node.index(), ctx); },
                   InnerFailure::Propagate);
}

InferStream boolResult(const ast::Node &node) {
    const ast::ClassDef *cls = node.arena().builtinClass("bool");
    if (cls == nullptr) { return InferStream::single(Value::unknown()); }
    return InferStream::single(Value::instance(*cls));
}

} // namespace pyinfer::infer::kinds
