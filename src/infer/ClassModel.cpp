/***
 * Name: pyinfer::infer class model (impl)
 * Purpose: Ancestors, class attribute lookup and instance attribute lookup.
 */
#include "infer/ClassModel.h"
#include "ast/Lookup.h"
#include "ast/NodeArena.h"
#include "infer/Infer.h"
#include "infer/Sources.h"
#include "pyinfer/exceptions/not_found_error.h"
#include "pyinfer/support/trace.h"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace pyinfer::infer {

namespace {

bool contains(const std::vector<const ast::ClassDef *> &classes, const ast::ClassDef *cls) {
    return std::find(classes.begin(), classes.end(), cls) != classes.end();
}

// Classes whose ancestors are being computed on this thread. A base expression
// that reaches back into one of them (`class A(A.x)`) sees no ancestors there.
thread_local std::vector<const ast::ClassDef *> g_inProgress; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

class InProgress {
public:
    explicit InProgress(const ast::ClassDef &cls) { g_inProgress.push_back(&cls); }
    ~InProgress() { g_inProgress.pop_back(); }
    InProgress(const InProgress &) = delete;
    InProgress &operator=(const InProgress &) = delete;
};

void collectAncestors(const ast::ClassDef &cls, const ast::ClassDef &start, std::vector<const ast::ClassDef *> &out) {
    for (const ast::NodeId id : cls.bases()) {
        const ast::Node &base = cls.arena().at(id);
        InferStream stream = infer(base, InferenceContext(&base));
        while (const auto value = stream.next()) {
            if (!value->isNode(ast::NodeKind::ClassDef)) { continue; }
            const auto *found = static_cast<const ast::ClassDef *>(value->node);
            if (found == &start || contains(out, found)) { continue; }
            out.push_back(found);
            collectAncestors(*found, start, out);
        }
    }
}

std::optional<std::vector<Value>> findClassAttr(const ast::ClassDef &cls, const std::string &name) {
    if (name == "__name__" || name == "__module__") {
        if (const ast::ClassDef *str = cls.arena().builtinClass("str")) { return std::vector<Value>{Value::instance(*str)}; }
    }
    if (const auto *own = cls.locals(name)) { return valuesOf(cls.arena(), *own); }
    for (const ast::ClassDef *ancestor : ancestors(cls)) {
        if (const auto *inherited = ancestor->locals(name)) { return valuesOf(cls.arena(), *inherited); }
    }
    return std::nullopt;
}

bool hasClassAttr(const ast::ClassDef &cls, const std::string &name) { return findClassAttr(cls, name).has_value(); }

} // namespace

std::vector<const ast::ClassDef *> ancestors(const ast::ClassDef &cls) {
    std::vector<const ast::ClassDef *> out;
    if (contains(g_inProgress, &cls)) {
        support::Trace("cycle broken in bases of class " + cls.name);
        return out;
    }
    {
        const InProgress guard(cls);
        collectAncestors(cls, cls, out);
    }
    const ast::ClassDef *object = cls.arena().builtinClass("object");
    if (object != nullptr && object != &cls && !contains(out, object)) { out.push_back(object); }
    return out;
}

std::vector<Value> classGetAttr(const ast::ClassDef &cls, const std::string &name) {
    auto found = findClassAttr(cls, name);
    if (!found) { throw exceptions::NotFoundError(name); }
    return std::move(*found);
}

InferStream classInferredGetAttr(const ast::ClassDef &cls, const std::string &name, const InferenceContext &ctx) {
    auto found = findClassAttr(cls, name);
    if (!found) {
        if (!isDunder(name) && hasClassAttr(cls, "__getattr__")) { return InferStream::single(Value::unknown()); }
        throw exceptions::NotFoundError(name);
    }
    return mapValues(inferStatements(std::move(*found), ctx, &cls), [](const Value &value) {
        if (value.kind == ValueKind::Instance && hasClassAttr(static_cast<const ast::ClassDef &>(*value.node), "__get__")) {
            return Value::unknown();
        }
        return value;
    });
}

std::vector<Value> instanceAttr(const ast::ClassDef &cls, const std::string &name) {
    std::vector<Value> out;
    if (const auto *own = cls.instanceAttrs().locals(name)) { out = valuesOf(cls.arena(), *own); }
    for (const ast::ClassDef *ancestor : ancestors(cls)) {
        if (const auto *inherited = ancestor->instanceAttrs().locals(name)) {
            const auto values = valuesOf(cls.arena(), *inherited);
            out.insert(out.end(), values.begin(), values.end());
        }
    }
    if (out.empty()) { throw exceptions::NotFoundError(name); }
    return out;
}

const ast::ClassDef *proxiedClass(const ast::Node &node) {
    const char *name = nullptr;
    switch (node.kind) {
        case ast::NodeKind::IntLiteral: name = "int"; break;
        case ast::NodeKind::FloatLiteral: name = "float"; break;
        case ast::NodeKind::StringLiteral: name = "str"; break;
        case ast::NodeKind::BoolLiteral: name = "bool"; break;
        case ast::NodeKind::NoneLiteral: name = "NoneType"; break;
        case ast::NodeKind::TupleLiteral: name = "tuple"; break;
        case ast::NodeKind::ListLiteral: name = "list"; break;
        case ast::NodeKind::DictLiteral: name = "dict"; break;
        default: return nullptr;
    }
    return node.arena().builtinClass(name);
}

bool isDunder(const std::string &name) {
    return name.size() > 4 && name.starts_with("__") && name.ends_with("__");
}

} // namespace pyinfer::infer
