/***
 * Name: pyinfer::infer::kinds::import / importFrom / global / tryExcept
 * Purpose: Binding statements that resolve through the name being looked up.
 * Theory of Operation:
 *   These statements bind several names at once, so they need the lookup
 *   name carried by the context to know which one is asked for. Modules are
 *   found in the arena's registry by dotted name; relative imports are
 *   resolved against the importing module's package.
 */
#include "ast/NodeArena.h"
#include "infer/Infer.h"
#include "infer/KindInference.h"
#include "infer/Sources.h"
#include "pyinfer/exceptions/inference_error.h"
#include "pyinfer/exceptions/not_found_error.h"

#include <string>
#include <vector>

namespace pyinfer::infer {

namespace {

const std::string &requireName(const ast::Node &node, const InferenceContext &ctx) {
    if (!ctx.lookupName) {
        throw exceptions::InferenceError(std::string(ast::to_string(node.kind)) + " at line " +
                                         std::to_string(node.sourceLine()) + " inferred without a name");
    }
    return *ctx.lookupName;
}

InferStream moduleNamed(const ast::Node &importer, const std::string &name) {
    const ast::Module *module = importer.arena().findModule(name);
    if (module == nullptr) { throw exceptions::InferenceError("no module named " + name); }
    return InferStream::single(Value::of(*module));
}

std::string absoluteModule(const ast::ImportFrom &node) {
    if (node.level == 0) { return node.module; }
    const auto &importer = static_cast<const ast::Module &>(node.root());
    std::vector<std::string> parts;
    std::size_t start = 0;
    for (std::size_t dot = importer.name.find('.'); dot != std::string::npos; dot = importer.name.find('.', start)) {
        parts.push_back(importer.name.substr(start, dot - start));
        start = dot + 1;
    }
    parts.push_back(importer.name.substr(start));
    const std::size_t drop = static_cast<std::size_t>(node.level) - (importer.package ? 1 : 0);
    if (drop >= parts.size()) {
        throw exceptions::InferenceError("relative import beyond top-level package in " + importer.name);
    }
    parts.resize(parts.size() - drop);
    std::string base;
    for (const auto &part : parts) { base += base.empty() ? part : "." + part; }
    return node.module.empty() ? base : base + "." + node.module;
}

InferStream exceptionInstances(const Value &type, const InferenceContext &ctx) {
    if (type.isNode(ast::NodeKind::ClassDef)) {
        return InferStream::single(Value::instance(static_cast<const ast::ClassDef &>(*type.node)));
    }
    if (!type.isNode(ast::NodeKind::TupleLiteral)) { return InferStream::single(Value::unknown()); }
    std::vector<Value> elements;
    for (std::size_t i = 0; i < type.node->childCount(); ++i) { elements.push_back(Value::of(type.node->child(i))); }
    return flatMap(
        InferStream::values(std::move(elements)),
        [ctx](const Value &element) {
            return flatMap(infer(element, ctx.clone()),
                           [ctx](const Value &cls) { return exceptionInstances(cls, ctx); }, InnerFailure::Skip);
        },
        InnerFailure::Skip);
}

} // namespace

namespace kinds {

InferStream import(const ast::Import &node, const InferenceContext &ctx) {
    return moduleNamed(node, node.realName(requireName(node, ctx)));
}

InferStream importFrom(const ast::ImportFrom &node, const InferenceContext &ctx) {
    const std::string real = node.realName(requireName(node, ctx));
    const std::string moduleName = absoluteModule(node);
    const ast::Module *module = node.arena().findModule(moduleName);
    if (module == nullptr) { throw exceptions::InferenceError("no module named " + moduleName); }
    const auto *bindings = module->locals(real);
    if (bindings == nullptr) { throw exceptions::InferenceError(moduleName + " has no attribute " + real); }
    InferenceContext named = ctx;
    named.lookupName = real;
    return inferStatements(valuesOf(node.arena(), *bindings), named, module);
}

InferStream global(const ast::GlobalStmt &node, const InferenceContext &ctx) {
    const std::string &name = requireName(node, ctx);
    const auto &module = static_cast<const ast::Module &>(node.root());
    const auto *bindings = module.locals(name);
    if (bindings == nullptr) { throw exceptions::InferenceError("no module-level binding for global " + name); }
    return inferStatements(valuesOf(node.arena(), *bindings), ctx, &module);
}

InferStream tryExcept(const ast::TryExcept &node, const InferenceContext &ctx) {
    const std::string &name = requireName(node, ctx);
    std::vector<Value> handlers;
    for (const ast::ExceptHandler *handler : node.handlers()) {
        if (handler->target == name) { handlers.push_back(Value::of(*handler)); }
    }
    return flatMap(
        InferStream::values(std::move(handlers)),
        [ctx](const Value &value) {
            const auto &handler = static_cast<const ast::ExceptHandler &>(*value.node);
            if (handler.type() == nullptr) { return InferStream::single(Value::unknown()); }
            return flatMap(infer(*handler.type(), ctx.clone()),
                           [ctx](const Value &type) { return exceptionInstances(type, ctx); }, InnerFailure::Skip);
        },
        InnerFailure::Skip);
}

} // namespace kinds

InferStream inferNameModule(const ast::Import &stmt, const std::string &name) {
    return deferred([&stmt, name] { return moduleNamed(stmt, name); });
}

} // namespace pyinfer::infer
