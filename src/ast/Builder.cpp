/***
 * Name: pyinfer::ast::Builder
 * Purpose: Factory implementations and binding registration.
 */
#include "ast/Builder.h"
#include "pyinfer/exceptions/precondition_error.h"

namespace pyinfer::ast {

namespace {

// Class owning `frame` when it is a method whose first parameter is `receiver`.
ClassDef *methodOwner(Node &frame, const std::string &receiver) {
    if (frame.kind != NodeKind::FunctionDef) { return nullptr; }
    auto &fn = static_cast<FunctionDef &>(frame);
    if (fn.params.empty() || fn.params.front() != receiver) { return nullptr; }
    Node *block = fn.parentNode();
    Node *owner = block == nullptr ? nullptr : block->parentNode();
    if (owner == nullptr || owner->kind != NodeKind::ClassDef) { return nullptr; }
    return static_cast<ClassDef *>(owner);
}

} // namespace

Module &Builder::module(const std::string &name, const bool package) {
    Module &mod = arena_.make<Module>(kNoNode, name);
    mod.package = package;
    arena_.registerModule(name, mod.id);
    return mod;
}

Block &Builder::block(Node &owner, const int line) { return make<Block>(owner, line); }

FunctionDef &Builder::function(Block &block, const std::string &name, std::vector<std::string> params,
                               const int line) {
    FunctionDef &fn = make<FunctionDef>(block, line, name);
    fn.params = std::move(params);
    block.setLocal(name, fn.id);
    for (const auto &param : fn.params) { fn.addLocal(param, fn.id); }
    return fn;
}

ClassDef &Builder::classDef(Block &block, const std::string &name, const int line) {
    ClassDef &cls = make<ClassDef>(block, line, name);
    block.setLocal(name, cls.id);
    return cls;
}

Name &Builder::decorator(Node &def, const std::string &name, const int line) {
    switch (def.kind) {
        case NodeKind::FunctionDef: ++static_cast<FunctionDef &>(def).decoratorCount; break;
        case NodeKind::ClassDef: ++static_cast<ClassDef &>(def).decoratorCount; break;
        default: throw exceptions::PreconditionError(std::string("decorator on ") + to_string(def.kind));
    }
    return make<Name>(def, line, name);
}

void Builder::markBase(ClassDef &cls) { ++cls.baseCount; }

void Builder::markDefault(Node &def) {
    switch (def.kind) {
        case NodeKind::FunctionDef: ++static_cast<FunctionDef &>(def).defaultCount; break;
        case NodeKind::LambdaExpr: ++static_cast<LambdaExpr &>(def).defaultCount; break;
        default: throw exceptions::PreconditionError(std::string("default on ") + to_string(def.kind));
    }
}

AssignStmt &Builder::assign(Block &block, const int line) { return make<AssignStmt>(block, line); }

AugAssignStmt &Builder::augAssign(Block &block, const std::string &op, const int line) {
    return make<AugAssignStmt>(block, line, op);
}

ExprStmt &Builder::exprStmt(Block &block, const int line) { return make<ExprStmt>(block, line); }

ReturnStmt &Builder::returnStmt(Block &block, const int line) { return make<ReturnStmt>(block, line); }

PassStmt &Builder::pass(Block &block, const int line) { return make<PassStmt>(block, line); }

BreakStmt &Builder::breakStmt(Block &block, const int line) { return make<BreakStmt>(block, line); }

ContinueStmt &Builder::continueStmt(Block &block, const int line) { return make<ContinueStmt>(block, line); }

RaiseStmt &Builder::raise(Block &block, const int line) { return make<RaiseStmt>(block, line); }

GlobalStmt &Builder::global(Block &block, std::vector<std::string> names, const int line) {
    GlobalStmt &stmt = make<GlobalStmt>(block, line, std::move(names));
    for (const auto &name : stmt.names) { stmt.setLocal(name, stmt.id); }
    return stmt;
}

Import &Builder::import(Block &block, std::vector<Alias> names, const int line) {
    Import &stmt = make<Import>(block, line, std::move(names));
    for (const auto &alias : stmt.names) { stmt.setLocal(boundName(alias), stmt.id); }
    return stmt;
}

ImportFrom &Builder::importFrom(Block &block, const std::string &module, std::vector<Alias> names, const int line) {
    ImportFrom &stmt = make<ImportFrom>(block, line, module, std::move(names));
    for (const auto &alias : stmt.names) {
        if (alias.name == "*") { continue; }
        stmt.setLocal(alias.asname.empty() ? alias.name : alias.asname, stmt.id);
    }
    return stmt;
}

IfStmt &Builder::ifStmt(Block &block, const int line) { return make<IfStmt>(block, line); }

WhileStmt &Builder::whileStmt(Block &block, const int line) { return make<WhileStmt>(block, line); }

ForStmt &Builder::forStmt(Block &block, const int line) { return make<ForStmt>(block, line); }

TryExcept &Builder::tryExcept(Block &block, const int line) { return make<TryExcept>(block, line); }

ExceptHandler &Builder::handler(TryExcept &stmt, const std::string &target, const int line) {
    ExceptHandler &handler = make<ExceptHandler>(stmt, line, target);
    if (!target.empty()) { stmt.setLocal(target, stmt.id); }
    return handler;
}

TryFinally &Builder::tryFinally(Block &block, const int line) { return make<TryFinally>(block, line); }

WithStmt &Builder::withStmt(Block &block, const int line) { return make<WithStmt>(block, line); }

Node &Builder::load(Node &parent, const std::string &spelling, const int line) {
    if (Node *constant = makeNamedConst(arena_, parent.id, spelling, line)) { return *constant; }
    return name(parent, spelling, line);
}

Name &Builder::name(Node &parent, const std::string &id, const int line) { return make<Name>(parent, line, id); }

AssignName &Builder::assignName(Node &parent, const std::string &id, const int line) {
    AssignName &target = make<AssignName>(parent, line, id);
    parent.setLocal(id, target.Node::id);
    return target;
}

AssignAttr &Builder::assignSelfAttr(Node &parent, const std::string &receiver, const std::string &attr,
                                    const int line) {
    AssignAttr &target = make<AssignAttr>(parent, line, attr);
    name(target, receiver, line);
    if (ClassDef *cls = methodOwner(target.frame(), receiver)) { cls->addInstanceAttr(attr, target.id); }
    return target;
}

Attribute &Builder::attribute(Node &parent, const std::string &attr, const int line) {
    return make<Attribute>(parent, line, attr);
}

Call &Builder::call(Node &parent, const int line) { return make<Call>(parent, line); }

void Builder::keyword(Call &call, const std::string &name) { call.keywordNames.push_back(name); }

Node &Builder::constant(Node &parent, const ConstValue &value, const int line) {
    return makeConst(arena_, parent.id, value, line);
}

TupleLiteral &Builder::tuple(Node &parent, const int line) { return make<TupleLiteral>(parent, line); }

ListLiteral &Builder::list(Node &parent, const int line) { return make<ListLiteral>(parent, line); }

DictLiteral &Builder::dict(Node &parent, const int line) { return make<DictLiteral>(parent, line); }

Binary &Builder::binary(Node &parent, const std::string &op, const int line) { return make<Binary>(parent, line, op); }

Unary &Builder::unary(Node &parent, const std::string &op, const int line) { return make<Unary>(parent, line, op); }

Compare &Builder::compare(Node &parent, std::vector<std::string> ops, const int line) {
    return make<Compare>(parent, line, std::move(ops));
}

Subscript &Builder::subscript(Node &parent, const int line) { return make<Subscript>(parent, line); }

IfExpr &Builder::ifExpr(Node &parent, const int line) { return make<IfExpr>(parent, line); }

YieldExpr &Builder::yield(Node &parent, const int line) { return make<YieldExpr>(parent, line); }

LambdaExpr &Builder::lambda(Node &parent, std::vector<std::string> params, const int line) {
    LambdaExpr &lam = make<LambdaExpr>(parent, line);
    lam.params = std::move(params);
    for (const auto &param : lam.params) { lam.addLocal(param, lam.id); }
    return lam;
}

GeneratorExpr &Builder::generator(Node &parent, const int line) { return make<GeneratorExpr>(parent, line); }

} // namespace pyinfer::ast
