/***
 * Name: pyinfer::ast::Builder
 * Purpose: Programmatic tree construction in source order.
 * Inputs:
 *   - Calls describing nodes in the order a parser would produce them.
 * Outputs:
 *   - Nodes in the arena with parent links, ordered children and lines;
 *     local-binding and instance-attribute tables populated.
 * Theory of Operation:
 *   Every factory creates its node as the next child of `parent`, so the
 *   layouts documented on each node kind come out right as long as callers
 *   create children in source order. Factories for binding constructs also
 *   register the binding: assignment targets and definitions in their
 *   enclosing frame, parameters on their function, imports, globals and
 *   exception handler names on their statement, and `self.attr` targets on
 *   the class of the enclosing method.
 */
#pragma once

#include "ast/ConstFactory.h"
#include "ast/Nodes.h"
#include <string>
#include <vector>

namespace pyinfer::ast {

    class Builder {
    public:
        explicit Builder(NodeArena &arena) : arena_(arena) {}

        NodeArena &arena() { return arena_; }

        // Registers the module under `name` in the arena.
        Module &module(const std::string &name, bool package = false);
        // Creates the body Block of a module, def, class, branch or handler.
        Block &block(Node &owner, int line);

        // definitions
        FunctionDef &function(Block &block, const std::string &name, std::vector<std::string> params, int line);
        ClassDef &classDef(Block &block, const std::string &name, int line);
        // Name decorator on a def or class (create before bases/defaults/body).
        Name &decorator(Node &def, const std::string &name, int line);
        // Marks the last-created child of `def` as a base (class) or default (function/lambda).
        void markBase(ClassDef &cls);
        void markDefault(Node &def);

        // statements
        AssignStmt &assign(Block &block, int line);
        AugAssignStmt &augAssign(Block &block, const std::string &op, int line);
        ExprStmt &exprStmt(Block &block, int line);
        ReturnStmt &returnStmt(Block &block, int line);
        PassStmt &pass(Block &block, int line);
        BreakStmt &breakStmt(Block &block, int line);
        ContinueStmt &continueStmt(Block &block, int line);
        RaiseStmt &raise(Block &block, int line);
        GlobalStmt &global(Block &block, std::vector<std::string> names, int line);
        Import &import(Block &block, std::vector<Alias> names, int line);
        ImportFrom &importFrom(Block &block, const std::string &module, std::vector<Alias> names, int line);
        IfStmt &ifStmt(Block &block, int line);
        WhileStmt &whileStmt(Block &block, int line);
        ForStmt &forStmt(Block &block, int line);
        TryExcept &tryExcept(Block &block, int line);
        ExceptHandler &handler(TryExcept &stmt, const std::string &target, int line);
        TryFinally &tryFinally(Block &block, int line);
        WithStmt &withStmt(Block &block, int line);

        // expressions
        // Load of `spelling`; None/True/False become constant nodes.
        Node &load(Node &parent, const std::string &spelling, int line);
        Name &name(Node &parent, const std::string &id, int line);
        AssignName &assignName(Node &parent, const std::string &id, int line);
        // `<self>.attr` store target; records the instance attribute when the
        // receiver is the first parameter of a method.
        AssignAttr &assignSelfAttr(Node &parent, const std::string &receiver, const std::string &attr, int line);
        Attribute &attribute(Node &parent, const std::string &attr, int line);
        Call &call(Node &parent, int line);
        // Records a keyword name; create the value next, after positional args.
        void keyword(Call &call, const std::string &name);
        Node &constant(Node &parent, const ConstValue &value, int line);
        TupleLiteral &tuple(Node &parent, int line);
        ListLiteral &list(Node &parent, int line);
        DictLiteral &dict(Node &parent, int line);
        Binary &binary(Node &parent, const std::string &op, int line);
        Unary &unary(Node &parent, const std::string &op, int line);
        Compare &compare(Node &parent, std::vector<std::string> ops, int line);
        Subscript &subscript(Node &parent, int line);
        IfExpr &ifExpr(Node &parent, int line);
        YieldExpr &yield(Node &parent, int line);
        LambdaExpr &lambda(Node &parent, std::vector<std::string> params, int line);
        GeneratorExpr &generator(Node &parent, int line);

    private:
        template <typename T, typename... Args>
        T &make(Node &parent, int line, Args &&...args) {
            T &node = arena_.make<T>(parent.id, std::forward<Args>(args)...);
            node.fromLine = line;
            node.toLine = line;
            return node;
        }

        NodeArena &arena_;
    };

} // namespace pyinfer::ast
