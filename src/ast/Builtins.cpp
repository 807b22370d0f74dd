/***
 * Name: pyinfer::ast::buildBuiltins
 * Purpose: Populate the `__builtin__` module of a fresh arena.
 * Theory of Operation:
 *   Written with the Builder in source order, one line per construct, so the
 *   module looks exactly like a parsed stub file to the rest of the engine.
 */
#include "ast/Builder.h"
#include "ast/Builtins.h"

#include <optional>
#include <string>
#include <vector>

namespace pyinfer::ast {

namespace {

class StubWriter {
public:
    explicit StubWriter(NodeArena &arena) : b_(arena), module_(b_.module(kBuiltinsModule)), body_(b_.block(module_, 1)) {}

    Module &module() { return module_; }

    // Returns the class body.
    Block &cls(const std::string &name, const std::string &base) {
        ClassDef &def = b_.classDef(body_, name, next());
        if (!base.empty()) {
            b_.name(def, base, line_);
            b_.markBase(def);
        }
        Block &classBody = b_.block(def, next());
        b_.pass(classBody, line_);
        return classBody;
    }

    // Method or function whose body returns `result`; no result means a bare body.
    void function(Block &where, const std::string &name, std::vector<std::string> params,
                  const std::optional<ConstValue> &result) {
        FunctionDef &fn = b_.function(where, name, std::move(params), next());
        Block &body = b_.block(fn, next());
        if (!result) {
            b_.pass(body, line_);
            return;
        }
        ReturnStmt &ret = b_.returnStmt(body, line_);
        b_.constant(ret, *result, line_);
    }

    void listMethod(Block &classBody, const std::string &name) {
        FunctionDef &fn = b_.function(classBody, name, {"self"}, next());
        Block &body = b_.block(fn, next());
        ReturnStmt &ret = b_.returnStmt(body, line_);
        b_.list(ret, line_);
    }

    void topLevel(const std::string &name, std::vector<std::string> params, const ConstValue &result) {
        function(body_, name, std::move(params), result);
    }

    NodeId constant(const ConstValue &value) {
        ExprStmt &stmt = b_.exprStmt(body_, next());
        return b_.constant(stmt, value, line_).id;
    }

private:
    int next() { return ++line_; }

    Builder b_;
    Module &module_;
    Block &body_;
    int line_{1};
};

} // namespace

BuiltinsLayout buildBuiltins(NodeArena &arena) {
    StubWriter stub(arena);
    const std::string empty;

    Block &object = stub.cls("object", "");
    stub.function(object, "__init__", {"self"}, std::nullopt);
    stub.function(object, "__repr__", {"self"}, ConstValue{empty});
    stub.function(object, "__str__", {"self"}, ConstValue{empty});

    Block &type = stub.cls("type", "object");
    stub.listMethod(type, "mro");

    Block &integer = stub.cls("int", "object");
    stub.function(integer, "bit_length", {"self"}, ConstValue{std::int64_t{0}});
    stub.function(integer, "__add__", {"self", "other"}, ConstValue{std::int64_t{0}});

    Block &real = stub.cls("float", "object");
    stub.function(real, "is_integer", {"self"}, ConstValue{true});

    Block &str = stub.cls("str", "object");
    stub.function(str, "upper", {"self"}, ConstValue{empty});
    stub.function(str, "join", {"self", "iterable"}, ConstValue{empty});

    stub.cls("bool", "int");
    stub.cls("NoneType", "object");

    Block &tuple = stub.cls("tuple", "object");
    stub.function(tuple, "count", {"self", "value"}, ConstValue{std::int64_t{0}});

    Block &list = stub.cls("list", "object");
    stub.function(list, "append", {"self", "item"}, std::nullopt);

    Block &dict = stub.cls("dict", "object");
    stub.listMethod(dict, "keys");

    stub.topLevel("len", {"obj"}, ConstValue{std::int64_t{0}});
    stub.topLevel("repr", {"obj"}, ConstValue{empty});
    stub.topLevel("isinstance", {"obj", "cls"}, ConstValue{true});

    BuiltinsLayout layout;
    layout.module = stub.module().id;
    layout.none = stub.constant(ConstValue{std::monostate{}});
    layout.trueConst = stub.constant(ConstValue{true});
    layout.falseConst = stub.constant(ConstValue{false});
    return layout;
}

} // namespace pyinfer::ast
