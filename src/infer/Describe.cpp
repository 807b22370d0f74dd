/***
 * Name: pyinfer::infer pytype / describe
 * Purpose: Runtime type names and one-line descriptions of values.
 */
#include "ast/ConstFactory.h"
#include "ast/Lookup.h"
#include "ast/Nodes.h"
#include "infer/ClassModel.h"
#include "infer/Infer.h"
#include "infer/Proxies.h"
#include "pyinfer/exceptions/not_found_error.h"

#include <cstdint>
#include <sstream>
#include <string>
#include <variant>

namespace pyinfer::infer {

namespace {

std::string literalText(const ast::ConstValue &value) {
    if (std::holds_alternative<std::monostate>(value)) { return "None"; }
    if (const auto *b = std::get_if<bool>(&value)) { return *b ? "True" : "False"; }
    if (const auto *i = std::get_if<std::int64_t>(&value)) { return std::to_string(*i); }
    if (const auto *d = std::get_if<double>(&value)) {
        std::ostringstream os;
        os << *d;
        return os.str();
    }
    return "'" + std::get<std::string>(value) + "'";
}

std::string describeNode(const ast::Node &node) {
    if (const auto literal = ast::constValueOf(node)) { return literalText(*literal); }
    switch (node.kind) {
        case ast::NodeKind::Module:
            return "Module " + static_cast<const ast::Module &>(node).name;
        case ast::NodeKind::ClassDef:
            return "Class " + ast::qualifiedName(node);
        case ast::NodeKind::FunctionDef:
            return "Function " + ast::qualifiedName(node);
        default:
            return std::string(ast::to_string(node.kind)) + " at line " + std::to_string(node.sourceLine());
    }
}

} // namespace

std::string pytype(const Value &value) {
    switch (value.kind) {
        case ValueKind::Unknown:
            return "Unknown";
        case ValueKind::Instance:
            return Instance(static_cast<const ast::ClassDef &>(*value.node)).pytype();
        case ValueKind::InstanceMethod:
            return InstanceMethod(static_cast<const ast::FunctionDef &>(*value.node), *value.receiver).pytype();
        case ValueKind::Generator:
            return Generator(static_cast<const ast::FunctionDef &>(*value.node)).pytype();
        case ValueKind::Node:
            break;
    }
    switch (value.node->kind) {
        case ast::NodeKind::Module:
            return "__builtin__.module";
        case ast::NodeKind::ClassDef:
            return "__builtin__.type";
        case ast::NodeKind::FunctionDef:
        case ast::NodeKind::LambdaExpr:
            return "__builtin__.function";
        default:
            break;
    }
    if (const ast::ClassDef *cls = proxiedClass(*value.node)) { return ast::qualifiedName(*cls); }
    throw exceptions::NotFoundError(std::string(ast::to_string(value.node->kind)) + " has no runtime type");
}

std::string describe(const Value &value) {
    switch (value.kind) {
        case ValueKind::Unknown:
            return "Unknown";
        case ValueKind::Instance:
            return Instance(static_cast<const ast::ClassDef &>(*value.node)).describe();
        case ValueKind::InstanceMethod:
            return InstanceMethod(static_cast<const ast::FunctionDef &>(*value.node), *value.receiver).describe();
        case ValueKind::Generator:
            return Generator(static_cast<const ast::FunctionDef &>(*value.node)).describe();
        case ValueKind::Node:
            break;
    }
    return describeNode(*value.node);
}

} // namespace pyinfer::infer
