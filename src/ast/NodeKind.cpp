/***
 * Name: pyinfer::ast::to_string(NodeKind)
 * Purpose: Stable display names for node kinds (logs, tree dumps, tests).
 */
#include "ast/FunctionDef.h"
#include "ast/KindSet.h"
#include "ast/NodeKind.h"

namespace pyinfer::ast {

const char *to_string(const NodeKind kind) {
    switch (kind) {
        case NodeKind::Module: return "Module";
        case NodeKind::Block: return "Block";
        case NodeKind::FunctionDef: return "FunctionDef";
        case NodeKind::ClassDef: return "ClassDef";
        case NodeKind::LambdaExpr: return "LambdaExpr";
        case NodeKind::GeneratorExpr: return "GeneratorExpr";
        case NodeKind::AssignStmt: return "AssignStmt";
        case NodeKind::AugAssignStmt: return "AugAssignStmt";
        case NodeKind::ExprStmt: return "ExprStmt";
        case NodeKind::ReturnStmt: return "ReturnStmt";
        case NodeKind::PassStmt: return "PassStmt";
        case NodeKind::BreakStmt: return "BreakStmt";
        case NodeKind::ContinueStmt: return "ContinueStmt";
        case NodeKind::RaiseStmt: return "RaiseStmt";
        case NodeKind::GlobalStmt: return "GlobalStmt";
        case NodeKind::Import: return "Import";
        case NodeKind::ImportFrom: return "ImportFrom";
        case NodeKind::IfStmt: return "IfStmt";
        case NodeKind::WhileStmt: return "WhileStmt";
        case NodeKind::ForStmt: return "ForStmt";
        case NodeKind::TryExcept: return "TryExcept";
        case NodeKind::ExceptHandler: return "ExceptHandler";
        case NodeKind::TryFinally: return "TryFinally";
        case NodeKind::WithStmt: return "WithStmt";
        case NodeKind::Name: return "Name";
        case NodeKind::AssignName: return "AssignName";
        case NodeKind::AssignAttr: return "AssignAttr";
        case NodeKind::Attribute: return "Attribute";
        case NodeKind::Call: return "Call";
        case NodeKind::BinaryExpr: return "BinaryExpr";
        case NodeKind::UnaryExpr: return "UnaryExpr";
        case NodeKind::Compare: return "Compare";
        case NodeKind::Subscript: return "Subscript";
        case NodeKind::IfExpr: return "IfExpr";
        case NodeKind::YieldExpr: return "YieldExpr";
        case NodeKind::TupleLiteral: return "TupleLiteral";
        case NodeKind::ListLiteral: return "ListLiteral";
        case NodeKind::DictLiteral: return "DictLiteral";
        case NodeKind::IntLiteral: return "IntLiteral";
        case NodeKind::FloatLiteral: return "FloatLiteral";
        case NodeKind::StringLiteral: return "StringLiteral";
        case NodeKind::BoolLiteral: return "BoolLiteral";
        case NodeKind::NoneLiteral: return "NoneLiteral";
    }
    return "unknown";
}

const char *to_string(const FunctionType type) {
    switch (type) {
        case FunctionType::Function: return "function";
        case FunctionType::Method: return "method";
        case FunctionType::ClassMethod: return "classmethod";
        case FunctionType::StaticMethod: return "staticmethod";
    }
    return "function";
}

namespace {
template <typename Pred>
KindSet kindsWhere(Pred pred) {
    KindSet set;
    for (std::size_t i = 0; i < kNodeKindCount; ++i) {
        const auto kind = static_cast<NodeKind>(i);
        if (pred(kind)) { set.add(kind); }
    }
    return set;
}
} // namespace

KindSet KindSet::statements() { return kindsWhere(isStatementKind); }
KindSet KindSet::frames() { return kindsWhere(isFrameKind); }
KindSet KindSet::scopes() { return kindsWhere(isScopeKind); }

} // namespace pyinfer::ast
