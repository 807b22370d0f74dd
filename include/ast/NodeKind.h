/**
 * @file
 * @brief Closed set of node kinds and their fixed classifications.
 */
#pragma once

#include <cstddef>

namespace pyinfer::ast {
    enum class NodeKind {
        Module,
        Block,
        FunctionDef,
        ClassDef,
        LambdaExpr,
        GeneratorExpr,
        // statements
        AssignStmt,
        AugAssignStmt,
        ExprStmt,
        ReturnStmt,
        PassStmt,
        BreakStmt,
        ContinueStmt,
        RaiseStmt,
        GlobalStmt,
        Import,
        ImportFrom,
        IfStmt,
        WhileStmt,
        ForStmt,
        TryExcept,
        ExceptHandler,
        TryFinally,
        WithStmt,
        // expressions
        Name,
        AssignName,
        AssignAttr,
        Attribute,
        Call,
        BinaryExpr,
        UnaryExpr,
        Compare,
        Subscript,
        IfExpr,
        YieldExpr,
        TupleLiteral,
        ListLiteral,
        DictLiteral,
        IntLiteral,
        FloatLiteral,
        StringLiteral,
        BoolLiteral,
        NoneLiteral
    };

    // Keep in sync with the last enumerator above.
    inline constexpr std::size_t kNodeKindCount = static_cast<std::size_t>(NodeKind::NoneLiteral) + 1;

    const char *to_string(NodeKind kind);

    constexpr bool isStatementKind(const NodeKind kind) {
        switch (kind) {
            case NodeKind::FunctionDef:
            case NodeKind::ClassDef:
            case NodeKind::AssignStmt:
            case NodeKind::AugAssignStmt:
            case NodeKind::ExprStmt:
            case NodeKind::ReturnStmt:
            case NodeKind::PassStmt:
            case NodeKind::BreakStmt:
            case NodeKind::ContinueStmt:
            case NodeKind::RaiseStmt:
            case NodeKind::GlobalStmt:
            case NodeKind::Import:
            case NodeKind::ImportFrom:
            case NodeKind::IfStmt:
            case NodeKind::WhileStmt:
            case NodeKind::ForStmt:
            case NodeKind::TryExcept:
            case NodeKind::TryFinally:
            case NodeKind::WithStmt:
                return true;
            default:
                return false;
        }
    }

    // Frames own the tables that name-binding targets resolve to.
    constexpr bool isFrameKind(const NodeKind kind) {
        return kind == NodeKind::Module || kind == NodeKind::FunctionDef || kind == NodeKind::ClassDef;
    }

    constexpr bool isScopeKind(const NodeKind kind) {
        return isFrameKind(kind) || kind == NodeKind::LambdaExpr || kind == NodeKind::GeneratorExpr;
    }

    constexpr bool isLiteralKind(const NodeKind kind) {
        switch (kind) {
            case NodeKind::IntLiteral:
            case NodeKind::FloatLiteral:
            case NodeKind::StringLiteral:
            case NodeKind::BoolLiteral:
            case NodeKind::NoneLiteral:
                return true;
            default:
                return false;
        }
    }
} // namespace pyinfer::ast
