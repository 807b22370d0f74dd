/**
 * @file
 * @brief Umbrella header for every node kind.
 */
#pragma once

#include "ast/AssignName.h"
#include "ast/AssignStmt.h"
#include "ast/Attribute.h"
#include "ast/AugAssignStmt.h"
#include "ast/Binary.h"
#include "ast/Block.h"
#include "ast/Call.h"
#include "ast/ClassDef.h"
#include "ast/DictLiteral.h"
#include "ast/ExceptHandler.h"
#include "ast/ExprStmt.h"
#include "ast/ForStmt.h"
#include "ast/FunctionDef.h"
#include "ast/GeneratorExpr.h"
#include "ast/GlobalStmt.h"
#include "ast/IfExpr.h"
#include "ast/IfStmt.h"
#include "ast/Import.h"
#include "ast/ImportFrom.h"
#include "ast/LambdaExpr.h"
#include "ast/Literal.h"
#include "ast/Module.h"
#include "ast/Name.h"
#include "ast/NodeArena.h"
#include "ast/NoneLiteral.h"
#include "ast/ReturnStmt.h"
#include "ast/SimpleStmts.h"
#include "ast/Subscript.h"
#include "ast/TryExcept.h"
#include "ast/TryFinally.h"
#include "ast/TupleLiteral.h"
#include "ast/WhileStmt.h"
#include "ast/WithStmt.h"
#include "ast/YieldExpr.h"
