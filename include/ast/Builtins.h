/***
 * Name: pyinfer::ast::buildBuiltins
 * Purpose: Construct the `__builtin__` module every arena carries.
 * Outputs:
 *   - Ids of the module and of the canonical None/True/False constants.
 * Theory of Operation:
 *   The module is an ordinary tree built with the Builder: classes object,
 *   type, int, float, str, bool, NoneType, tuple, list and dict with a few
 *   methods each, the functions len, repr and isinstance, and one expression
 *   statement per canonical constant.
 */
#pragma once

#include "ast/NodeId.h"

namespace pyinfer::ast {

    class NodeArena;

    inline constexpr const char *kBuiltinsModule = "__builtin__";

    struct BuiltinsLayout {
        NodeId module{kNoNode};
        NodeId none{kNoNode};
        NodeId trueConst{kNoNode};
        NodeId falseConst{kNoNode};
    };

    BuiltinsLayout buildBuiltins(NodeArena &arena);

} // namespace pyinfer::ast
