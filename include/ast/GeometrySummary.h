/**
 * @file
 * @brief Tree geometry summary declarations.
 */
#pragma once

#include <cstdint>
#include "ast/Node.h"


namespace pyinfer::ast {
    // Compute a simple geometry summary for the tree under `root`
    struct GeometrySummary {
        uint64_t nodes{0};
        uint64_t maxDepth{0};
    };

    GeometrySummary ComputeGeometry(const Node& root);

} // namespace pyinfer::ast
