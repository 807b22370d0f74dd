#pragma once

#include <cstdint>
#include <limits>

namespace pyinfer::ast {
    // Index of a node inside its NodeArena.
    using NodeId = std::uint32_t;

    inline constexpr NodeId kNoNode = std::numeric_limits<NodeId>::max();

    // Inclusive (start, end) line span returned by block range queries.
    struct LineRange {
        int start{0};
        int end{0};
        bool operator==(const LineRange &other) const = default;
    };
} // namespace pyinfer::ast
