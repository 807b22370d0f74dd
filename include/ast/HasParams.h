/**
 * @file
 * @brief AST utility declarations (HasParams mixin).
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pyinfer::ast {

// Parameter names in declaration order. Default values are the trailing
// `defaultCount` parameters, matching the order of the owner's default children.
struct HasParams {
    std::vector<std::string> params;
    std::size_t defaultCount{0};

    std::optional<std::size_t> paramIndex(const std::string &param) const {
        for (std::size_t i = 0; i < params.size(); ++i) {
            if (params[i] == param) { return i; }
        }
        return std::nullopt;
    }
};

}
