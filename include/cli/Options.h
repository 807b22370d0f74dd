#pragma once

#include <string>
#include <vector>

#include "config/Options.h"

namespace pyinfer::cli {

    struct Options {
        bool showHelp{false};
        // Starts from the environment; flags override it.
        config::Options analysis{};
        std::vector<std::string> names{}; // names to query; empty queries all
    };

} // namespace pyinfer::cli
