#pragma once

#include "cli/Options.h"

namespace pyinfer::cli {

    // Parse argv into Options. Returns false on fatal parse error.
    bool ParseArgs(int argc, char** argv, Options& out);

} // namespace pyinfer::cli
