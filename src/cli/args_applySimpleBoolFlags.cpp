#include "cli/ParseArgsInternals.h"

namespace pyinfer::cli::detail {
    /***
     * Name: pyinfer::cli::detail::applySimpleBoolFlags
     * Purpose: Handle flag-only boolean options and set outputs.
     */
    bool applySimpleBoolFlags(std::string_view arg, Options &out) {
        if (isFlag(arg, "-h") || isFlag(arg, "--help")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--trace")) {
            out.analysis.trace = true;
            return true;
        }
        if (isFlag(arg, "--metrics")) {
            out.analysis.metrics = true;
            return true;
        }
        if (isFlag(arg, "--metrics-json")) {
            out.analysis.metricsJson = true;
            return true;
        }
        return false;
    }
} // namespace pyinfer::cli::detail
