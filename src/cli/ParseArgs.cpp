#include "cli/ParseArgs.h"
#include "cli/Options.h"
#include "cli/ParseArgsInternals.h"
#include <iostream>
#include <string>

namespace pyinfer::cli {
    /***
     * Name: pyinfer::cli::ParseArgs
     * Purpose: Minimal argument parser for infer_dump.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        for (int i = 1; i < argc; ++i) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            const std::string_view arg{argv[i]};
            if (detail::isFlag(arg, "--")) {
                detail::collectRemainingAsNames(i + 1, argc, argv, out);
                break;
            }
            if (detail::applySimpleBoolFlags(arg, out)) { continue; }
            std::string err;
            if (detail::applyPrefixedOptions(arg, out, err)) {
                if (!err.empty()) {
                    std::cerr << "infer_dump: " << err << "\n";
                    return false;
                }
                continue;
            }

            if (detail::isOptionLike(arg)) {
                std::cerr << "infer_dump: unknown option '" << arg << "'\n";
                return false;
            }
            if (!detail::isQueryName(arg)) {
                std::cerr << "infer_dump: '" << arg << "' is not a name (use -- to pass it anyway)\n";
                return false;
            }
            out.names.emplace_back(std::string(arg));
        }
        return true;
    }
} // namespace pyinfer::cli
