#include "cli/ParseArgsInternals.h"

namespace pyinfer::cli::detail {

/***
 * Name: pyinfer::cli::detail::collectRemainingAsNames
 * Purpose: Gather remaining argv entries as positional query names.
 */
void collectRemainingAsNames(std::size_t startIndex, int argc, char** argv, Options& out) {
    for (int j = static_cast<int>(startIndex); j < argc; ++j) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.names.emplace_back(argv[j]);
    }
}

} // namespace pyinfer::cli::detail
