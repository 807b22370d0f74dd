#include "cli/ParseArgsInternals.h"
#include "pyinfer/support/parse.h"

#include <string>

namespace pyinfer::cli::detail {
    /***
     * Name: pyinfer::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options like log-path/limit.
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out, std::string &err) {
        if (constexpr std::string_view logPathPrefix{"--log-path="}; arg.rfind(logPathPrefix, 0) == 0) {
            out.analysis.logPath = std::string(arg.substr(logPathPrefix.size()));
            out.analysis.logFiles = !out.analysis.logPath.empty();
            return true;
        }

        if (constexpr std::string_view limitPrefix{"--limit="}; arg.rfind(limitPrefix, 0) == 0) {
            std::size_t limit = 0;
            std::string why;
            if (!support::ParseCountStrict(arg.substr(limitPrefix.size()), limit, &why)) {
                err = "--limit: " + why;
                return true;
            }
            out.analysis.resultLimit = limit;
            return true;
        }
        return false;
    }
} // namespace pyinfer::cli::detail
