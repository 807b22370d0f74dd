/***
 * Name: pyinfer::cli::detail argument classification
 * Purpose: Tell flags, option-like arguments and query names apart.
 * Theory of Operation:
 *   A query name is a module-level binding, so it must be spelled like an
 *   identifier: ASCII letters, digits and underscores, not starting with a
 *   digit. Arguments after `--` bypass this check.
 */
#include "cli/ParseArgsInternals.h"

#include <algorithm>
#include <cctype>

namespace pyinfer::cli::detail {

bool isFlag(const std::string_view arg, const std::string_view flag) { return arg == flag; }

bool isOptionLike(const std::string_view arg) { return arg.size() > 1 && arg.front() == '-'; }

bool isQueryName(const std::string_view arg) {
    if (arg.empty() || std::isdigit(static_cast<unsigned char>(arg.front())) != 0) { return false; }
    return std::all_of(arg.begin(), arg.end(), [](const char ch) {
        return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
    });
}

} // namespace pyinfer::cli::detail
