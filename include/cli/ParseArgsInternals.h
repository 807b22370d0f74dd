/**
 * @file
 * @brief Declarations for infer_dump argument parsing helpers.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "cli/Options.h"

namespace pyinfer::cli::detail {

/** Return true if `arg` exactly matches the `flag`. */
bool isFlag(std::string_view arg, std::string_view flag);

/** Collect remaining argv items as query names starting at index. */
void collectRemainingAsNames(std::size_t startIndex, int argc, char** argv, Options& out);

/** True for `-x`/`--xyz` style arguments; a lone `-` is not option-like. */
bool isOptionLike(std::string_view arg);

/** True if `arg` is spelled like a Python identifier. */
bool isQueryName(std::string_view arg);

/** Handle boolean, flag-only options like -h, --trace, --metrics. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options (log-path, limit). Sets err on a bad value. */
bool applyPrefixedOptions(std::string_view arg, Options& out, std::string& err);

} // namespace pyinfer::cli::detail
