/***
 * Name: pyinfer::support (parse)
 * Purpose: Parse settings text taken from the environment without throwing.
 * Inputs: Text as found in an environment variable; optional error out
 * Outputs: Parsed values; returns true on success
 * Theory of Operation: Surrounding ASCII whitespace is ignored; anything else
 *   that is not part of the value is an error.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace pyinfer {
namespace support {

/*** TrimSpaces: Remove leading and trailing ASCII whitespace from view. */
void TrimSpaces(std::string_view& text);

/*** ParseCountStrict: Parse a non-negative base-10 count; no sign allowed. */
bool ParseCountStrict(std::string_view text, std::size_t& out_val, std::string* err = nullptr);

/*** IsTruthy: 1/true/yes, case-insensitive. Everything else (including empty) is false. */
bool IsTruthy(std::string_view text);

}  // namespace support
}  // namespace pyinfer
