/***
 * Name: pyinfer::support::ParseCountStrict
 * Purpose: Parse a non-negative base-10 count without throwing; fail on extra tokens.
 * Inputs:
 *   - text: string view of the setting
 * Outputs:
 *   - out_val: parsed count on success
 *   - err: optional error message on failure
 * Theory of Operation: Manual digit parsing with range check and whitespace trim.
 */
#include "pyinfer/support/parse.h"

#include <cctype>
#include <cstddef>
#include <limits>
#include <string>
#include <string_view>

namespace pyinfer::support {

auto ParseCountStrict(std::string_view text, std::size_t& out_val, std::string* err) -> bool {
  TrimSpaces(text);
  if (text.empty()) {
    if (err != nullptr) {
      *err = "empty count";
    }
    return false;
  }
  constexpr std::size_t kBase10 = 10;
  std::size_t value = 0;
  for (const char ch : text) {
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
      if (err != nullptr) {
        *err = "invalid character in count: '" + std::string(1, ch) + "'";
      }
      return false;
    }
    const auto digit = static_cast<std::size_t>(ch - '0');
    if (value > (std::numeric_limits<std::size_t>::max() - digit) / kBase10) {
      if (err != nullptr) {
        *err = "count overflow";
      }
      return false;
    }
    value = (value * kBase10) + digit;
  }
  out_val = value;
  return true;
}

}  // namespace pyinfer::support
