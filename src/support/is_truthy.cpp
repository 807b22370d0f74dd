/***
 * Name: pyinfer::support::IsTruthy
 * Purpose: Interpret an environment flag value.
 * Inputs: text view
 * Outputs: true for 1/true/yes in any letter case
 */
#include "pyinfer/support/parse.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>

namespace pyinfer {
namespace support {

bool IsTruthy(std::string_view text) {
  TrimSpaces(text);
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  static constexpr std::array<std::string_view, 3> kTruthy{"1", "true", "yes"};
  return std::find(kTruthy.begin(), kTruthy.end(), lowered) != kTruthy.end();
}

}  // namespace support
}  // namespace pyinfer
