/***
 * Name: pyinfer::support::TrimSpaces
 * Purpose: Remove leading and trailing ASCII whitespace from a string_view.
 * Inputs: text (by ref)
 * Outputs: text with prefix and suffix removed
 */
#include "pyinfer/support/parse.h"

#include <cctype>
#include <cstddef>
#include <string_view>

namespace pyinfer {
namespace support {

void TrimSpaces(std::string_view& text) {
  std::size_t index = 0;
  while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
    ++index;
  }
  text.remove_prefix(index);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
}

}  // namespace support
}  // namespace pyinfer
