/***
 * Name: pyinfer::support::WriteFile
 * Purpose: Replace the contents of a file with a string.
 * Inputs:
 *   - path: filesystem path to write
 *   - data: content to write
 * Outputs:
 *   - err: error message on failure
 * Theory of Operation: Writes `<path>.part` with std::ofstream, checks .good()
 *   after open and after flush, then renames it over `path`. Readers see
 *   either the previous contents or the new ones.
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "pyinfer/support/fs.h"

#include <filesystem>
#include <fstream>
#include <ios>
#include <string>
#include <system_error>

namespace pyinfer {
namespace support {

bool WriteFile(const std::string& path, const std::string& data, std::string& err) {
  const std::string partial = path + ".part";
  {
    std::ofstream file_stream(partial, std::ios::binary | std::ios::trunc);
    if (!file_stream.good()) {
      err = "failed to open file for write: " + path;
      return false;
    }
    file_stream << data;
    file_stream.flush();
    if (!file_stream.good()) {
      err = "failed to write file: " + path;
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(partial, path, ec);
  if (ec) {
    err = "failed to replace file " + path + ": " + ec.message();
    std::filesystem::remove(partial, ec);
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace pyinfer
