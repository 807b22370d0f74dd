/***
 * Name: pyinfer::support::EnsureDirectory
 * Purpose: Create a directory and its missing parents.
 * Inputs:
 *   - path: directory to create
 * Outputs:
 *   - err: error message on failure
 * Theory of Operation: std::filesystem with error_code overloads; an existing
 *   directory is success, an existing non-directory is a failure.
 */
#include "pyinfer/support/fs.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace pyinfer {
namespace support {

bool EnsureDirectory(const std::string& path, std::string& err) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    err = "failed to create directory " + path + ": " + ec.message();
    return false;
  }
  if (!std::filesystem::is_directory(path, ec)) {
    err = "not a directory: " + path;
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace pyinfer
