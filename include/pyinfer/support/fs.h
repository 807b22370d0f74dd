/***
 * Name: pyinfer::support (fs)
 * Purpose: Minimal file IO helpers for the log files written by the analyzer.
 * Inputs: Paths and string buffers
 * Outputs: Files and directories on disk
 * Theory of Operation: Thin wrappers over fstream and std::filesystem that
 *   report failures through a bool and an error string instead of throwing.
 */
#pragma once

#include <string>

namespace pyinfer {
namespace support {

/*** WriteFile: Replace the contents of path with data. Return true on success. */
bool WriteFile(const std::string& path, const std::string& data, std::string& err);

/*** EnsureDirectory: Create path and missing parents. Return true if it exists afterwards. */
bool EnsureDirectory(const std::string& path, std::string& err);

}  // namespace support
}  // namespace pyinfer
