/***
 * Name: pyinfer::exceptions::PyinferException
 * Purpose: Base class for all pyinfer exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in pyinfer must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace pyinfer {
namespace exceptions {

class PyinferException : public std::exception {
 public:
  virtual ~PyinferException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit PyinferException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace pyinfer
