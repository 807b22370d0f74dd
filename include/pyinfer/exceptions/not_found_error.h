/***
 * Name: pyinfer::exceptions::NotFoundError
 * Purpose: Exception for a name or attribute with no binding reachable from a scope.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PyinferException. Recoverable: multi-candidate resolution skips the candidate.
 */
#pragma once

#include "pyinfer/exceptions/pyinfer_exception.h"
#include <string>
#include <utility>

namespace pyinfer {
namespace exceptions {

class NotFoundError : public PyinferException {
 public:
  explicit NotFoundError(std::string msg) noexcept : PyinferException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyinfer
