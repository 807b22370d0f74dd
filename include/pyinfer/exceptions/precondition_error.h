/***
 * Name: pyinfer::exceptions::PreconditionError
 * Purpose: Exception for a violated tree invariant (missing statement ancestor, foreign node).
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PyinferException.
 */
#pragma once

#include "pyinfer/exceptions/pyinfer_exception.h"
#include <string>
#include <utility>

namespace pyinfer {
namespace exceptions {

class PreconditionError : public PyinferException {
 public:
  explicit PreconditionError(std::string msg) noexcept : PyinferException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyinfer
