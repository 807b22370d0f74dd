/***
 * Name: pyinfer::exceptions::UnresolvableName
 * Purpose: Exception for a name that cannot be resolved syntactically at all.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PyinferException. Treated like NotFoundError by multi-candidate resolution.
 */
#pragma once

#include "pyinfer/exceptions/pyinfer_exception.h"
#include <string>
#include <utility>

namespace pyinfer {
namespace exceptions {

class UnresolvableName : public PyinferException {
 public:
  explicit UnresolvableName(std::string msg) noexcept : PyinferException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyinfer
