/***
 * Name: pyinfer::exceptions::InferenceError
 * Purpose: Exception for an inference query that produced no value at all.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PyinferException. Raised by InferStream::collect() on a failed stream.
 */
#pragma once

#include "pyinfer/exceptions/pyinfer_exception.h"
#include <string>
#include <utility>

namespace pyinfer {
namespace exceptions {

class InferenceError : public PyinferException {
 public:
  explicit InferenceError(std::string msg) noexcept : PyinferException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyinfer
