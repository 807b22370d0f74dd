/***
 * Name: pyinfer::exceptions::ConfigError
 * Purpose: Exception for configuration and option errors.
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

class ConfigError : public PyinferException {
 public:
  explicit ConfigError(std::string msg) noexcept : PyinferException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyinfer
