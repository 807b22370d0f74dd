/***
 * Name: pyinfer::exceptions::PyinferException::PyinferException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "pyinfer/exceptions/pyinfer_exception.h"

#include <utility>

namespace pyinfer {
namespace exceptions {

PyinferException::PyinferException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace pyinfer
