/***
 * Name: pyinfer::support (trace)
 * Purpose: Opt-in diagnostic lines on stderr.
 * Inputs: Messages from the inference engine
 * Outputs: "pyinfer: <message>" lines on stderr while tracing is enabled
 * Theory of Operation: Tracing starts enabled when PYINFER_TRACE is truthy
 *   and can be switched at runtime. Output is best effort; failures to write
 *   are ignored.
 */
#pragma once

#include <string>

namespace pyinfer {
namespace support {

bool TraceEnabled();
void SetTraceEnabled(bool enabled);

/*** Trace: Write one line when tracing is enabled. */
void Trace(const std::string& message);

}  // namespace support
}  // namespace pyinfer
