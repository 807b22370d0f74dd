/***
 * Name: pyinfer::support::Trace
 * Purpose: Env-gated diagnostic output for the inference engine.
 */
#include "pyinfer/support/trace.h"
#include "pyinfer/support/parse.h"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <string>

namespace pyinfer {
namespace support {

namespace {

bool initialTraceSetting() {
  const char* value = std::getenv("PYINFER_TRACE");
  return value != nullptr && IsTruthy(value);
}

std::atomic<bool> g_trace{initialTraceSetting()}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

}  // namespace

bool TraceEnabled() { return g_trace.load(std::memory_order_relaxed); }

void SetTraceEnabled(bool enabled) { g_trace.store(enabled, std::memory_order_relaxed); }

void Trace(const std::string& message) {
  if (!TraceEnabled()) {
    return;
  }
  std::cerr << "pyinfer: " << message << '\n';
}

}  // namespace support
}  // namespace pyinfer
