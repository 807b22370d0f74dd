/***
 * Name: pyinfer::obs::Metrics
 * Purpose: Collect per-phase timings, tree geometry and inference counters.
 * Inputs:
 *   - Calls to start/stop timers for named phases.
 *   - Tree summary values (nodes, depth) recorded by the analyzer.
 *   - Counters and gauges bumped while queries run.
 * Outputs:
 *   - Human-readable text and JSON summaries.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Stores a map from
 *   phase names to microseconds; repeated start/stop pairs accumulate.
 *   Ordered maps keep the summaries stable from run to run. Formatting is
 *   performed on demand.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace pyinfer::obs {

struct TreeGeometry {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
};

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);
  // Accumulated microseconds for a phase; 0 when it never stopped.
  uint64_t durationUs(const std::string& name) const;

  void setTreeGeometry(TreeGeometry g) { geom_ = g; }
  const std::optional<TreeGeometry>& treeGeometry() const { return geom_; }

  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  void setGauge(const std::string& key, uint64_t value) { gauges_[key] = value; }
  uint64_t counter(const std::string& key) const;
  const std::map<std::string, uint64_t>& counters() const { return counters_; }
  const std::map<std::string, uint64_t>& gauges() const { return gauges_; }

  std::string summaryText() const;
  std::string summaryJson() const;

 private:
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::optional<TreeGeometry> geom_{};
  std::map<std::string, uint64_t> counters_{};
  std::map<std::string, uint64_t> gauges_{};
};

} // namespace pyinfer::obs
