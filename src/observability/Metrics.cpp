/***
 * Name: pyinfer::obs::Metrics (impl)
 * Purpose: Implement simple timing and formatting.
 */
#include "observability/Metrics.h"
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <map>
#include <optional>
#include <sstream>
#include <string>

namespace pyinfer::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
constexpr int kIndent4 = 4;
} // namespace

static std::string to_lower_copy(std::string s) {
  for (auto& c : s) { if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a'); }
  return s;
}

static void appendDurations(std::ostringstream& oss,
                            const std::map<std::string, uint64_t>& durations) {
  oss << "  \"durations_ms\": {";
  bool first = true;
  for (const auto& [key, val] : durations) {
    if (!first) { oss << ","; }
    first = false;
    const double millis = static_cast<double>(val) / kUsPerMs;
    oss << "\n    \"" << to_lower_copy(key) << "\": " << std::fixed << std::setprecision(3) << millis;
  }
  oss << "\n  }";
}

static void appendTree(std::ostringstream& oss, const std::optional<TreeGeometry>& geom) {
  if (!geom) { return; }
  oss << ",\n  \"ast\": { \"nodes\": " << geom->nodes
      << ", \"max_depth\": " << geom->maxDepth << " }";
}

static void appendKeyValueObject(std::ostringstream& oss, const char* title,
                                 const std::map<std::string, uint64_t>& values) {
  if (values.empty()) { return; }
  const std::string pad(kIndent4, ' ');
  oss << ",\n  \"" << title << "\": {";
  bool first = true;
  for (const auto& [key, val] : values) {
    if (!first) { oss << ","; }
    first = false;
    oss << "\n" << pad << "\"" << key << "\": " << val;
  }
  oss << "\n  }";
}

void Metrics::start(const std::string& name) {
  active_[name] = Clock::now();
}

void Metrics::stop(const std::string& name) {
  auto iter = active_.find(name);
  if (iter == active_.end()) { return; }
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - iter->second).count();
  durations_us_[name] += static_cast<uint64_t>(microseconds);
  active_.erase(iter);
}

uint64_t Metrics::durationUs(const std::string& name) const {
  auto iter = durations_us_.find(name);
  return iter == durations_us_.end() ? 0 : iter->second;
}

uint64_t Metrics::counter(const std::string& key) const {
  auto iter = counters_.find(key);
  return iter == counters_.end() ? 0 : iter->second;
}

std::string Metrics::summaryText() const {
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [key, val] : durations_us_) {
    const double millis = static_cast<double>(val) / kUsPerMs;
    oss << "  " << key << ": " << std::fixed << std::setprecision(3) << millis << " ms\n";
  }
  if (geom_) {
    oss << "  AST: nodes=" << geom_->nodes << ", max_depth=" << geom_->maxDepth << "\n";
  }
  for (const auto& [key, val] : counters_) { oss << "  " << key << " = " << val << "\n"; }
  for (const auto& [key, val] : gauges_) { oss << "  " << key << " ~ " << val << "\n"; }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  std::ostringstream oss;
  oss << "{\n";
  appendDurations(oss, durations_us_);
  appendTree(oss, geom_);
  appendKeyValueObject(oss, "counters", counters_);
  appendKeyValueObject(oss, "gauges", gauges_);
  oss << "\n}\n";
  return oss.str();
}

} // namespace pyinfer::obs
