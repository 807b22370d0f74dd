/***
 * Name: pyinfer::Analyzer (impl)
 * Purpose: Query orchestration, metrics and log files.
 */
#include "analyzer/Analyzer.h"
#include "ast/GeometrySummary.h"
#include "ast/Lookup.h"
#include "infer/Infer.h"
#include "infer/InferenceContext.h"
#include "infer/Sources.h"
#include "observability/TreePrinter.h"
#include "pyinfer/support/fs.h"
#include "pyinfer/support/trace.h"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace pyinfer {

namespace {

std::string timestampPrefix() {
  auto tsNow = std::chrono::system_clock::now();
  const std::time_t tsTime = std::chrono::system_clock::to_time_t(tsNow);
  std::tm tmBuf{};
  localtime_r(&tsTime, &tmBuf);
  std::ostringstream timestampStream;
  timestampStream << std::put_time(&tmBuf, "%Y%m%d-%H%M%S");
  return timestampStream.str() + "-";
}

} // namespace

std::vector<std::string> QueryReport::descriptions() const {
  std::vector<std::string> out;
  out.reserve(values.size());
  for (const auto& value : values) { out.push_back(infer::describe(value)); }
  return out;
}

Analyzer::Analyzer(ast::NodeArena& arena) : Analyzer(arena, config::fromEnvironment()) {}

Analyzer::Analyzer(ast::NodeArena& arena, config::Options options)
    : arena_(arena), options_(std::move(options)) {
  if (options_.trace) { support::SetTraceEnabled(true); }
  if (options_.logFiles && !options_.logPath.empty()) {
    std::string err;
    if (support::EnsureDirectory(options_.logPath, err)) {
      logFiles_ = true;
      logPrefix_ = options_.logPath + "/" + timestampPrefix();
    } else {
      std::cerr << "pyinfer: " << err << "; file logs disabled\n";
    }
  }
}

std::string Analyzer::treeLogPath() const { return logFiles_ ? logPrefix_ + "tree.log" : std::string(); }

std::string Analyzer::inferLogPath() const { return logFiles_ ? logPrefix_ + "infer.log" : std::string(); }

void Analyzer::recordTree(const ast::Module& module) {
  const auto geom = ast::ComputeGeometry(module);
  metrics_.setTreeGeometry({geom.nodes, geom.maxDepth});
  metrics_.setGauge("ast.arena_nodes", static_cast<uint64_t>(arena_.size()));
  if (!logFiles_) { return; }
  obs::TreePrinter printer; // NOLINT(misc-const-correctness)
  treeLog_ += "== " + module.name + " ==\n" + printer.print(module);
  writeLog(treeLogPath(), treeLog_);
}

QueryReport Analyzer::infer(const ast::Node& node) {
  const infer::InferenceContext ctx(&node);
  std::string label = obs::nodeLabel(node) + " at line " + std::to_string(node.sourceLine());
  return run(std::move(label), infer::infer(node, ctx), ctx);
}

QueryReport Analyzer::inferName(const ast::Module& module, const std::string& name) {
  infer::InferenceContext ctx(&module);
  const auto found = ast::lookup(module, name);
  if (!found.found()) {
    return run(name, infer::InferStream::failed(infer::Failure::unresolvable("name '" + name + "' is not defined")),
               ctx);
  }
  ctx.lookupName = name;
  return run(name, infer::inferStatements(infer::valuesOf(arena_, found.bindings), ctx, found.scope), ctx);
}

QueryReport Analyzer::run(std::string label, infer::InferStream stream, const infer::InferenceContext& ctx) {
  QueryReport report;
  report.query = std::move(label);
  const std::size_t cyclesBefore = ctx.path().cyclesBroken();
  metrics_.start("Infer");
  while (auto value = stream.next()) {
    if (options_.resultLimit != 0 && report.values.size() == options_.resultLimit) {
      report.truncated = true;
      break;
    }
    report.values.push_back(*value);
  }
  metrics_.stop("Infer");
  report.outcome = report.truncated ? infer::Outcome::Values : stream.outcome();
  if (report.outcome == infer::Outcome::Failed) { report.message = stream.failure().message; }
  metrics_.incCounter("infer.cycles", static_cast<uint64_t>(ctx.path().cyclesBroken() - cyclesBefore));
  record(report);
  return report;
}

void Analyzer::record(const QueryReport& report) {
  metrics_.incCounter("infer.queries");
  metrics_.incCounter("infer.values", static_cast<uint64_t>(report.values.size()));
  std::size_t unknown = 0;
  for (const auto& value : report.values) {
    if (value.isUnknown()) { ++unknown; }
  }
  metrics_.incCounter("infer.unknown", static_cast<uint64_t>(unknown));
  if (report.outcome == infer::Outcome::Failed) { metrics_.incCounter("infer.failed"); }

  std::ostringstream line;
  line << report.query << ": " << infer::to_string(report.outcome);
  if (!report.message.empty()) { line << " (" << report.message << ")"; }
  for (const auto& text : report.descriptions()) { line << "\n  " << text; }
  if (report.truncated) { line << "\n  ... truncated at " << options_.resultLimit; }
  support::Trace("query " + report.query + ": " + infer::to_string(report.outcome) + ", " +
                 std::to_string(report.values.size()) + " value(s)");
  if (!logFiles_) { return; }
  inferLog_ += line.str() + "\n";
  writeLog(inferLogPath(), inferLog_);
}

void Analyzer::writeLog(const std::string& path, const std::string& text) {
  std::string err;
  if (!support::WriteFile(path, text, err)) {
    std::cerr << "pyinfer: " << err << "; file logs disabled\n";
    logFiles_ = false;
  }
}

} // namespace pyinfer
