/***
 * Name: infer_dump
 * Purpose: Build a small sample program, dump its tree and infer its names.
 * Inputs:
 *   - argv (see --help) on top of the PYINFER_* environment.
 * Outputs:
 *   - Tree dump and one result block per queried name on stdout; metrics on request.
 */
#include "analyzer/Analyzer.h"
#include "ast/Builder.h"
#include "cli/Options.h"
#include "cli/ParseArgs.h"
#include "cli/Usage.h"
#include "config/Options.h"
#include "observability/TreePrinter.h"
#include "pyinfer/exceptions/pyinfer_exception.h"

#include <cstdint>
#include <iostream>
#include <string>

namespace {

using namespace pyinfer;

// x = 1
// y = x
// class Point:
//     def __init__(self, px):
//         self.px = px
//     def norm(self):
//         return self.px
// p = Point(3)
// n = p.norm()
// def count():
//     yield 1
// g = count()
// a = b
// b = a
ast::Module &buildSample(ast::Builder &b) {
  ast::Module &mod = b.module("sample");
  ast::Block &body = b.block(mod, 1);

  auto &x = b.assign(body, 1);
  b.assignName(x, "x", 1);
  b.constant(x, ast::ConstValue{std::int64_t{1}}, 1);

  auto &y = b.assign(body, 2);
  b.assignName(y, "y", 2);
  b.name(y, "x", 2);

  auto &point = b.classDef(body, "Point", 3);
  auto &pointBody = b.block(point, 4);
  auto &init = b.function(pointBody, "__init__", {"self", "px"}, 4);
  auto &initBody = b.block(init, 5);
  auto &store = b.assign(initBody, 5);
  b.assignSelfAttr(store, "self", "px", 5);
  b.name(store, "px", 5);
  auto &norm = b.function(pointBody, "norm", {"self"}, 6);
  auto &normBody = b.block(norm, 7);
  auto &ret = b.returnStmt(normBody, 7);
  auto &selfPx = b.attribute(ret, "px", 7);
  b.name(selfPx, "self", 7);

  auto &p = b.assign(body, 8);
  b.assignName(p, "p", 8);
  auto &make = b.call(p, 8);
  b.name(make, "Point", 8);
  b.constant(make, ast::ConstValue{std::int64_t{3}}, 8);

  auto &n = b.assign(body, 9);
  b.assignName(n, "n", 9);
  auto &callNorm = b.call(n, 9);
  auto &normAttr = b.attribute(callNorm, "norm", 9);
  b.name(normAttr, "p", 9);

  auto &count = b.function(body, "count", {}, 10);
  auto &countBody = b.block(count, 11);
  auto &yieldStmt = b.exprStmt(countBody, 11);
  auto &yieldExpr = b.yield(yieldStmt, 11);
  b.constant(yieldExpr, ast::ConstValue{std::int64_t{1}}, 11);

  auto &g = b.assign(body, 12);
  b.assignName(g, "g", 12);
  auto &callCount = b.call(g, 12);
  b.name(callCount, "count", 12);

  auto &a = b.assign(body, 13);
  b.assignName(a, "a", 13);
  b.name(a, "b", 13);
  auto &bb = b.assign(body, 14);
  b.assignName(bb, "b", 14);
  b.name(bb, "a", 14);
  return mod;
}

} // namespace

int main(int argc, char** argv) {
  cli::Options opts;
  try {
    opts.analysis = config::fromEnvironment();
  } catch (const exceptions::PyinferException& ex) {
    std::cerr << "infer_dump: " << ex.what() << "\n";
    return 2;
  }
  if (!cli::ParseArgs(argc, argv, opts)) {
    std::cerr << cli::Usage();
    return 2;
  }
  if (opts.showHelp) {
    std::cout << cli::Usage();
    return 0;
  }

  ast::NodeArena arena;
  ast::Builder builder(arena);
  const ast::Module& mod = buildSample(builder);

  obs::TreePrinter printer; // NOLINT(misc-const-correctness)
  std::cout << "== Tree ==\n" << printer.print(mod);

  try {
    Analyzer analyzer(arena, opts.analysis);
    analyzer.recordTree(mod);
    const auto& names = opts.names.empty() ? mod.localNames() : opts.names;
    std::cout << "== Inference ==\n";
    for (const auto& name : names) {
      const QueryReport report = analyzer.inferName(mod, name);
      std::cout << name << ": " << infer::to_string(report.outcome);
      if (!report.message.empty()) { std::cout << " (" << report.message << ")"; }
      std::cout << "\n";
      for (const auto& text : report.descriptions()) { std::cout << "  " << text << "\n"; }
      if (report.truncated) { std::cout << "  ...\n"; }
    }
    if (opts.analysis.metrics) { std::cout << analyzer.metrics().summaryText(); }
    if (opts.analysis.metricsJson) { std::cout << analyzer.metrics().summaryJson(); }
  } catch (const exceptions::PyinferException& ex) {
    std::cerr << "infer_dump: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
