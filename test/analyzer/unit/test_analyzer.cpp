/***
 * Name: test_analyzer
 * Purpose: Query reports, result limit, metrics counters and log files.
 */
#include <gtest/gtest.h>
#include "analyzer/Analyzer.h"
#include "ast/Builder.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace pyinfer;

namespace {

// x = 1
// x = 2
// x = 3
// x
struct ThreeBindings {
  ast::NodeArena arena;
  ast::Builder b{arena};
  ast::Module& mod = b.module("m");
  ast::Name* use{nullptr};

  ThreeBindings() {
    auto& body = b.block(mod, 1);
    for (int line = 1; line <= 3; ++line) {
      auto& assign = b.assign(body, line);
      b.assignName(assign, "x", line);
      b.constant(assign, ast::ConstValue{std::int64_t{line}}, line);
    }
    auto& stmt = b.exprStmt(body, 4);
    use = &b.name(stmt, "x", 4);
  }
};

std::string slurp(const std::string& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::filesystem::path scratchDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / ("pyinfer_analyzer_" + name);
  std::filesystem::remove_all(dir);
  return dir;
}

} // namespace

TEST(Analyzer, InferNameReportsEveryValue) {
  ThreeBindings p;
  Analyzer analyzer(p.arena, config::Options{});
  const auto report = analyzer.inferName(p.mod, "x");
  EXPECT_EQ(report.query, "x");
  EXPECT_TRUE(report.succeeded());
  EXPECT_FALSE(report.truncated);
  EXPECT_EQ(report.descriptions(), (std::vector<std::string>{"1", "2", "3"}));
  EXPECT_EQ(analyzer.metrics().counter("infer.queries"), 1u);
  EXPECT_EQ(analyzer.metrics().counter("infer.values"), 3u);
  EXPECT_EQ(analyzer.metrics().counter("infer.failed"), 0u);
}

TEST(Analyzer, InferLabelsQueryWithNodeAndLine) {
  ThreeBindings p;
  Analyzer analyzer(p.arena, config::Options{});
  const auto report = analyzer.infer(*p.use);
  EXPECT_EQ(report.query, "Name x at line 4");
  EXPECT_EQ(report.values.size(), 3u);
}

TEST(Analyzer, ResultLimitTruncates) {
  ThreeBindings p;
  config::Options options;
  options.resultLimit = 2;
  Analyzer analyzer(p.arena, options);
  const auto report = analyzer.infer(*p.use);
  EXPECT_EQ(report.values.size(), 2u);
  EXPECT_TRUE(report.truncated);
  EXPECT_EQ(report.outcome, infer::Outcome::Values);

  options.resultLimit = 3;
  Analyzer exact(p.arena, options);
  EXPECT_FALSE(exact.infer(*p.use).truncated);
}

TEST(Analyzer, UndefinedNameIsAFailedReport) {
  ThreeBindings p;
  Analyzer analyzer(p.arena, config::Options{});
  const auto report = analyzer.inferName(p.mod, "nope");
  EXPECT_EQ(report.outcome, infer::Outcome::Failed);
  EXPECT_EQ(report.message, "name 'nope' is not defined");
  EXPECT_TRUE(report.values.empty());
  EXPECT_EQ(analyzer.metrics().counter("infer.failed"), 1u);
  EXPECT_EQ(analyzer.metrics().counter("infer.queries"), 1u);
}

// a = b
// b = a
// a
TEST(Analyzer, CountsUnknownValuesAndCycles) {
  ast::NodeArena arena;
  ast::Builder b(arena);
  auto& body = b.block(b.module("m"), 1);
  auto& first = b.assign(body, 1);
  b.assignName(first, "a", 1);
  b.name(first, "b", 1);
  auto& second = b.assign(body, 2);
  b.assignName(second, "b", 2);
  b.name(second, "a", 2);
  auto& stmt = b.exprStmt(body, 3);
  auto& a = b.name(stmt, "a", 3);

  Analyzer analyzer(arena, config::Options{});
  const auto report = analyzer.infer(a);
  EXPECT_EQ(report.descriptions(), (std::vector<std::string>{"Unknown"}));
  EXPECT_EQ(analyzer.metrics().counter("infer.unknown"), 1u);
  EXPECT_EQ(analyzer.metrics().counter("infer.cycles"), 1u);
}

TEST(Analyzer, RecordTreeSetsGeometry) {
  ThreeBindings p;
  Analyzer analyzer(p.arena, config::Options{});
  analyzer.recordTree(p.mod);
  ASSERT_TRUE(analyzer.metrics().treeGeometry().has_value());
  // Module, Block, three assignments with two children each, ExprStmt, Name.
  EXPECT_EQ(analyzer.metrics().treeGeometry()->nodes, 13u);
  EXPECT_EQ(analyzer.metrics().gauges().at("ast.arena_nodes"), p.arena.size());
}

TEST(Analyzer, LogFilesOffByDefault) {
  ThreeBindings p;
  Analyzer analyzer(p.arena, config::Options{});
  EXPECT_FALSE(analyzer.logFilesEnabled());
  EXPECT_TRUE(analyzer.treeLogPath().empty());
  EXPECT_TRUE(analyzer.inferLogPath().empty());
}

TEST(Analyzer, WritesTreeAndInferLogs) {
  const auto dir = scratchDir("logs");
  ThreeBindings p;
  config::Options options;
  options.logFiles = true;
  options.logPath = dir.string();
  Analyzer analyzer(p.arena, options);
  ASSERT_TRUE(analyzer.logFilesEnabled());

  analyzer.recordTree(p.mod);
  (void)analyzer.inferName(p.mod, "x");
  (void)analyzer.inferName(p.mod, "nope");

  const auto tree = slurp(analyzer.treeLogPath());
  EXPECT_EQ(tree.rfind("== m ==\nModule name=m\n", 0), 0u);
  EXPECT_NE(tree.find("AssignName x"), std::string::npos);

  const auto log = slurp(analyzer.inferLogPath());
  EXPECT_NE(log.find("x: values\n  1\n  2\n  3\n"), std::string::npos);
  EXPECT_NE(log.find("nope: failed (name 'nope' is not defined)\n"), std::string::npos);
  std::filesystem::remove_all(dir);
}

TEST(Analyzer, UnusableLogPathDisablesLogs) {
  const auto dir = scratchDir("blocked");
  std::filesystem::create_directories(dir);
  const auto file = dir / "occupied";
  std::ofstream(file) << "x";

  ThreeBindings p;
  config::Options options;
  options.logFiles = true;
  options.logPath = file.string();
  Analyzer analyzer(p.arena, options);
  EXPECT_FALSE(analyzer.logFilesEnabled());
  EXPECT_TRUE(analyzer.inferName(p.mod, "x").succeeded());
  std::filesystem::remove_all(dir);
}
